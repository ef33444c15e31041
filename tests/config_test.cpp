#include <remotesync-cpp/config.hpp>

#include <remotesync-cpp/error.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace remotesync_cpp;
using json = nlohmann::json;

namespace {

auto expect_invalid(const json& j) -> void {
    try {
        (void)config_from_json(j);
        FAIL() << "expected invalid_config for " << j.dump();
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_config);
    }
}

}  // namespace

TEST(SyncConfig, defaults) {
    const auto config = SyncConfig{};
    EXPECT_EQ(config.slot_count, 1024u);
    EXPECT_EQ(config.seed, 0u);
    EXPECT_EQ(config.concurrency, 8u);
    EXPECT_FALSE(config.logging);
    EXPECT_EQ(config.log_level, LogLevel::info);
}

TEST(SyncConfig, empty_object_keeps_defaults) {
    EXPECT_EQ(config_from_json(json::object()), SyncConfig{});
}

TEST(SyncConfig, reads_every_field) {
    auto j = json{
        {"slot_count", 4096},
        {"seed", 12345},
        {"concurrency", 2},
        {"logging", true},
        {"log_level", "debug"},
    };
    auto config = config_from_json(j);
    EXPECT_EQ(config.slot_count, 4096u);
    EXPECT_EQ(config.seed, 12345u);
    EXPECT_EQ(config.concurrency, 2u);
    EXPECT_TRUE(config.logging);
    EXPECT_EQ(config.log_level, LogLevel::debug);
}

TEST(SyncConfig, json_round_trip) {
    auto config = SyncConfig{.slot_count = 77, .seed = 9, .concurrency = 3,
                             .logging = true, .log_level = LogLevel::warning};
    auto j = json(config);
    EXPECT_EQ(j["log_level"], "warning");
    EXPECT_EQ(config_from_json(j), config);
}

TEST(SyncConfig, rejects_bad_values) {
    expect_invalid(json{{"slot_count", 0}});
    expect_invalid(json{{"concurrency", 0}});
    expect_invalid(json{{"slot_count", "many"}});
    expect_invalid(json{{"logging", 3.5}});
    expect_invalid(json{{"log_level", "loud"}});
    expect_invalid(json::array());
}

TEST(SyncConfig, rejects_negative_and_oversized_integers) {
    expect_invalid(json{{"concurrency", -1}});
    expect_invalid(json{{"slot_count", -4}});
    expect_invalid(json{{"seed", -1}});
    expect_invalid(json{{"concurrency", 1.5}});
    expect_invalid(json{{"concurrency", std::uint64_t{1} << 40}});
    expect_invalid(json::parse(R"({"concurrency": -1})"));
}

TEST(SyncConfig, slot_count_beyond_32_bits_is_invalid) {
    expect_invalid(json{{"slot_count", std::uint64_t{1} << 32}});
    EXPECT_EQ(config_from_json(json{{"slot_count", 4294967295ULL}}).slot_count, 4294967295u);

    auto config = SyncConfig{.slot_count = std::size_t{1} << 33};
    try {
        (void)make_permutation(config);
        FAIL() << "expected invalid_config";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_config);
    }
}

TEST(SyncConfig, load_config_from_file) {
    auto path = std::filesystem::temp_directory_path() / "remotesync_config_test.json";
    {
        auto out = std::ofstream{path};
        out << R"({"slot_count": 256, "seed": 42})";
    }
    auto config = load_config(path);
    EXPECT_EQ(config.slot_count, 256u);
    EXPECT_EQ(config.seed, 42u);
    std::filesystem::remove(path);
}

TEST(SyncConfig, load_config_reports_missing_and_malformed_files) {
    auto missing = std::filesystem::temp_directory_path() / "remotesync_no_such_config.json";
    EXPECT_THROW((void)load_config(missing), SyncError);

    auto path = std::filesystem::temp_directory_path() / "remotesync_bad_config.json";
    {
        auto out = std::ofstream{path};
        out << "{ not json";
    }
    EXPECT_THROW((void)load_config(path), SyncError);
    std::filesystem::remove(path);
}

TEST(SyncConfig, make_permutation_uses_seed_and_slot_count) {
    auto config = SyncConfig{.slot_count = 64, .seed = 5};
    auto perm = make_permutation(config);
    auto expected = RandomPermutation{5, 64};
    ASSERT_EQ(perm->size(), 64u);
    for (std::size_t i = 0; i < 64; ++i) {
        EXPECT_EQ(perm->forward(i), expected.forward(i));
    }
}

TEST(SyncConfig, apply_logging_configures_logger) {
    auto& logger = Logger::instance();
    apply_logging(SyncConfig{.logging = true, .log_level = LogLevel::error});
    EXPECT_TRUE(logger.enabled());
    EXPECT_EQ(logger.level(), LogLevel::error);

    apply_logging(SyncConfig{});
    EXPECT_FALSE(logger.enabled());
    EXPECT_EQ(logger.level(), LogLevel::info);
}
