#include <remotesync-cpp/config.hpp>

#include <remotesync-cpp/error.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

namespace remotesync_cpp {

namespace {

void validate(const SyncConfig& config) {
    if (config.slot_count == 0) {
        throw SyncError{ErrorKind::invalid_config, "slot_count must be at least 1"};
    }
    // Permutations index slots with 32 bits.
    if (config.slot_count > std::numeric_limits<std::uint32_t>::max()) {
        throw SyncError{ErrorKind::invalid_config,
                        "slot_count must not exceed " +
                        std::to_string(std::numeric_limits<std::uint32_t>::max())};
    }
    if (config.concurrency == 0) {
        throw SyncError{ErrorKind::invalid_config, "concurrency must be at least 1"};
    }
}

template <typename T>
void read_field(const nlohmann::json& j, std::string_view key, T& out) {
    auto it = j.find(std::string{key});
    if (it == j.end()) return;
    // get<T>() wraps negative and oversized integers into unsigned fields.
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        auto fail = [&](const std::string& why) {
            throw SyncError{ErrorKind::invalid_config, "field '" + std::string{key} + "': " + why};
        };
        if (it->is_number_float()) fail("must be an integer");
        if (it->is_number_integer()) {
            if (!it->is_number_unsigned() && it->template get<std::int64_t>() < 0) {
                fail("must not be negative");
            }
            if (it->template get<std::uint64_t>() > std::numeric_limits<T>::max()) {
                fail("out of range");
            }
        }
    }
    try {
        out = it->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw SyncError{ErrorKind::invalid_config,
                        "field '" + std::string{key} + "': " + e.what()};
    }
}

}  // namespace

void to_json(nlohmann::json& j, const SyncConfig& config) {
    j = nlohmann::json{
        {"slot_count", config.slot_count},
        {"seed", config.seed},
        {"concurrency", config.concurrency},
        {"logging", config.logging},
        {"log_level", to_string_view(config.log_level)},
    };
}

void from_json(const nlohmann::json& j, SyncConfig& config) {
    if (!j.is_object()) {
        throw SyncError{ErrorKind::invalid_config, "configuration must be a JSON object"};
    }
    read_field(j, "slot_count", config.slot_count);
    read_field(j, "seed", config.seed);
    read_field(j, "concurrency", config.concurrency);
    read_field(j, "logging", config.logging);

    auto level_name = std::string{to_string_view(config.log_level)};
    read_field(j, "log_level", level_name);
    auto level = parse_log_level(level_name);
    if (!level) {
        throw SyncError{ErrorKind::invalid_config, "unknown log_level '" + level_name + "'"};
    }
    config.log_level = *level;
}

auto config_from_json(const nlohmann::json& j) -> SyncConfig {
    auto config = SyncConfig{};
    from_json(j, config);
    validate(config);
    return config;
}

auto load_config(const std::filesystem::path& path) -> SyncConfig {
    auto in = std::ifstream{path};
    if (!in) {
        throw SyncError{ErrorKind::invalid_config, "cannot open " + path.string()};
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw SyncError{ErrorKind::invalid_config, "malformed JSON in " + path.string()};
    }
    return config_from_json(j);
}

void apply_logging(const SyncConfig& config) {
    auto& logger = Logger::instance();
    logger.set_level(config.log_level);
    logger.set_enabled(config.logging);
}

auto make_permutation(const SyncConfig& config) -> std::unique_ptr<Permutation> {
    validate(config);
    return std::make_unique<RandomPermutation>(config.seed, config.slot_count);
}

}  // namespace remotesync_cpp
