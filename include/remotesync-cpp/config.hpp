/// @file config.hpp
/// @brief Session configuration and its nlohmann/json mapping.

#pragma once

#include <remotesync-cpp/logging.hpp>
#include <remotesync-cpp/permutation.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace remotesync_cpp {

/// Parameters both peers of a session must agree on, plus local tuning.
///
/// slot_count and seed define the shared permutation and have to be equal on
/// sender and receiver; how they are agreed on is up to the integrating
/// system. concurrency and the logging fields are local.
struct SyncConfig {
    std::size_t slot_count = 1024;  ///< N_slots: padded length of the hash list.
    std::uint64_t seed = 0;         ///< Permutation seed.
    unsigned concurrency = 8;       ///< Max storage lookups in flight on the receiver.
    bool logging = false;           ///< Enable the structured logger.
    LogLevel log_level = LogLevel::info;

    auto operator==(const SyncConfig&) const -> bool = default;
};

void to_json(nlohmann::json& j, const SyncConfig& config);

/// Missing keys keep their defaults.
/// @throws SyncError{invalid_config} on type errors or out-of-range values.
void from_json(const nlohmann::json& j, SyncConfig& config);

/// Parse and validate a configuration object.
/// @throws SyncError{invalid_config}
auto config_from_json(const nlohmann::json& j) -> SyncConfig;

/// Read a JSON configuration file.
/// @throws SyncError{invalid_config} if the file cannot be read or parsed.
auto load_config(const std::filesystem::path& path) -> SyncConfig;

/// Apply the logging fields to Logger::instance().
void apply_logging(const SyncConfig& config);

/// The permutation described by (seed, slot_count).
auto make_permutation(const SyncConfig& config) -> std::unique_ptr<Permutation>;

}  // namespace remotesync_cpp
