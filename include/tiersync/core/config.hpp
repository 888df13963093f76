#pragma once

/**
 * @file config.hpp
 * @brief Daemon configuration: JSON file, command-line overrides, validation
 *
 * PRECEDENCE:
 * built-in defaults < --config <file.json> < individual --flags
 *
 * EXAMPLE FILE:
 * {
 *   "root": "/srv/media",
 *   "api_password": "secret",
 *   "promotion_categories": ["movies", "tv"],
 *   "fingerprint": "hash"
 * }
 */

#include "tiersync/core/result.hpp"
#include "tiersync/sync/checksum.hpp"
#include "tiersync/sync/types.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace tiersync {

struct SyncConfig {
    std::filesystem::path root;

    // Remote store
    std::string api_address = "127.0.0.1:9980";
    std::string api_password;
    std::string user_agent = "Sia-Agent";
    std::chrono::milliseconds remote_timeout{30000};

    // Namespaces
    std::string staging_prefix = "fuse/staging";
    std::string production_prefix = "fuse/prod";

    // Upload behaviour
    bool archive = false;
    bool dry_run = false;
    sync::FingerprintMode fingerprint = sync::FingerprintMode::Size;
    sync::RedundancyConfig redundancy;

    // Promotion
    std::chrono::milliseconds promotion_interval{5000};
    double promotion_threshold = 1.0;
    std::vector<std::string> promotion_categories;

    std::string log_level = "info";

    /**
     * @brief Check every field; ErrorKind::Config on the first violation
     */
    Result<void> validate() const;
};

/**
 * @brief Overlay the keys present in a JSON document onto @p base
 *
 * Unknown keys and wrongly typed values are rejected.
 */
Result<SyncConfig> config_from_json(const std::string& text, SyncConfig base = {});

Result<SyncConfig> load_config_file(const std::filesystem::path& path, SyncConfig base = {});

struct CommandLine {
    SyncConfig config;
    bool show_help = false;
};

/**
 * @brief Parse `tiersyncd [--flag value ...] <directory>`
 *
 * The positional argument, when present, sets the root. Does not validate;
 * call SyncConfig::validate() on the result.
 */
Result<CommandLine> parse_command_line(int argc, const char* const* argv);

std::string usage();

Result<sync::FingerprintMode> parse_fingerprint_mode(const std::string& name);
const char* to_string(sync::FingerprintMode mode);

} // namespace tiersync
