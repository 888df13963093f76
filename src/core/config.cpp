#include "tiersync/core/config.hpp"

#include "tiersync/sync/remote_path.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace tiersync {
namespace {

using json = nlohmann::json;

const char* const kLogLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

Result<std::uint64_t> parse_unsigned(const std::string& flag, const std::string& text) {
    std::uint64_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        return Err<std::uint64_t>(config_error(flag + " expects a non-negative integer, got '" + text + "'"));
    }
    return Ok(value);
}

Result<double> parse_double(const std::string& flag, const std::string& text) {
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(value)) {
        return Err<double>(config_error(flag + " expects a number, got '" + text + "'"));
    }
    return Ok(value);
}

Result<std::uint64_t> json_unsigned(const json& value, const std::string& key) {
    if (!value.is_number_unsigned()) {
        return Err<std::uint64_t>(config_error(key + " must be a non-negative integer"));
    }
    return Ok(value.get<std::uint64_t>());
}

Result<void> apply_flag(SyncConfig& config, const std::string& flag, const std::string& value,
                        bool& categories_overridden) {
    if (flag == "--address") {
        config.api_address = value;
    } else if (flag == "--password") {
        config.api_password = value;
    } else if (flag == "--agent") {
        config.user_agent = value;
    } else if (flag == "--staging-dir") {
        config.staging_prefix = value;
    } else if (flag == "--prod-dir") {
        config.production_prefix = value;
    } else if (flag == "--fingerprint") {
        auto mode = parse_fingerprint_mode(value);
        if (mode.is_error()) {
            return Err<void>(mode.error());
        }
        config.fingerprint = mode.value();
    } else if (flag == "--data-pieces" || flag == "--parity-pieces") {
        auto count = parse_unsigned(flag, value);
        if (count.is_error()) {
            return Err<void>(count.error());
        }
        auto& target = flag == "--data-pieces" ? config.redundancy.data_pieces : config.redundancy.parity_pieces;
        target = static_cast<std::uint32_t>(count.value());
    } else if (flag == "--promotion-interval-ms" || flag == "--remote-timeout-ms") {
        auto millis = parse_unsigned(flag, value);
        if (millis.is_error()) {
            return Err<void>(millis.error());
        }
        auto& target = flag == "--promotion-interval-ms" ? config.promotion_interval : config.remote_timeout;
        target = std::chrono::milliseconds(millis.value());
    } else if (flag == "--promotion-threshold") {
        auto threshold = parse_double(flag, value);
        if (threshold.is_error()) {
            return Err<void>(threshold.error());
        }
        config.promotion_threshold = threshold.value();
    } else if (flag == "--category") {
        if (!categories_overridden) {
            config.promotion_categories.clear();
            categories_overridden = true;
        }
        config.promotion_categories.push_back(value);
    } else if (flag == "--log-level") {
        config.log_level = value;
    } else {
        return Err<void>(config_error("Unknown option " + flag));
    }
    return Ok();
}

} // namespace

Result<sync::FingerprintMode> parse_fingerprint_mode(const std::string& name) {
    if (name == "size") {
        return Ok(sync::FingerprintMode::Size);
    }
    if (name == "hash") {
        return Ok(sync::FingerprintMode::ContentHash);
    }
    return Err<sync::FingerprintMode>(config_error("Unknown fingerprint mode '" + name + "' (expected size or hash)"));
}

const char* to_string(sync::FingerprintMode mode) {
    return mode == sync::FingerprintMode::ContentHash ? "hash" : "size";
}

Result<void> SyncConfig::validate() const {
    if (root.empty()) {
        return Err<void>(config_error("No directory to synchronize was given"));
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return Err<void>(config_error("Not a directory: " + root.string()));
    }

    if (api_address.empty()) {
        return Err<void>(config_error("api_address must not be empty"));
    }
    if (user_agent.empty()) {
        return Err<void>(config_error("user_agent must not be empty"));
    }
    if (remote_timeout.count() <= 0) {
        return Err<void>(config_error("remote_timeout_ms must be positive"));
    }

    const auto staging = sync::clean_remote(staging_prefix);
    const auto production = sync::clean_remote(production_prefix);
    if (staging.empty() || production.empty()) {
        return Err<void>(config_error("Staging and production prefixes must not be empty"));
    }
    if (sync::rebase(staging, production, "").is_ok() || sync::rebase(production, staging, "").is_ok()) {
        return Err<void>(config_error("Staging prefix '" + staging + "' and production prefix '" +
                                      production + "' must not contain each other"));
    }

    if (redundancy.data_pieces == 0 || redundancy.parity_pieces == 0) {
        return Err<void>(config_error("data_pieces and parity_pieces must both be at least 1"));
    }
    if (promotion_interval.count() <= 0) {
        return Err<void>(config_error("promotion_interval_ms must be positive"));
    }
    if (!std::isfinite(promotion_threshold) || promotion_threshold < 0.0) {
        return Err<void>(config_error("promotion_threshold must be a non-negative number"));
    }
    for (const auto& category : promotion_categories) {
        const auto clean = sync::clean_remote(category);
        if (clean.empty() || clean == ".." || clean.rfind("../", 0) == 0) {
            return Err<void>(config_error("Invalid promotion category '" + category + "'"));
        }
    }

    for (const auto* level : kLogLevels) {
        if (log_level == level) {
            return Ok();
        }
    }
    return Err<void>(config_error("Unknown log level '" + log_level + "'"));
}

Result<SyncConfig> config_from_json(const std::string& text, SyncConfig config) {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<SyncConfig>(config_error("Configuration is not a JSON object"));
    }

    try {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            const auto& key = it.key();
            const auto& value = it.value();

            if (key == "root") {
                config.root = value.get<std::string>();
            } else if (key == "api_address") {
                config.api_address = value.get<std::string>();
            } else if (key == "api_password") {
                config.api_password = value.get<std::string>();
            } else if (key == "user_agent") {
                config.user_agent = value.get<std::string>();
            } else if (key == "staging_prefix") {
                config.staging_prefix = value.get<std::string>();
            } else if (key == "production_prefix") {
                config.production_prefix = value.get<std::string>();
            } else if (key == "archive") {
                config.archive = value.get<bool>();
            } else if (key == "dry_run") {
                config.dry_run = value.get<bool>();
            } else if (key == "fingerprint") {
                auto mode = parse_fingerprint_mode(value.get<std::string>());
                if (mode.is_error()) {
                    return Err<SyncConfig>(mode.error());
                }
                config.fingerprint = mode.value();
            } else if (key == "data_pieces" || key == "parity_pieces" ||
                       key == "promotion_interval_ms" || key == "remote_timeout_ms") {
                auto number = json_unsigned(value, key);
                if (number.is_error()) {
                    return Err<SyncConfig>(number.error());
                }
                if (key == "data_pieces") {
                    config.redundancy.data_pieces = static_cast<std::uint32_t>(number.value());
                } else if (key == "parity_pieces") {
                    config.redundancy.parity_pieces = static_cast<std::uint32_t>(number.value());
                } else if (key == "promotion_interval_ms") {
                    config.promotion_interval = std::chrono::milliseconds(number.value());
                } else {
                    config.remote_timeout = std::chrono::milliseconds(number.value());
                }
            } else if (key == "promotion_threshold") {
                if (!value.is_number()) {
                    return Err<SyncConfig>(config_error("promotion_threshold must be a number"));
                }
                config.promotion_threshold = value.get<double>();
            } else if (key == "promotion_categories") {
                config.promotion_categories = value.get<std::vector<std::string>>();
            } else if (key == "log_level") {
                config.log_level = value.get<std::string>();
            } else {
                return Err<SyncConfig>(config_error("Unknown configuration key '" + key + "'"));
            }
        }
    } catch (const json::exception& e) {
        return Err<SyncConfig>(config_error(std::string("Invalid configuration value: ") + e.what()));
    }
    return Ok(config);
}

Result<SyncConfig> load_config_file(const std::filesystem::path& path, SyncConfig base) {
    std::ifstream input(path);
    if (!input) {
        return Err<SyncConfig>(config_error("Cannot open configuration file " + path.string()));
    }
    std::ostringstream text;
    text << input.rdbuf();

    auto config = config_from_json(text.str(), std::move(base));
    if (config.is_error()) {
        return Err<SyncConfig>(config_error(path.string() + ": " + config.error().message));
    }
    return config;
}

Result<CommandLine> parse_command_line(int argc, const char* const* argv) {
    CommandLine result;

    // The file is the base layer, wherever --config appears.
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            auto loaded = load_config_file(argv[i + 1], result.config);
            if (loaded.is_error()) {
                return Err<CommandLine>(loaded.error());
            }
            result.config = std::move(loaded.value());
            break;
        }
    }

    bool categories_overridden = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
        } else if (arg == "--dry-run") {
            result.config.dry_run = true;
        } else if (arg == "--archive") {
            result.config.archive = true;
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                return Err<CommandLine>(config_error("Missing value for " + arg));
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                continue;
            }
            auto applied = apply_flag(result.config, arg, value, categories_overridden);
            if (applied.is_error()) {
                return Err<CommandLine>(applied.error());
            }
        } else {
            result.config.root = arg;
        }
    }
    return Ok(result);
}

std::string usage() {
    return R"(usage: tiersyncd [options] <directory-to-sync>
  for example: tiersyncd --password abcd123 /tmp/sync/to/store

options:
  --config <file>                JSON configuration file (flags override it)
  --address <host:port>          renter API address (default 127.0.0.1:9980)
  --password <password>          renter API password
  --agent <name>                 User-Agent sent to the API (default Sia-Agent)
  --staging-dir <path>           remote staging prefix (default fuse/staging)
  --prod-dir <path>              remote production prefix (default fuse/prod)
  --category <dir>               staging subdirectory to promote (repeatable)
  --promotion-interval-ms <ms>   promotion check interval (default 5000)
  --promotion-threshold <x>      redundancy required for promotion (default 1.0)
  --data-pieces <n>              erasure coding data pieces (default 10)
  --parity-pieces <n>            erasure coding parity pieces (default 30)
  --fingerprint <size|hash>      change detection mode (default size)
  --remote-timeout-ms <ms>       per-request timeout (default 30000)
  --log-level <level>            trace, debug, info, warn, error (default info)
  --archive                      keep old remote copies when files change
  --dry-run                      log what would be uploaded, change nothing remotely
  --help                         show this message
)";
}

} // namespace tiersync
