#pragma once

#include "tiersync/core/result.hpp"
#include "tiersync/sync/types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace tiersync::sync {

/**
 * @brief Normalize a local path into the index key convention
 *
 * Keys are relative to the synchronized root, use '/' separators and carry
 * no "./" components or trailing slash. Relative inputs are taken as already
 * relative to @p root. Fails when the path escapes the root or is the root.
 */
Result<std::string> relative_key(const std::filesystem::path& root,
                                 const std::filesystem::path& path);

/**
 * @brief Strip leading/trailing '/' from a remote prefix
 */
std::string clean_remote(const std::string& remote);

/**
 * @brief Join a remote prefix and a relative key with exactly one '/'
 */
std::string join_remote(const std::string& prefix, const std::string& relative);

/**
 * @brief Replace the leading @p from prefix of @p path with @p to
 *
 * Only whole path components match: "fuse/stagingx/a" is not under
 * "fuse/staging". The suffix is preserved unchanged.
 */
Result<std::string> rebase(const std::string& path, const std::string& from, const std::string& to);

/**
 * @brief Maps relative keys to remote paths for both tiers
 */
class NamespaceMap {
public:
    NamespaceMap(const std::string& staging_prefix, const std::string& production_prefix);

    [[nodiscard]] const std::string& staging_prefix() const noexcept { return staging_; }
    [[nodiscard]] const std::string& production_prefix() const noexcept { return production_; }

    [[nodiscard]] std::string remote_path(const std::string& relative, Tier tier) const;
    [[nodiscard]] std::string staging_path(const std::string& relative) const;
    [[nodiscard]] std::string production_path(const std::string& relative) const;

    /**
     * @brief Inverse of remote_path(); nullopt when @p remote is not under the tier
     */
    [[nodiscard]] std::optional<std::string> relative_of(const std::string& remote, Tier tier) const;

    /**
     * @brief Staging path to the equivalent production path
     */
    Result<std::string> promote(const std::string& staging_remote) const;

private:
    std::string staging_;
    std::string production_;
};

} // namespace tiersync::sync
