#pragma once

#include "tiersync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace tiersync::sync {

enum class FingerprintMode {
    Size,        ///< Decimal byte count; cheap but blind to same-size edits
    ContentHash  ///< FNV-1a 64 over the file bytes
};

/**
 * @brief Computes the fingerprint recorded in the local state index
 *
 * Runs on every write event, so both modes stream the file at most once and
 * keep no state between calls.
 */
class ChecksumProvider {
public:
    explicit ChecksumProvider(FingerprintMode mode = FingerprintMode::Size) : mode_(mode) {}

    [[nodiscard]] FingerprintMode mode() const noexcept { return mode_; }

    Result<std::string> fingerprint(const std::filesystem::path& path) const;

    /**
     * @brief Fingerprint a remote-reported size would have in Size mode
     */
    static std::string size_fingerprint(std::uint64_t size);

    static Result<std::uint64_t> file_size(const std::filesystem::path& path);

private:
    static Result<std::string> content_hash(const std::filesystem::path& path);

    FingerprintMode mode_;
};

} // namespace tiersync::sync
