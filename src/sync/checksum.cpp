#include "tiersync/sync/checksum.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace tiersync::sync {
namespace fs = std::filesystem;

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime  = 0x100000001b3ULL;

// Keeps hash fingerprints disjoint from decimal size fingerprints.
constexpr const char* kHashPrefix = "fnv1a:";

} // namespace

Result<std::string> ChecksumProvider::fingerprint(const fs::path& path) const {
    if (mode_ == FingerprintMode::ContentHash) {
        return content_hash(path);
    }
    auto size = file_size(path);
    if (size.is_error()) {
        return Err<std::string>(size.error());
    }
    return Ok(size_fingerprint(size.value()));
}

std::string ChecksumProvider::size_fingerprint(std::uint64_t size) {
    return std::to_string(size);
}

Result<std::uint64_t> ChecksumProvider::file_size(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec) {
        return Err<std::uint64_t>(io_error("Failed to stat " + path.string() + ": " + ec.message()));
    }
    if (!fs::is_regular_file(status)) {
        return Err<std::uint64_t>(io_error("Not a regular file: " + path.string()));
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::uint64_t>(io_error("Failed to read size of " + path.string() + ": " + ec.message()));
    }
    return Ok(static_cast<std::uint64_t>(size));
}

Result<std::string> ChecksumProvider::content_hash(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(io_error("Failed to open " + path.string()));
    }

    std::uint64_t hash = kFnvOffset;
    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const std::streamsize count = input.gcount();
        for (std::streamsize i = 0; i < count; ++i) {
            hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(buffer[i]));
            hash *= kFnvPrime;
        }
    }
    if (input.bad()) {
        return Err<std::string>(io_error("Failed to read " + path.string()));
    }

    std::ostringstream hex;
    hex << kHashPrefix << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return Ok(hex.str());
}

} // namespace tiersync::sync
