#pragma once

#include <cstdint>
#include <string>

namespace tiersync::sync {

/**
 * @brief Remote namespace currently holding a file's object
 *
 * Every fresh upload lands in Staging. The promotion scheduler moves whole
 * directories to Production once the store reports enough redundancy.
 */
enum class Tier {
    Staging,
    Production
};

inline const char* to_string(Tier tier) {
    switch (tier) {
        case Tier::Staging: return "staging";
        case Tier::Production: return "production";
        default: return "unknown";
    }
}

/**
 * @brief Index record for one local file
 */
struct FileEntry {
    std::string path;         ///< Relative to the synchronized root (POSIX style)
    std::string fingerprint;  ///< Opaque; size or content hash
    Tier tier = Tier::Staging;
    bool remote_present = true;  ///< False once the old object was deleted and the re-upload has not landed
};

/**
 * @brief Index record for one local subdirectory
 */
struct DirEntry {
    std::string path;
    bool registered = false;  ///< Added to the watcher and recorded
};

/**
 * @brief Erasure coding parameters passed with every upload
 */
struct RedundancyConfig {
    std::uint32_t data_pieces = 10;
    std::uint32_t parity_pieces = 30;
};

/**
 * @brief One entry of a remote file listing
 */
struct RemoteFile {
    std::string remote_path;
    std::uint64_t size = 0;
};

/**
 * @brief Health summary for one remote directory
 *
 * The store returns a list of these for a queried directory; the first
 * element always describes the queried directory itself.
 */
struct DirectoryHealth {
    std::string remote_path;
    double aggregate_min_redundancy = 0.0;
};

/**
 * @brief Filesystem change observed by a directory watcher
 */
struct WatchEvent {
    enum class Kind {
        Create,
        Write,
        Remove
    };

    std::string path;  ///< Absolute path as reported by the watcher
    Kind kind = Kind::Create;
};

inline const char* to_string(WatchEvent::Kind kind) {
    switch (kind) {
        case WatchEvent::Kind::Create: return "create";
        case WatchEvent::Kind::Write: return "write";
        case WatchEvent::Kind::Remove: return "remove";
        default: return "unknown";
    }
}

} // namespace tiersync::sync
