#pragma once

/**
 * @file state_index.hpp
 * @brief In-memory index of known local files and directories
 *
 * WHY THIS FILE EXISTS:
 * The daemon never persists what it has uploaded. At startup it rebuilds
 * this index from a full local walk plus the remote listing, and afterwards
 * the event dispatcher and the promotion scheduler both read and update it
 * from their own threads.
 *
 * WHAT IT HOLDS:
 * - files: relative path -> FileEntry (fingerprint + tier)
 * - dirs:  relative path -> DirEntry (registered with the watcher or not)
 *
 * THREAD SAFETY PATTERN:
 * - Reads take a std::shared_lock
 * - Writes take a std::unique_lock
 * - No reference into the maps ever escapes; lookups return copies
 *
 * KEY CONVENTION:
 * Every key is relative to the synchronized root with '/' separators.
 * Callers convert absolute paths with relative_key() (remote_path.hpp);
 * the index runs normalize_key() on every argument so "a/./b" and "a/b/"
 * land on the same entry.
 */

#include "tiersync/sync/types.hpp"

#include <filesystem>
#include <optional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tiersync::sync {

class LocalStateIndex {
public:
    LocalStateIndex() = default;

    LocalStateIndex(const LocalStateIndex&) = delete;
    LocalStateIndex& operator=(const LocalStateIndex&) = delete;

    static std::string normalize_key(const std::string& path) {
        std::string key = std::filesystem::path(path).lexically_normal().generic_string();
        while (key.size() > 1 && key.back() == '/') {
            key.pop_back();
        }
        if (key == ".") {
            key.clear();
        }
        return key;
    }

    /**
     * Record or overwrite a file's fingerprint and tier
     */
    void set_file(const std::string& path, std::string fingerprint, Tier tier = Tier::Staging) {
        auto key = normalize_key(path);
        std::unique_lock lock(mutex_);
        auto& entry = files_[key];
        entry.path = std::move(key);
        entry.fingerprint = std::move(fingerprint);
        entry.tier = tier;
        entry.remote_present = true;
    }

    /**
     * Record that a file's remote object is gone while its entry stays
     *
     * The next write goes straight to an upload instead of deleting again.
     * Returns false when the file is not indexed.
     */
    bool mark_remote_missing(const std::string& path, std::string fingerprint) {
        std::unique_lock lock(mutex_);
        auto it = files_.find(normalize_key(path));
        if (it == files_.end()) {
            return false;
        }
        it->second.fingerprint = std::move(fingerprint);
        it->second.remote_present = false;
        return true;
    }

    /**
     * Overwrite only the fingerprint, keeping the recorded tier
     *
     * Returns false when the file is not indexed.
     */
    bool update_fingerprint(const std::string& path, std::string fingerprint) {
        std::unique_lock lock(mutex_);
        auto it = files_.find(normalize_key(path));
        if (it == files_.end()) {
            return false;
        }
        it->second.fingerprint = std::move(fingerprint);
        return true;
    }

    bool remove_file(const std::string& path) {
        std::unique_lock lock(mutex_);
        return files_.erase(normalize_key(path)) > 0;
    }

    std::optional<FileEntry> get_file(const std::string& path) const {
        std::shared_lock lock(mutex_);
        auto it = files_.find(normalize_key(path));
        if (it == files_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool has_file(const std::string& path) const {
        std::shared_lock lock(mutex_);
        return files_.find(normalize_key(path)) != files_.end();
    }

    void set_dir_known(const std::string& path) {
        auto key = normalize_key(path);
        std::unique_lock lock(mutex_);
        auto& entry = dirs_[key];
        entry.path = std::move(key);
        entry.registered = true;
    }

    bool has_dir(const std::string& path) const {
        std::shared_lock lock(mutex_);
        return dirs_.find(normalize_key(path)) != dirs_.end();
    }

    /**
     * Prune a directory and everything indexed beneath it
     *
     * Returns the relative paths of the file entries that were dropped.
     */
    std::vector<std::string> remove_dir(const std::string& path) {
        const auto key = normalize_key(path);
        const auto prefix = key + "/";
        std::vector<std::string> dropped;

        std::unique_lock lock(mutex_);
        dirs_.erase(key);
        for (auto it = dirs_.begin(); it != dirs_.end();) {
            if (it->first.rfind(prefix, 0) == 0) {
                it = dirs_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = files_.begin(); it != files_.end();) {
            if (it->first.rfind(prefix, 0) == 0) {
                dropped.push_back(it->first);
                it = files_.erase(it);
            } else {
                ++it;
            }
        }
        return dropped;
    }

    /**
     * Mark every file beneath @p relative_dir as living in production
     *
     * Returns how many entries changed tier.
     */
    std::size_t mark_promoted(const std::string& relative_dir) {
        const auto key = normalize_key(relative_dir);
        const auto prefix = key.empty() ? std::string() : key + "/";
        std::size_t changed = 0;

        std::unique_lock lock(mutex_);
        for (auto& [path, entry] : files_) {
            if (path.rfind(prefix, 0) == 0 && entry.tier != Tier::Production) {
                entry.tier = Tier::Production;
                ++changed;
            }
        }
        return changed;
    }

    std::vector<std::string> file_paths() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> paths;
        paths.reserve(files_.size());
        for (const auto& [path, entry] : files_) {
            paths.push_back(path);
        }
        return paths;
    }

    std::vector<std::string> dir_paths() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> paths;
        paths.reserve(dirs_.size());
        for (const auto& [path, entry] : dirs_) {
            paths.push_back(path);
        }
        return paths;
    }

    std::size_t file_count() const {
        std::shared_lock lock(mutex_);
        return files_.size();
    }

    std::size_t dir_count() const {
        std::shared_lock lock(mutex_);
        return dirs_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, FileEntry> files_;
    std::unordered_map<std::string, DirEntry> dirs_;
};

} // namespace tiersync::sync
