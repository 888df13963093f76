#include "tiersync/sync/remote_path.hpp"

namespace tiersync::sync {
namespace fs = std::filesystem;

Result<std::string> relative_key(const fs::path& root, const fs::path& path) {
    fs::path relative;
    if (path.is_absolute()) {
        fs::path normal_root = root.lexically_normal();
        if (!normal_root.has_filename() && normal_root != normal_root.root_path()) {
            normal_root = normal_root.parent_path();
        }
        relative = path.lexically_normal().lexically_relative(normal_root);
    } else {
        relative = path.lexically_normal();
    }

    std::string key = relative.generic_string();
    while (!key.empty() && key.back() == '/') {
        key.pop_back();
    }

    if (key.empty() || key == "." || key == ".." || key.rfind("../", 0) == 0) {
        return Err<std::string>(io_error("Path " + path.string() + " is not inside " + root.string()));
    }
    return Ok(key);
}

std::string clean_remote(const std::string& remote) {
    std::size_t begin = 0;
    std::size_t end = remote.size();
    while (begin < end && remote[begin] == '/') {
        ++begin;
    }
    while (end > begin && remote[end - 1] == '/') {
        --end;
    }
    return remote.substr(begin, end - begin);
}

std::string join_remote(const std::string& prefix, const std::string& relative) {
    const auto head = clean_remote(prefix);
    const auto tail = clean_remote(relative);
    if (head.empty()) {
        return tail;
    }
    if (tail.empty()) {
        return head;
    }
    return head + "/" + tail;
}

Result<std::string> rebase(const std::string& path, const std::string& from, const std::string& to) {
    const auto source = clean_remote(path);
    const auto old_root = clean_remote(from);

    if (old_root.empty()) {
        return Ok(join_remote(to, source));
    }
    if (source == old_root) {
        return Ok(clean_remote(to));
    }
    if (source.size() > old_root.size() &&
        source.compare(0, old_root.size(), old_root) == 0 &&
        source[old_root.size()] == '/') {
        return Ok(join_remote(to, source.substr(old_root.size() + 1)));
    }
    return Err<std::string>(remote_error("Remote path " + source + " is not under " + old_root));
}

NamespaceMap::NamespaceMap(const std::string& staging_prefix, const std::string& production_prefix)
    : staging_(clean_remote(staging_prefix)),
      production_(clean_remote(production_prefix)) {}

std::string NamespaceMap::remote_path(const std::string& relative, Tier tier) const {
    return join_remote(tier == Tier::Production ? production_ : staging_, relative);
}

std::string NamespaceMap::staging_path(const std::string& relative) const {
    return remote_path(relative, Tier::Staging);
}

std::string NamespaceMap::production_path(const std::string& relative) const {
    return remote_path(relative, Tier::Production);
}

std::optional<std::string> NamespaceMap::relative_of(const std::string& remote, Tier tier) const {
    const auto& prefix = tier == Tier::Production ? production_ : staging_;
    auto rebased = rebase(remote, prefix, "");
    if (rebased.is_error() || rebased.value().empty()) {
        return std::nullopt;
    }
    return rebased.value();
}

Result<std::string> NamespaceMap::promote(const std::string& staging_remote) const {
    return rebase(staging_remote, staging_, production_);
}

} // namespace tiersync::sync
