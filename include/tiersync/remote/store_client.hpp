#pragma once

#include "tiersync/core/result.hpp"
#include "tiersync/sync/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tiersync::remote {

/**
 * @brief Capabilities the sync engine needs from the replicated store
 *
 * Every call blocks on the network. Implementations bound each call with a
 * timeout and report failures as ErrorKind::Remote.
 */
class RemoteStoreClient {
public:
    virtual ~RemoteStoreClient() = default;

    virtual Result<void> upload_file(const std::filesystem::path& local_path,
                                     const std::string& remote_path,
                                     const sync::RedundancyConfig& redundancy) = 0;

    virtual Result<void> delete_file(const std::string& remote_path) = 0;

    /**
     * @brief List every file whose remote path lies under @p prefix
     *
     * An empty prefix lists the whole store.
     */
    virtual Result<std::vector<sync::RemoteFile>> list_files(const std::string& prefix) = 0;

    /**
     * @brief Health of @p remote_dir and its immediate subdirectories
     *
     * Element 0 describes @p remote_dir itself.
     */
    virtual Result<std::vector<sync::DirectoryHealth>> directory_health(const std::string& remote_dir) = 0;

    virtual Result<void> rename_path(const std::string& old_path, const std::string& new_path) = 0;

    virtual Result<bool> file_exists(const std::string& remote_path) = 0;
};

} // namespace tiersync::remote
