#pragma once

#include "tiersync/network/http_client.hpp"
#include "tiersync/remote/store_client.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace tiersync::remote {

/**
 * @brief RemoteStoreClient speaking the renter HTTP API of a storage daemon
 *
 * Every request carries the configured User-Agent and HTTP Basic auth with an
 * empty user name and the API password. Non-2xx replies become
 * ErrorKind::Remote with the daemon's "message" field.
 */
class RenterClient : public RemoteStoreClient {
public:
    struct Options {
        std::string address = "127.0.0.1:9980";
        std::string password;
        std::string user_agent = "Sia-Agent";
        std::chrono::milliseconds timeout{30000};
    };

    static Result<std::unique_ptr<RenterClient>> create(const Options& options);

    Result<void> upload_file(const std::filesystem::path& local_path,
                             const std::string& remote_path,
                             const sync::RedundancyConfig& redundancy) override;

    Result<void> delete_file(const std::string& remote_path) override;

    Result<std::vector<sync::RemoteFile>> list_files(const std::string& prefix) override;

    Result<std::vector<sync::DirectoryHealth>> directory_health(const std::string& remote_dir) override;

    Result<void> rename_path(const std::string& old_path, const std::string& new_path) override;

    Result<bool> file_exists(const std::string& remote_path) override;

private:
    RenterClient(network::HttpClient http, std::string password, std::string user_agent);

    Result<network::HttpResponse> call(network::HttpMethod method,
                                       const std::string& target,
                                       const std::string& form_body = {}) const;

    Result<void> post(const std::string& target, const std::string& form_body = {}) const;

    network::HttpClient http_;
    std::string authorization_;
    std::string user_agent_;
};

} // namespace tiersync::remote
