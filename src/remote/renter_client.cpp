#include "tiersync/remote/renter_client.hpp"

#include "tiersync/remote/renter_api.hpp"
#include "tiersync/sync/remote_path.hpp"

#include <spdlog/spdlog.h>

namespace tiersync::remote {
namespace {

// Daemon error text for a siapath it does not track.
constexpr const char* kNoFileKnown = "no file known";

bool under_prefix(const std::string& remote_path, const std::string& prefix) {
    const auto clean = sync::clean_remote(prefix);
    if (clean.empty()) {
        return true;
    }
    return sync::rebase(remote_path, clean, "").is_ok();
}

} // namespace

Result<std::unique_ptr<RenterClient>> RenterClient::create(const Options& options) {
    auto http = network::HttpClient::from_address(options.address, options.timeout);
    if (http.is_error()) {
        return Err<std::unique_ptr<RenterClient>>(http.error());
    }
    if (options.user_agent.empty()) {
        return Err<std::unique_ptr<RenterClient>>(config_error("User agent must not be empty"));
    }
    return Ok(std::unique_ptr<RenterClient>(
        new RenterClient(std::move(http.value()), options.password, options.user_agent)));
}

RenterClient::RenterClient(network::HttpClient http, std::string password, std::string user_agent)
    : http_(std::move(http)),
      user_agent_(std::move(user_agent)) {
    if (!password.empty()) {
        authorization_ = "Basic " + renter::base64_encode(":" + password);
    }
}

Result<network::HttpResponse> RenterClient::call(network::HttpMethod method,
                                                 const std::string& target,
                                                 const std::string& form_body) const {
    network::HttpRequest request;
    request.method = method;
    request.target = target;
    request.set_header("User-Agent", user_agent_);
    if (!authorization_.empty()) {
        request.set_header("Authorization", authorization_);
    }
    if (method == network::HttpMethod::POST) {
        request.set_form_body(form_body);
    }

    spdlog::debug("renter {} {}", network::HttpMethodUtils::to_string(method), target);
    return http_.send(request);
}

Result<void> RenterClient::post(const std::string& target, const std::string& form_body) const {
    auto response = call(network::HttpMethod::POST, target, form_body);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<void>(remote_error(target + ": " + renter::error_message(response.value())));
    }
    return Ok();
}

Result<void> RenterClient::upload_file(const std::filesystem::path& local_path,
                                       const std::string& remote_path,
                                       const sync::RedundancyConfig& redundancy) {
    const auto body = renter::form_encode({
        {"datapieces", std::to_string(redundancy.data_pieces)},
        {"paritypieces", std::to_string(redundancy.parity_pieces)},
        {"source", local_path.string()},
    });
    return post("/renter/upload/" + renter::encode_path(sync::clean_remote(remote_path)), body);
}

Result<void> RenterClient::delete_file(const std::string& remote_path) {
    return post("/renter/delete/" + renter::encode_path(sync::clean_remote(remote_path)));
}

Result<std::vector<sync::RemoteFile>> RenterClient::list_files(const std::string& prefix) {
    auto response = call(network::HttpMethod::GET, "/renter/files?cached=true");
    if (response.is_error()) {
        return Err<std::vector<sync::RemoteFile>>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<std::vector<sync::RemoteFile>>(
            remote_error("/renter/files: " + renter::error_message(response.value())));
    }

    auto files = renter::parse_files(response.value().body_as_string());
    if (files.is_error()) {
        return files;
    }

    std::vector<sync::RemoteFile> filtered;
    for (auto& file : files.value()) {
        if (under_prefix(file.remote_path, prefix)) {
            filtered.push_back(std::move(file));
        }
    }
    return Ok(filtered);
}

Result<std::vector<sync::DirectoryHealth>> RenterClient::directory_health(const std::string& remote_dir) {
    const auto target = "/renter/dir/" + renter::encode_path(sync::clean_remote(remote_dir));
    auto response = call(network::HttpMethod::GET, target);
    if (response.is_error()) {
        return Err<std::vector<sync::DirectoryHealth>>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<std::vector<sync::DirectoryHealth>>(
            remote_error(target + ": " + renter::error_message(response.value())));
    }
    return renter::parse_directory(response.value().body_as_string());
}

Result<void> RenterClient::rename_path(const std::string& old_path, const std::string& new_path) {
    const auto body = renter::form_encode({{"newsiapath", sync::clean_remote(new_path)}});
    return post("/renter/rename/" + renter::encode_path(sync::clean_remote(old_path)), body);
}

Result<bool> RenterClient::file_exists(const std::string& remote_path) {
    const auto target = "/renter/file/" + renter::encode_path(sync::clean_remote(remote_path));
    auto response = call(network::HttpMethod::GET, target);
    if (response.is_error()) {
        return Err<bool>(response.error());
    }
    if (response.value().is_success()) {
        return Ok(true);
    }

    const auto message = renter::error_message(response.value());
    if (message.find(kNoFileKnown) != std::string::npos || response.value().status_code == 404) {
        return Ok(false);
    }
    return Err<bool>(remote_error(target + ": " + message));
}

} // namespace tiersync::remote
