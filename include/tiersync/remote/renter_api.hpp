#pragma once

#include "tiersync/core/result.hpp"
#include "tiersync/network/http_types.hpp"
#include "tiersync/sync/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace tiersync::remote::renter {

/**
 * @brief Percent-encode a remote path for use in a URL, keeping '/' separators
 */
std::string encode_path(const std::string& remote_path);

/**
 * @brief application/x-www-form-urlencoded body from key/value pairs
 */
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);

std::string base64_encode(const std::string& input);

/**
 * @brief Decode GET /renter/files
 *
 * {"files":[{"siapath":"fuse/staging/a.txt","filesize":10, ...}]}
 */
Result<std::vector<sync::RemoteFile>> parse_files(const std::string& body);

/**
 * @brief Decode GET /renter/dir/<siapath>
 *
 * {"directories":[{"siapath":"fuse/staging","aggregateminredundancy":1.5, ...}, ...]}
 * The first directory is the queried one; order is preserved.
 */
Result<std::vector<sync::DirectoryHealth>> parse_directory(const std::string& body);

/**
 * @brief Human-readable error for a non-2xx reply
 *
 * Uses the JSON "message" field when the body carries one.
 */
std::string error_message(const network::HttpResponse& response);

} // namespace tiersync::remote::renter
