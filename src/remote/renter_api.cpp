#include "tiersync/remote/renter_api.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace tiersync::remote::renter {
namespace {

using json = nlohmann::json;

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string percent_encode(const std::string& text, bool keep_slash) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : text) {
        if (is_unreserved(c) || (keep_slash && c == '/')) {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string siapath_of(const json& entry) {
    const auto it = entry.find("siapath");
    if (it == entry.end() || it->is_null()) {
        return {};
    }
    // Older daemons serialize the siapath as {"path": "..."}
    if (it->is_object()) {
        return it->value("path", std::string{});
    }
    return it->get<std::string>();
}

} // namespace

std::string encode_path(const std::string& remote_path) {
    return percent_encode(remote_path, true);
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string body;
    for (const auto& [key, value] : fields) {
        if (!body.empty()) {
            body += '&';
        }
        body += percent_encode(key, false);
        body += '=';
        body += percent_encode(value, false);
    }
    return body;
}

std::string base64_encode(const std::string& input) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < input.size()) {
        const std::uint32_t triple = (static_cast<unsigned char>(input[i]) << 16) |
                                     (static_cast<unsigned char>(input[i + 1]) << 8) |
                                     static_cast<unsigned char>(input[i + 2]);
        out += alphabet[(triple >> 18) & 0x3F];
        out += alphabet[(triple >> 12) & 0x3F];
        out += alphabet[(triple >> 6) & 0x3F];
        out += alphabet[triple & 0x3F];
        i += 3;
    }

    const std::size_t rest = input.size() - i;
    if (rest == 1) {
        const std::uint32_t single = static_cast<unsigned char>(input[i]) << 16;
        out += alphabet[(single >> 18) & 0x3F];
        out += alphabet[(single >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t pair = (static_cast<unsigned char>(input[i]) << 16) |
                                   (static_cast<unsigned char>(input[i + 1]) << 8);
        out += alphabet[(pair >> 18) & 0x3F];
        out += alphabet[(pair >> 12) & 0x3F];
        out += alphabet[(pair >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

Result<std::vector<sync::RemoteFile>> parse_files(const std::string& body) {
    auto payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Err<std::vector<sync::RemoteFile>>(remote_error("Invalid JSON in file listing"));
    }

    std::vector<sync::RemoteFile> files;
    const auto it = payload.find("files");
    if (it == payload.end() || it->is_null()) {
        return Ok(files);
    }
    if (!it->is_array()) {
        return Err<std::vector<sync::RemoteFile>>(remote_error("File listing \"files\" is not an array"));
    }

    try {
        for (const auto& entry : *it) {
            sync::RemoteFile file;
            file.remote_path = siapath_of(entry);
            file.size = entry.value("filesize", static_cast<std::uint64_t>(0));
            if (!file.remote_path.empty()) {
                files.push_back(std::move(file));
            }
        }
    } catch (const json::exception& e) {
        return Err<std::vector<sync::RemoteFile>>(remote_error(std::string("Malformed file listing: ") + e.what()));
    }
    return Ok(files);
}

Result<std::vector<sync::DirectoryHealth>> parse_directory(const std::string& body) {
    auto payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Err<std::vector<sync::DirectoryHealth>>(remote_error("Invalid JSON in directory reply"));
    }

    std::vector<sync::DirectoryHealth> directories;
    const auto it = payload.find("directories");
    if (it == payload.end() || it->is_null()) {
        return Ok(directories);
    }
    if (!it->is_array()) {
        return Err<std::vector<sync::DirectoryHealth>>(remote_error("Directory reply \"directories\" is not an array"));
    }

    try {
        for (const auto& entry : *it) {
            sync::DirectoryHealth health;
            health.remote_path = siapath_of(entry);
            health.aggregate_min_redundancy = entry.value("aggregateminredundancy", 0.0);
            directories.push_back(std::move(health));
        }
    } catch (const json::exception& e) {
        return Err<std::vector<sync::DirectoryHealth>>(remote_error(std::string("Malformed directory reply: ") + e.what()));
    }
    return Ok(directories);
}

std::string error_message(const network::HttpResponse& response) {
    const std::string status = "HTTP " + std::to_string(response.status_code);
    auto payload = json::parse(response.body_as_string(), nullptr, false);
    if (!payload.is_discarded() && payload.is_object()) {
        const auto it = payload.find("message");
        if (it != payload.end() && it->is_string()) {
            return status + ": " + it->get<std::string>();
        }
    }
    if (!response.reason_phrase.empty()) {
        return status + " " + response.reason_phrase;
    }
    return status;
}

} // namespace tiersync::remote::renter
