#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace tiersync {
namespace network {

/**
 * @brief HTTP request methods used against the renter API
 */
enum class HttpMethod {
    GET,
    POST,
    UNKNOWN
};

/**
 * @brief HTTP version enumeration
 *
 * Requests go out as HTTP/1.0 so the daemon answers with either a
 * Content-Length body or a body terminated by connection close, never a
 * chunked one.
 */
enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

namespace detail {

inline bool iequals(const std::string& lhs, const std::string& rhs) {
    return strcasecmp(lhs.c_str(), rhs.c_str()) == 0;
}

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "HTTP/1.1";
    }
}

} // namespace detail

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief Outgoing HTTP request
 *
 * Wire format:
 * POST /renter/delete/fuse/staging/a.txt HTTP/1.0\r\n
 * Host: 127.0.0.1:9980\r\n
 * User-Agent: Sia-Agent\r\n
 * Content-Length: 0\r\n
 * \r\n
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target;                                   // Path plus query (e.g., "/renter/files")
    HttpVersion version = HttpVersion::HTTP_1_0;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /**
     * @brief Form-encoded body (application/x-www-form-urlencoded)
     */
    void set_form_body(const std::string& encoded) {
        body = encoded;
        headers["Content-Type"] = "application/x-www-form-urlencoded";
    }

    std::vector<uint8_t> serialize(const std::string& host) const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << target << " "
            << detail::version_to_string(version) << "\r\n";
        oss << "Host: " << host << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << body.size() << "\r\n";
        oss << "Connection: close\r\n";
        oss << "\r\n";
        oss << body;

        const std::string wire = oss.str();
        return std::vector<uint8_t>(wire.begin(), wire.end());
    }
};

/**
 * @brief Parsed HTTP response
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Case-insensitive header lookup, empty when absent
     */
    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (detail::iequals(key, name)) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (detail::iequals(key, name)) {
                return true;
            }
        }
        return false;
    }

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

} // namespace network
} // namespace tiersync
