#pragma once

#include "tiersync/core/result.hpp"
#include "tiersync/network/http_types.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace tiersync {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF  <- Status line
 * Header-Name: Header-Value CRLF    <- Headers (multiple)
 * CRLF                              <- Empty line
 * [Body]                            <- Content-Length bytes, or until close
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    BODY_UNTIL_CLOSE,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed bytes as they arrive from the socket. parse() returns true once the
 * response is complete. When the peer closes the connection call finish():
 * a body without Content-Length ends there.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser;
 * auto result = parser.parse(buffer.data(), bytes_read);
 * if (result.is_ok() && result.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * ```
 *
 * Chunked transfer encoding is rejected; requests are sent as HTTP/1.0 so a
 * conforming server never chooses it.
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            const char c = data[i];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ResponseParseState::VERSION:
                    ok = parse_version(c);
                    break;
                case ResponseParseState::STATUS_CODE:
                    ok = parse_status_code(c);
                    break;
                case ResponseParseState::REASON:
                    ok = parse_reason(c);
                    break;
                case ResponseParseState::HEADER_NAME:
                    ok = parse_header_name(c);
                    break;
                case ResponseParseState::HEADER_VALUE:
                    ok = parse_header_value(c);
                    break;
                case ResponseParseState::BODY:
                    parse_body(c);
                    break;
                case ResponseParseState::BODY_UNTIL_CLOSE:
                    response_.body.push_back(static_cast<uint8_t>(c));
                    break;
                case ResponseParseState::COMPLETE:
                    // Trailing bytes after a complete response are ignored
                    return Ok(true);
                case ResponseParseState::PARSE_ERROR:
                    return Err<bool>(remote_error("Response parser in error state"));
            }

            if (!ok) {
                state_ = ResponseParseState::PARSE_ERROR;
                return Err<bool>(remote_error("Malformed HTTP response at line " + std::to_string(line_)));
            }

            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }
        }

        return Ok(false);
    }

    /**
     * @brief Signal end of stream
     *
     * Returns true when the bytes seen so far form a complete response.
     */
    Result<bool> finish() {
        if (state_ == ResponseParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
            state_ = ResponseParseState::COMPLETE;
            return Ok(true);
        }
        if (state_ == ResponseParseState::BODY) {
            return Err<bool>(remote_error("Connection closed after " + std::to_string(body_bytes_read_) +
                                          " of " + std::to_string(expected_body_) + " body bytes"));
        }
        return Err<bool>(remote_error("Connection closed before response headers completed"));
    }

    HttpResponse get_response() const {
        return response_;
    }

    bool is_complete() const {
        return state_ == ResponseParseState::COMPLETE;
    }

    void reset() {
        state_ = ResponseParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        body_bytes_read_ = 0;
        expected_body_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;                // Current token
    std::string current_header_name_;
    size_t body_bytes_read_;
    size_t expected_body_;
    size_t line_;
    bool last_char_was_cr_;

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ == "HTTP/1.1") {
                response_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                response_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            state_ = ResponseParseState::STATUS_CODE;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c)) || buffer_.size() > 8) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return false;
            }
            response_.status_code = std::atoi(buffer_.c_str());
            buffer_.clear();
            state_ = ResponseParseState::REASON;
            last_char_was_cr_ = (c == '\r');
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool begin_body() {
        const auto encoding = response_.get_header("Transfer-Encoding");
        if (!encoding.empty() && !detail::iequals(encoding, "identity")) {
            return false;
        }

        // 1xx, 204 and 304 never carry a body
        const int status = response_.status_code;
        if ((status >= 100 && status < 200) || status == 204 || status == 304) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }

        const auto content_length = response_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ResponseParseState::BODY_UNTIL_CLOSE;
            return true;
        }

        for (char digit : content_length) {
            if (!std::isdigit(static_cast<unsigned char>(digit))) {
                return false;
            }
        }
        expected_body_ = static_cast<size_t>(std::strtoull(content_length.c_str(), nullptr, 10));
        if (expected_body_ == 0) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }
        response_.body.reserve(expected_body_);
        state_ = ResponseParseState::BODY;
        return true;
    }

    void parse_body(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        body_bytes_read_++;
        if (body_bytes_read_ >= expected_body_) {
            state_ = ResponseParseState::COMPLETE;
        }
    }
};

} // namespace network
} // namespace tiersync
