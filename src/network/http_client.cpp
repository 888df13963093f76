#include "tiersync/network/http_client.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <functional>
#include <optional>

namespace tiersync {
namespace network {

HttpClient::HttpClient(std::string host, std::string port, std::chrono::milliseconds timeout)
    : host_(std::move(host))
    , port_(std::move(port))
    , timeout_(timeout) {
}

Result<HttpClient> HttpClient::from_address(const std::string& address, std::chrono::milliseconds timeout) {
    std::string host;
    std::string port;

    if (!address.empty() && address.front() == '[') {
        const auto close = address.find(']');
        if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
            return Err<HttpClient>(config_error("Malformed API address: " + address));
        }
        host = address.substr(1, close - 1);
        port = address.substr(close + 2);
    } else {
        const auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            return Err<HttpClient>(config_error("API address needs host:port, got: " + address));
        }
        host = address.substr(0, colon);
        port = address.substr(colon + 1);
    }

    if (host.empty() || port.empty() || port.find_first_not_of("0123456789") != std::string::npos) {
        return Err<HttpClient>(config_error("Malformed API address: " + address));
    }
    if (timeout.count() <= 0) {
        return Err<HttpClient>(config_error("Remote timeout must be positive"));
    }
    return Ok(HttpClient(std::move(host), std::move(port), timeout));
}

std::string HttpClient::host_header() const {
    if (host_.find(':') != std::string::npos) {
        return "[" + host_ + "]:" + port_;
    }
    return host_ + ":" + port_;
}

Result<HttpResponse> HttpClient::send(const HttpRequest& request) const {
    asio::io_context io_context;
    tcp::resolver resolver(io_context);
    tcp::socket socket(io_context);

    HttpResponseParser parser;
    std::array<char, 8192> buffer{};
    const std::vector<uint8_t> wire = request.serialize(host_header());
    const std::string what = HttpMethodUtils::to_string(request.method) + " " + request.target;

    std::optional<Error> failure;
    bool complete = false;

    std::function<void()> do_read;
    do_read = [&]() {
        socket.async_read_some(
            asio::buffer(buffer),
            [&](boost::system::error_code ec, size_t bytes_transferred) {
                if (!ec) {
                    auto parsed = parser.parse(buffer.data(), bytes_transferred);
                    if (parsed.is_error()) {
                        failure = parsed.error();
                    } else if (parsed.value()) {
                        complete = true;
                    } else {
                        do_read();
                    }
                } else if (ec == asio::error::eof) {
                    auto finished = parser.finish();
                    if (finished.is_error()) {
                        failure = finished.error();
                    } else {
                        complete = true;
                    }
                } else if (ec != asio::error::operation_aborted) {
                    failure = remote_error(what + ": read failed: " + ec.message());
                }
            }
        );
    };

    resolver.async_resolve(
        host_, port_,
        [&](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    failure = remote_error("Failed to resolve " + host_ + ": " + ec.message());
                }
                return;
            }
            asio::async_connect(
                socket, endpoints,
                [&](boost::system::error_code connect_ec, const tcp::endpoint&) {
                    if (connect_ec) {
                        if (connect_ec != asio::error::operation_aborted) {
                            failure = remote_error("Failed to connect to " + host_header() + ": " +
                                                   connect_ec.message());
                        }
                        return;
                    }
                    asio::async_write(
                        socket, asio::buffer(wire),
                        [&](boost::system::error_code write_ec, size_t) {
                            if (write_ec) {
                                if (write_ec != asio::error::operation_aborted) {
                                    failure = remote_error(what + ": write failed: " + write_ec.message());
                                }
                                return;
                            }
                            do_read();
                        }
                    );
                }
            );
        }
    );

    io_context.run_for(timeout_);

    if (!complete && !failure) {
        // Deadline hit with work still pending: abort it and let the
        // handlers observe operation_aborted before the locals go away.
        resolver.cancel();
        boost::system::error_code ignored;
        socket.close(ignored);
        io_context.restart();
        io_context.run();
        spdlog::debug("{} timed out after {}ms", what, timeout_.count());
        return Err<HttpResponse>(remote_error(what + ": timed out after " +
                                              std::to_string(timeout_.count()) + "ms"));
    }

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);

    if (failure) {
        return Err<HttpResponse>(*failure);
    }
    return Ok(parser.get_response());
}

} // namespace network
} // namespace tiersync
