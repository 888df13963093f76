#pragma once

#include "tiersync/core/result.hpp"
#include "tiersync/network/http_response_parser.hpp"
#include "tiersync/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <string>

namespace tiersync {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Blocking HTTP/1.0 client with a per-request deadline
 *
 * Each send() drives its own io_context: resolve, connect, write the
 * request, then read until the response parser reports completion or the
 * peer closes. The whole exchange is bounded by the timeout given at
 * construction; on expiry the socket is closed, the pending handlers drain
 * with operation_aborted and the call returns ErrorKind::Remote.
 *
 * Thread safety:
 * - send() keeps no shared state, so concurrent calls from the event
 *   dispatcher and the promotion scheduler are fine
 */
class HttpClient {
public:
    HttpClient(std::string host, std::string port, std::chrono::milliseconds timeout);

    /**
     * @brief Build a client from "host:port" (IPv6 as "[::1]:9980")
     */
    static Result<HttpClient> from_address(const std::string& address, std::chrono::milliseconds timeout);

    Result<HttpResponse> send(const HttpRequest& request) const;

    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string host_header() const;

    std::string host_;
    std::string port_;
    std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace tiersync
