#pragma once

#include "csync/core/result.hpp"
#include "csync/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace csync::network {

/**
 * @brief Parsed http:// endpoint
 *
 * base_path never ends with '/', so "{base_path}/api/..." is always a valid
 * request target.
 */
struct Url {
    std::string scheme;
    std::string host;
    std::uint16_t port = 80;
    std::string base_path;

    /// Value for the Host header ("host" or "host:port").
    std::string authority() const;
};

/**
 * @brief Split "http://host[:port][/path]" into its parts
 *
 * Only plain http is supported; any other scheme, a missing host or an
 * invalid port is a Config error.
 */
Result<Url> parse_url(const std::string& text);

/**
 * @brief One request/response exchange with an HTTP server
 *
 * Errors: Timeout when no full response arrived in time, Connection when the
 * server cannot be reached, Protocol when the response is malformed.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const Url& server,
                                      const HttpRequest& request,
                                      std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief HttpTransport on Boost.Asio
 *
 * Each send() owns a private io_context: resolve, connect, write the
 * request, read until the response parser completes, all bounded by
 * io_context::run_for(timeout). The connection is closed afterwards.
 */
class AsioHttpClient : public HttpTransport {
public:
    Result<HttpResponse> send(const Url& server,
                              const HttpRequest& request,
                              std::chrono::milliseconds timeout) override;
};

} // namespace csync::network
