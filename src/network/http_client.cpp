#include "csync/network/http_client.hpp"
#include "csync/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <functional>
#include <optional>

namespace csync::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

std::string Url::authority() const {
    const bool ipv6 = host.find(':') != std::string::npos;
    std::string text = ipv6 ? "[" + host + "]" : host;
    if (port != 80) {
        text += ":" + std::to_string(port);
    }
    return text;
}

Result<Url> parse_url(const std::string& text) {
    static const std::string kScheme = "http://";

    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(config_error("invalid URL (expected http://host[:port]): " + text));
    }
    if (text.compare(0, kScheme.size(), kScheme) != 0) {
        return Err<Url>(config_error("unsupported URL scheme '" + text.substr(0, scheme_end) +
                                     "', only http:// is supported"));
    }

    Url url;
    url.scheme = "http";

    const std::string rest = text.substr(kScheme.size());
    const auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        url.base_path = rest.substr(path_start);
        while (!url.base_path.empty() && url.base_path.back() == '/') {
            url.base_path.pop_back();
        }
    }

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Url>(config_error("unterminated IPv6 address in URL: " + text));
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Err<Url>(config_error("invalid URL authority: " + text));
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.find(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        return Err<Url>(config_error("URL has no host: " + text));
    }

    if (!port_text.empty()) {
        unsigned long port = 0;
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c)) || port > 65535) {
                return Err<Url>(config_error("invalid port in URL: " + text));
            }
            port = port * 10 + static_cast<unsigned long>(c - '0');
        }
        if (port == 0 || port > 65535) {
            return Err<Url>(config_error("invalid port in URL: " + text));
        }
        url.port = static_cast<std::uint16_t>(port);
    }

    return Ok(std::move(url));
}

Result<HttpResponse> AsioHttpClient::send(const Url& server,
                                          const HttpRequest& request,
                                          std::chrono::milliseconds timeout) {
    HttpRequest outgoing = request;
    if (!outgoing.has_header("Host")) {
        outgoing.set_header("Host", server.authority());
    }
    outgoing.set_header("Connection", "close");
    const std::string wire = outgoing.serialize();

    asio::io_context io_context;
    tcp::resolver resolver(io_context);
    tcp::socket socket(io_context);
    HttpResponseParser parser;
    std::array<char, 8192> buffer{};
    std::optional<Error> failure;
    bool complete = false;

    std::function<void()> do_read = [&]() {
        socket.async_read_some(
            asio::buffer(buffer),
            [&](boost::system::error_code ec, std::size_t bytes_transferred) {
                if (!ec) {
                    auto parsed = parser.parse(buffer.data(), bytes_transferred);
                    if (parsed.is_error()) {
                        failure = parsed.error();
                    } else if (parsed.value()) {
                        complete = true;
                    } else {
                        do_read();  // need more data
                    }
                    return;
                }
                if (ec == asio::error::eof) {
                    auto finished = parser.finish();
                    if (finished.is_error()) {
                        failure = finished.error();
                    } else {
                        complete = true;
                    }
                    return;
                }
                failure = Error(ErrorCode::Connection, "read from " + server.authority() + " failed: " + ec.message());
            });
    };

    resolver.async_resolve(
        server.host, std::to_string(server.port),
        [&](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) {
                failure = Error(ErrorCode::Connection, "cannot resolve " + server.host + ": " + ec.message());
                return;
            }
            asio::async_connect(
                socket, endpoints,
                [&](boost::system::error_code connect_ec, const tcp::endpoint&) {
                    if (connect_ec) {
                        failure = Error(ErrorCode::Connection,
                                        "cannot connect to " + server.authority() + ": " + connect_ec.message());
                        return;
                    }
                    asio::async_write(
                        socket, asio::buffer(wire),
                        [&](boost::system::error_code write_ec, std::size_t bytes_written) {
                            if (write_ec) {
                                failure = Error(ErrorCode::Connection,
                                                "write to " + server.authority() + " failed: " + write_ec.message());
                                return;
                            }
                            spdlog::debug("Sent {} bytes to {}", bytes_written, server.authority());
                            do_read();
                        });
                });
        });

    io_context.run_for(timeout);

    resolver.cancel();
    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);

    if (failure) {
        return Err<HttpResponse>(*failure);
    }
    if (!complete) {
        return Err<HttpResponse>(Error(ErrorCode::Timeout,
            "no response from " + server.authority() + " within " + std::to_string(timeout.count()) + "ms"));
    }

    HttpResponse response = parser.get_response();
    spdlog::debug("{} {} -> {}", method_to_string(outgoing.method), outgoing.target, response.status_code);
    return Ok(std::move(response));
}

} // namespace csync::network
