#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace csync::network {

/**
 * @brief HTTP request methods the client sends
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // avoids the Windows DELETE macro
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

inline std::string method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE_METHOD: return "DELETE";
        default: return "UNKNOWN";
    }
}

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        default: return "HTTP/1.1";
    }
}

// Headers are stored as given; lookups ignore case (RFC 7230).
using HttpHeaders = std::unordered_map<std::string, std::string>;

inline std::string find_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

/**
 * @brief Outgoing HTTP/1.1 request
 *
 * Wire format:
 * POST /api/services/automation/reload HTTP/1.1
 * Host: homeassistant.local:8123
 * Authorization: Bearer ...
 * Content-Length: 0
 *
 * [body]
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target = "/";
    HttpVersion version = HttpVersion::HTTP_1_1;
    HttpHeaders headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
    }

    /**
     * @brief Serialize to the bytes written to the socket
     *
     * Content-Length always reflects the body, so a POST without a body
     * still carries "Content-Length: 0".
     */
    std::string serialize() const {
        std::ostringstream oss;
        oss << method_to_string(method) << ' ' << target << ' ' << version_to_string(version) << "\r\n";
        for (const auto& [name, value] : headers) {
            if (strcasecmp(name.c_str(), "Content-Length") == 0) {
                continue;
            }
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << body.size() << "\r\n";
        oss << "\r\n";
        oss.write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
        return oss.str();
    }
};

/**
 * @brief Parsed HTTP response
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;
    HttpHeaders headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

} // namespace csync::network
