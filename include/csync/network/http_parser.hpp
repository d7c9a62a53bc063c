#pragma once

#include "csync/core/result.hpp"
#include "csync/network/http_types.hpp"

#include <cctype>
#include <cstddef>
#include <string>

namespace csync::network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF     <- Headers (multiple)
 * CRLF                               <- Empty line
 * [Body]                             <- Content-Length bytes, chunks, or
 *                                       everything until the peer closes
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed bytes as they arrive from the socket. parse() returns true once a
 * full response is available; call finish() when the peer closes the
 * connection so a body delimited by connection close can complete.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser;
 * auto result = parser.parse(buffer.data(), n);
 * if (result.is_ok() && result.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    Result<bool> parse(const char* data, std::size_t len) {
        for (std::size_t i = 0; i < len; ++i) {
            const char c = data[i];

            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);  // trailing bytes after a full response are ignored
            }
            if (state_ == ResponseParseState::PARSE_ERROR) {
                return Err<bool>(Error(ErrorCode::Protocol, "Parser in error state"));
            }

            const ResponseParseState before = state_;
            if (!step(c)) {
                state_ = ResponseParseState::PARSE_ERROR;
                return Err<bool>(Error(ErrorCode::Protocol,
                    "Malformed " + describe(before) + " at line " + std::to_string(line_)));
            }

            if (c == '\n') {
                line_++;
            }
        }
        return Ok(state_ == ResponseParseState::COMPLETE);
    }

    /**
     * @brief Signal that the peer closed the connection
     * @return true when the response is complete, Protocol error otherwise
     */
    Result<bool> finish() {
        if (state_ == ResponseParseState::BODY && until_close_) {
            state_ = ResponseParseState::COMPLETE;
        }
        if (state_ != ResponseParseState::COMPLETE) {
            return Err<bool>(Error(ErrorCode::Protocol,
                "Connection closed before the response was complete (in " + describe(state_) + ")"));
        }
        return Ok(true);
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
        expected_body_ = 0;
        chunk_remaining_ = 0;
        until_close_ = false;
        in_chunk_extension_ = false;
        last_char_was_cr_ = false;
        line_ = 1;
    }

private:
    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    std::size_t expected_body_;
    std::size_t chunk_remaining_;
    bool until_close_;
    bool in_chunk_extension_;
    bool last_char_was_cr_;
    std::size_t line_;

    static std::string describe(ResponseParseState state) {
        switch (state) {
            case ResponseParseState::VERSION: return "HTTP version";
            case ResponseParseState::STATUS_CODE: return "status code";
            case ResponseParseState::REASON: return "reason phrase";
            case ResponseParseState::HEADER_NAME: return "header name";
            case ResponseParseState::HEADER_VALUE: return "header value";
            case ResponseParseState::BODY: return "body";
            case ResponseParseState::CHUNK_SIZE: return "chunk size";
            case ResponseParseState::CHUNK_DATA: return "chunk data";
            case ResponseParseState::CHUNK_DATA_END: return "chunk terminator";
            case ResponseParseState::CHUNK_TRAILER: return "chunk trailer";
            case ResponseParseState::COMPLETE: return "complete response";
            default: return "response";
        }
    }

    bool step(char c) {
        switch (state_) {
            case ResponseParseState::VERSION: return parse_version(c);
            case ResponseParseState::STATUS_CODE: return parse_status_code(c);
            case ResponseParseState::REASON: return parse_reason(c);
            case ResponseParseState::HEADER_NAME: return parse_header_name(c);
            case ResponseParseState::HEADER_VALUE: return parse_header_value(c);
            case ResponseParseState::BODY: return parse_body(c);
            case ResponseParseState::CHUNK_SIZE: return parse_chunk_size(c);
            case ResponseParseState::CHUNK_DATA: return parse_chunk_data(c);
            case ResponseParseState::CHUNK_DATA_END: return parse_chunk_data_end(c);
            case ResponseParseState::CHUNK_TRAILER: return parse_chunk_trailer(c);
            default: return false;
        }
    }

    /**
     * @brief Track CRLF; returns true when @p c completes a line ending
     *
     * Sets @p ok to false on a bare CR or a bare LF.
     */
    bool line_end(char c, bool& ok) {
        ok = true;
        if (c == '\r') {
            if (last_char_was_cr_) {
                ok = false;
            }
            last_char_was_cr_ = true;
            return false;
        }
        if (c == '\n') {
            ok = last_char_was_cr_;
            last_char_was_cr_ = false;
            return ok;
        }
        if (last_char_was_cr_) {
            ok = false;
        }
        return false;
    }

    // "HTTP/1.1 200 OK"
    //  ^-- we're here
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
        if (!std::isgraph(static_cast<unsigned char>(c)) || buffer_.size() >= 8) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    // "HTTP/1.1 200 OK"
    //           ^-- we're here
    bool parse_status_code(char c) {
        bool ok = true;
        const bool eol = line_end(c, ok);
        if (!ok) {
            return false;
        }
        if (c == '\r') {
            return true;
        }
        if (c == ' ' || eol) {
            if (buffer_.size() != 3) {
                return false;
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = eol ? ResponseParseState::HEADER_NAME : ResponseParseState::REASON;
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        bool ok = true;
        if (line_end(c, ok)) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (!ok) {
            return false;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool parse_header_name(char c) {
        bool ok = true;
        if (line_end(c, ok)) {
            // Empty line ends the header block
            return buffer_.empty() && headers_complete();
        }
        if (!ok) {
            return false;
        }
        if (c == '\r') {
            return buffer_.empty();
        }
        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        bool ok = true;
        if (line_end(c, ok)) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (!ok) {
            return false;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    /**
     * @brief Decide how the body is delimited
     */
    bool headers_complete() {
        const int status = response_.status_code;
        if (status == 204 || status == 304 || (status >= 100 && status < 200)) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }

        const std::string encoding = response_.get_header("Transfer-Encoding");
        if (encoding.find("chunked") != std::string::npos) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            std::size_t length = 0;
            for (char d : content_length) {
                if (!std::isdigit(static_cast<unsigned char>(d))) {
                    return false;
                }
                length = length * 10 + static_cast<std::size_t>(d - '0');
            }
            expected_body_ = length;
            if (length == 0) {
                state_ = ResponseParseState::COMPLETE;
                return true;
            }
            response_.body.reserve(length);
            state_ = ResponseParseState::BODY;
            return true;
        }

        until_close_ = true;
        state_ = ResponseParseState::BODY;
        return true;
    }

    bool parse_body(char c) {
        response_.body.push_back(static_cast<std::uint8_t>(c));
        if (!until_close_ && response_.body.size() >= expected_body_) {
            state_ = ResponseParseState::COMPLETE;
        }
        return true;
    }

    // "1a;ext=value\r\n"
    bool parse_chunk_size(char c) {
        bool ok = true;
        if (line_end(c, ok)) {
            if (buffer_.empty()) {
                return false;
            }
            chunk_remaining_ = std::stoul(buffer_, nullptr, 16);
            buffer_.clear();
            in_chunk_extension_ = false;
            state_ = chunk_remaining_ == 0 ? ResponseParseState::CHUNK_TRAILER
                                           : ResponseParseState::CHUNK_DATA;
            return true;
        }
        if (!ok) {
            return false;
        }
        if (c == '\r' || in_chunk_extension_) {
            return true;
        }
        if (c == ';') {
            in_chunk_extension_ = true;
            return true;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c)) || buffer_.size() >= 8) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_chunk_data(char c) {
        response_.body.push_back(static_cast<std::uint8_t>(c));
        if (--chunk_remaining_ == 0) {
            state_ = ResponseParseState::CHUNK_DATA_END;
        }
        return true;
    }

    bool parse_chunk_data_end(char c) {
        bool ok = true;
        if (line_end(c, ok)) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }
        return ok && c == '\r';
    }

    // Trailer headers are read and dropped.
    bool parse_chunk_trailer(char c) {
        bool ok = true;
        if (line_end(c, ok)) {
            if (buffer_.empty()) {
                state_ = ResponseParseState::COMPLETE;
            }
            buffer_.clear();
            return true;
        }
        if (!ok) {
            return false;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }
};

} // namespace csync::network
