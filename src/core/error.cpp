#include "csync/core/error.hpp"

namespace csync {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Config: return "ConfigError";
        case ErrorCode::Access: return "AccessError";
        case ErrorCode::Traversal: return "TraversalError";
        case ErrorCode::Transfer: return "TransferError";
        case ErrorCode::Network: return "NetworkError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Connection: return "ConnectionError";
        case ErrorCode::Protocol: return "ProtocolError";
    }
    return "Error";
}

std::string Error::describe() const {
    return std::string(to_string(code)) + ": " + message;
}

} // namespace csync
