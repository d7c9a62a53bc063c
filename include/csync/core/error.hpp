#pragma once

#include <string>

namespace csync {

/**
 * @brief Failure categories surfaced by the sync engine and its adapters
 *
 * Config, Access, Traversal and Transfer are fatal for a sync call.
 * Network, Timeout, Connection and Protocol only come out of the reload
 * notifier and are reported per service.
 */
enum class ErrorCode {
    Config,     ///< malformed rule pattern, empty rule set, missing credential
    Access,     ///< unreadable entry or missing root during a scan
    Traversal,  ///< symlink escaping the scanned root, or a link cycle
    Transfer,   ///< transfer primitive failed without per-path detail
    Network,
    Timeout,
    Connection,
    Protocol    ///< malformed HTTP response
};

struct Error {
    ErrorCode code = ErrorCode::Config;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] std::string describe() const;
};

const char* to_string(ErrorCode code) noexcept;

inline Error config_error(std::string message) {
    return Error(ErrorCode::Config, std::move(message));
}

inline Error access_error(std::string message) {
    return Error(ErrorCode::Access, std::move(message));
}

inline Error traversal_error(std::string message) {
    return Error(ErrorCode::Traversal, std::move(message));
}

inline Error transfer_error(std::string message) {
    return Error(ErrorCode::Transfer, std::move(message));
}

} // namespace csync
