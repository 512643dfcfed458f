#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace meshcast {

enum class ErrorKind {
    Transport,
    Negotiation,
    Resource,
    Timeout,
    Config
};

std::string_view error_kind_to_string(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string code, std::string message, std::string hint = {});

    ErrorKind kind() const noexcept {
        return kind_;
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    ErrorKind kind_;
    std::string code_;
    std::string message_;
    std::string hint_;
};

// Send or receive failure at the broadcast layer.
class TransportError : public Error {
public:
    TransportError(std::string code, std::string message)
        : Error(ErrorKind::Transport, std::move(code), std::move(message)) {}
};

// Raised by negotiation engines; never escapes SignalingSession.
class NegotiationError : public Error {
public:
    explicit NegotiationError(std::string message)
        : Error(ErrorKind::Negotiation, "E_NEGOTIATION", std::move(message)) {}
};

class ResourceError : public Error {
public:
    ResourceError(std::string code, std::string message, std::string hint = {})
        : Error(ErrorKind::Resource, std::move(code), std::move(message), std::move(hint)) {}
};

class TimeoutError : public Error {
public:
    TimeoutError(std::string code, std::string message, std::string hint = {})
        : Error(ErrorKind::Timeout, std::move(code), std::move(message), std::move(hint)) {}
};

class ConfigError : public Error {
public:
    ConfigError(std::string code, std::string message, std::string hint = {})
        : Error(ErrorKind::Config, std::move(code), std::move(message), std::move(hint)) {}
};

}  // namespace meshcast
