#include "meshcast/Error.hpp"

namespace meshcast {

namespace {
std::string format_error(const std::string& code, const std::string& message) {
    return code.empty() ? message : ("[" + code + "] " + message);
}
}  // namespace

std::string_view error_kind_to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transport:
            return "transport";
        case ErrorKind::Negotiation:
            return "negotiation";
        case ErrorKind::Resource:
            return "resource";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::Config:
            return "config";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, std::string code, std::string message, std::string hint)
    : std::runtime_error(format_error(code, message)),
      kind_(kind),
      code_(std::move(code)),
      message_(std::move(message)),
      hint_(std::move(hint)) {}

}  // namespace meshcast
