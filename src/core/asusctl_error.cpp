#include "core/asusctl_error.hpp"

#include <utility>

namespace asusctl {
namespace {
std::string message_for(AsusctlError::Kind kind, const std::string& detail) {
    switch (kind) {
        case AsusctlError::Kind::NotInstalled:
            return "asusctl is not installed";
        case AsusctlError::Kind::ServiceNotRunning:
            return "asusd service is not running";
        case AsusctlError::Kind::CommandFailed:
            return "Command failed: " + detail;
        case AsusctlError::Kind::ParseError:
            return "Parse error: " + detail;
        case AsusctlError::Kind::OutOfRange:
            return "Value out of range: " + detail;
    }
    return detail;
}
}

AsusctlError::AsusctlError(Kind kind, std::string detail)
    : std::runtime_error(message_for(kind, detail)),
      m_kind(kind),
      m_detail(std::move(detail)) {}

AsusctlError AsusctlError::not_installed() {
    return AsusctlError(Kind::NotInstalled, "");
}

AsusctlError AsusctlError::service_not_running() {
    return AsusctlError(Kind::ServiceNotRunning, "");
}

AsusctlError AsusctlError::command_failed(const std::string& detail) {
    return AsusctlError(Kind::CommandFailed, detail);
}

AsusctlError AsusctlError::parse_error(const std::string& detail) {
    return AsusctlError(Kind::ParseError, detail);
}

AsusctlError AsusctlError::out_of_range(const std::string& detail) {
    return AsusctlError(Kind::OutOfRange, detail);
}

const char* kind_name(AsusctlError::Kind kind) {
    switch (kind) {
        case AsusctlError::Kind::NotInstalled: return "not-installed";
        case AsusctlError::Kind::ServiceNotRunning: return "service-not-running";
        case AsusctlError::Kind::CommandFailed: return "command-failed";
        case AsusctlError::Kind::ParseError: return "parse-error";
        case AsusctlError::Kind::OutOfRange: return "out-of-range";
    }
    return "unknown";
}

}  // namespace asusctl
