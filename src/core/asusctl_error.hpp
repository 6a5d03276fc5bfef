#ifndef CORE_ASUSCTL_ERROR_HPP
#define CORE_ASUSCTL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace asusctl {

// Single error currency of the backend. what() is the user-facing text.
class AsusctlError : public std::runtime_error {
public:
    enum class Kind {
        NotInstalled,
        ServiceNotRunning,
        CommandFailed,
        ParseError,
        OutOfRange
    };

    static AsusctlError not_installed();
    static AsusctlError service_not_running();
    static AsusctlError command_failed(const std::string& detail);
    static AsusctlError parse_error(const std::string& detail);
    static AsusctlError out_of_range(const std::string& detail);

    Kind kind() const noexcept { return m_kind; }
    const std::string& detail() const noexcept { return m_detail; }

private:
    AsusctlError(Kind kind, std::string detail);

    Kind m_kind;
    std::string m_detail;
};

const char* kind_name(AsusctlError::Kind kind);

}  // namespace asusctl

#endif
