#include "platform/dbus_property_reader.hpp"

#include "core/asusctl_error.hpp"
#include "core/text_utils.hpp"

#include <glibmm/error.h>

#include <utility>

namespace asusctl {

DbusPropertyReader::DbusPropertyReader(std::shared_ptr<const ProcessRunner> runner,
                                       std::string busctl_binary, std::string destination)
    : m_runner(std::move(runner)),
      m_busctl_binary(std::move(busctl_binary)),
      m_destination(std::move(destination)) {}

std::string DbusPropertyReader::read_property(const std::string& object_path,
                                              const std::string& interface_name,
                                              const std::string& property_name) const {
    ProcessOutput output;
    try {
        output = m_runner->run(m_busctl_binary, {"get-property", m_destination, object_path,
                                                 interface_name, property_name});
    } catch (const Glib::Error& e) {
        throw AsusctlError::command_failed(std::string("busctl failed: ") + e.what());
    }

    if (output.exit_status != 0) {
        const std::string& stderr_text = output.standard_error;
        if (stderr_text.find("No such") != std::string::npos ||
            stderr_text.find("not found") != std::string::npos) {
            throw AsusctlError::service_not_running();
        }
        throw AsusctlError::command_failed(stderr_text);
    }

    return trim_copy(output.standard_output);
}

bool decode_dbus_bool(const std::string& reply) {
    auto value = strip_prefix(reply, "b ");
    if (!value) {
        throw AsusctlError::parse_error("Expected boolean, got: " + reply);
    }
    if (*value == "true") {
        return true;
    }
    if (*value == "false") {
        return false;
    }
    throw AsusctlError::parse_error("Invalid boolean value: " + *value);
}

uint8_t decode_dbus_byte(const std::string& reply) {
    auto value = strip_prefix(reply, "y ");
    if (!value) {
        throw AsusctlError::parse_error("Expected byte, got: " + reply);
    }
    auto parsed = parse_unsigned(*value);
    if (!parsed || *parsed > 255) {
        throw AsusctlError::parse_error("Invalid byte value: " + *value);
    }
    return static_cast<uint8_t>(*parsed);
}

uint32_t decode_dbus_uint(const std::string& reply) {
    auto value = strip_prefix(reply, "u ");
    if (!value) {
        throw AsusctlError::parse_error("Expected uint, got: " + reply);
    }
    auto parsed = parse_unsigned(*value);
    if (!parsed) {
        throw AsusctlError::parse_error("Invalid uint value: " + *value);
    }
    return *parsed;
}

}  // namespace asusctl
