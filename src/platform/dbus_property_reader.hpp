#ifndef PLATFORM_DBUS_PROPERTY_READER_HPP
#define PLATFORM_DBUS_PROPERTY_READER_HPP

#include "platform/process_runner.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace asusctl {

// Reads single properties through `busctl get-property`. The reply is the
// type signature and the value joined by a space, e.g. "b true" or "y 80".
class DbusPropertyReader {
public:
    DbusPropertyReader(std::shared_ptr<const ProcessRunner> runner, std::string busctl_binary,
                       std::string destination);

    std::string read_property(const std::string& object_path, const std::string& interface_name,
                              const std::string& property_name) const;

private:
    std::shared_ptr<const ProcessRunner> m_runner;
    std::string m_busctl_binary;
    std::string m_destination;
};

bool decode_dbus_bool(const std::string& reply);
uint8_t decode_dbus_byte(const std::string& reply);
uint32_t decode_dbus_uint(const std::string& reply);

}  // namespace asusctl

#endif
