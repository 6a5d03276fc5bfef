#ifndef CORE_BACKEND_CONFIG_HPP
#define CORE_BACKEND_CONFIG_HPP

#include <string>

namespace asusctl {

// External names the backend talks to. Defaults match a stock asusd install.
struct BackendConfig {
    std::string asusctl_binary = "asusctl";
    std::string busctl_binary = "busctl";
    std::string power_profiles_binary = "powerprofilesctl";

    std::string dbus_destination = "xyz.ljones.Asusd";

    std::string platform_path = "/xyz/ljones";
    std::string platform_interface = "xyz.ljones.Platform";

    std::string aura_path = "/xyz/ljones/aura/19b6_4_4";
    std::string aura_interface = "xyz.ljones.Aura";

    std::string slash_path = "/xyz/ljones/aura/193b_5_5";
    std::string slash_interface = "xyz.ljones.Slash";

    std::string slash_config_path = "/etc/asusd/slash.ron";
};

std::string default_backend_config_path();

// Overlays the [backend] group of a key file on the defaults. A missing file
// yields the defaults; an unreadable one yields the defaults plus a warning.
BackendConfig load_backend_config(const std::string& path);

}  // namespace asusctl

#endif
