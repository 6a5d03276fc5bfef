#include "core/backend_config.hpp"

#include <glibmm/fileutils.h>
#include <glibmm/keyfile.h>
#include <glibmm/miscutils.h>

#include <iostream>
#include <utility>
#include <vector>

namespace asusctl {
namespace {
const char* const GROUP = "backend";

void overlay(const Glib::RefPtr<Glib::KeyFile>& key_file, const char* key, std::string& field) {
    if (key_file->has_key(GROUP, key)) {
        field = key_file->get_string(GROUP, key);
    }
}
}

std::string default_backend_config_path() {
    return Glib::build_filename(Glib::get_user_config_dir(), "asusctl-panel", "backend.ini");
}

BackendConfig load_backend_config(const std::string& path) {
    BackendConfig config;
    if (!Glib::file_test(path, Glib::FileTest::EXISTS)) {
        return config;
    }

    auto key_file = Glib::KeyFile::create();
    try {
        key_file->load_from_file(path);
        if (!key_file->has_group(GROUP)) {
            return config;
        }

        const std::vector<std::pair<const char*, std::string*>> fields = {
            {"asusctl_binary", &config.asusctl_binary},
            {"busctl_binary", &config.busctl_binary},
            {"power_profiles_binary", &config.power_profiles_binary},
            {"dbus_destination", &config.dbus_destination},
            {"platform_path", &config.platform_path},
            {"platform_interface", &config.platform_interface},
            {"aura_path", &config.aura_path},
            {"aura_interface", &config.aura_interface},
            {"slash_path", &config.slash_path},
            {"slash_interface", &config.slash_interface},
            {"slash_config_path", &config.slash_config_path},
        };
        for (const auto& field : fields) {
            overlay(key_file, field.first, *field.second);
        }
    } catch (const Glib::Error& e) {
        std::cerr << "[asusctl-panel] Ignoring backend config " << path << ": " << e.what() << '\n';
        return BackendConfig();
    }

    return config;
}

}  // namespace asusctl
