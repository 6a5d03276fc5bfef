#ifndef FEATURES_DEVICE_CONTROLLER_HPP
#define FEATURES_DEVICE_CONTROLLER_HPP

#include "core/models.hpp"
#include "platform/asusctl_backend.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace asusctl::features {

// Everything a settings page shows. A field stays empty when its read failed;
// the failure is listed in `errors` as "<field>: <message>".
struct DeviceSnapshot {
    std::optional<SystemInfo> system_info;
    std::optional<SupportedFeatures> supported_features;
    std::optional<KeyboardBrightness> keyboard_brightness;
    std::optional<ProfileState> profile_state;
    std::optional<uint8_t> charge_limit;
    std::optional<SlashState> slash_state;
    std::map<SlashEvent, bool> slash_show;
    std::vector<std::string> errors;
};

struct ApplyResult {
    bool ok = false;
    std::string message;
};

class DeviceController {
public:
    explicit DeviceController(AsusctlBackend backend = AsusctlBackend());

    DeviceSnapshot load_snapshot() const;

    ApplyResult apply_keyboard_brightness(KeyboardBrightness level) const;
    ApplyResult apply_profile(PowerProfile profile) const;
    ApplyResult apply_charge_limit(uint8_t limit) const;
    ApplyResult apply_slash_enabled(bool enabled) const;
    ApplyResult apply_slash_brightness(uint8_t brightness) const;
    ApplyResult apply_slash_mode(SlashMode mode) const;
    ApplyResult apply_slash_interval(uint8_t interval) const;
    ApplyResult apply_slash_show(SlashEvent event, bool value) const;

private:
    AsusctlBackend m_backend;
};

}  // namespace asusctl::features

#endif
