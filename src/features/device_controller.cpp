#include "features/device_controller.hpp"

#include "core/asusctl_error.hpp"

#include <utility>

namespace asusctl::features {
namespace {
const SlashEvent SLASH_EVENTS[] = {SlashEvent::Boot, SlashEvent::Shutdown, SlashEvent::Sleep,
                                   SlashEvent::Battery, SlashEvent::BatteryWarning};

template <typename T, typename Read>
void load_field(std::optional<T>& field, const char* name, std::vector<std::string>& errors,
                Read read) {
    try {
        field = read();
    } catch (const AsusctlError& e) {
        errors.push_back(std::string(name) + ": " + e.what());
    }
}

template <typename Write>
ApplyResult run_write(const std::string& what, Write write) {
    try {
        write();
    } catch (const AsusctlError& e) {
        return {false, e.what()};
    }
    return {true, "Applied " + what};
}
}

DeviceController::DeviceController(AsusctlBackend backend)
    : m_backend(std::move(backend)) {}

DeviceSnapshot DeviceController::load_snapshot() const {
    DeviceSnapshot snapshot;
    auto& errors = snapshot.errors;

    load_field(snapshot.system_info, "system info", errors,
               [this] { return m_backend.get_system_info(); });
    load_field(snapshot.supported_features, "supported features", errors,
               [this] { return m_backend.get_supported_features(); });
    load_field(snapshot.keyboard_brightness, "keyboard brightness", errors,
               [this] { return m_backend.get_keyboard_brightness(); });
    load_field(snapshot.profile_state, "profile", errors,
               [this] { return m_backend.get_profile_state(); });
    load_field(snapshot.charge_limit, "charge limit", errors,
               [this] { return m_backend.get_charge_limit(); });
    load_field(snapshot.slash_state, "slash", errors,
               [this] { return m_backend.get_slash_state(); });

    for (SlashEvent event : SLASH_EVENTS) {
        std::optional<bool> value;
        load_field(value, slash_event_property(event).c_str(), errors,
                   [this, event] { return m_backend.get_slash_show(event); });
        if (value) {
            snapshot.slash_show[event] = *value;
        }
    }

    return snapshot;
}

ApplyResult DeviceController::apply_keyboard_brightness(KeyboardBrightness level) const {
    return run_write("keyboard brightness " + to_string(level),
                 [&] { m_backend.set_keyboard_brightness(level); });
}

ApplyResult DeviceController::apply_profile(PowerProfile profile) const {
    return run_write("power profile " + to_string(profile), [&] { m_backend.set_profile(profile); });
}

ApplyResult DeviceController::apply_charge_limit(uint8_t limit) const {
    return run_write("charge limit " + std::to_string(limit),
                 [&] { m_backend.set_charge_limit(limit); });
}

ApplyResult DeviceController::apply_slash_enabled(bool enabled) const {
    return run_write(enabled ? "slash enable" : "slash disable",
                 [&] { m_backend.set_slash_enabled(enabled); });
}

ApplyResult DeviceController::apply_slash_brightness(uint8_t brightness) const {
    return run_write("slash brightness " + std::to_string(brightness),
                 [&] { m_backend.set_slash_brightness(brightness); });
}

ApplyResult DeviceController::apply_slash_mode(SlashMode mode) const {
    return run_write("slash mode " + to_string(mode), [&] { m_backend.set_slash_mode(mode); });
}

ApplyResult DeviceController::apply_slash_interval(uint8_t interval) const {
    return run_write("slash interval " + std::to_string(interval),
                 [&] { m_backend.set_slash_interval(interval); });
}

ApplyResult DeviceController::apply_slash_show(SlashEvent event, bool value) const {
    return run_write(slash_event_flag(event).substr(2) + " " + (value ? "true" : "false"),
                 [&] { m_backend.set_slash_show(event, value); });
}

}  // namespace asusctl::features
