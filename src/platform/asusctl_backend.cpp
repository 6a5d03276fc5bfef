#include "platform/asusctl_backend.hpp"

#include "config_io.hpp"
#include "core/asusctl_error.hpp"
#include "platform/output_parsers.hpp"

#include <glibmm/spawn.h>

#include <iostream>
#include <utility>

namespace asusctl {
namespace {
const char* bool_arg(bool value) {
    return value ? "true" : "false";
}

bool mentions(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

ProcessOutput spawn_tool(const ProcessRunner& runner, const std::string& binary,
                         const std::vector<std::string>& args) {
    try {
        return runner.run(binary, args);
    } catch (const Glib::SpawnError& e) {
        if (e.code() == Glib::SpawnError::NOENT) {
            throw AsusctlError::not_installed();
        }
        throw AsusctlError::command_failed(e.what());
    }
}

// power-profiles-daemon keeps desktop shells in sync, so it is tried first.
void set_profile_power_profiles_daemon(const ProcessRunner& runner, const std::string& binary,
                                       PowerProfile profile) {
    const ProcessOutput output =
        spawn_tool(runner, binary, {"set", power_profiles_daemon_name(profile)});
    if (output.exit_status != 0) {
        throw AsusctlError::command_failed(output.standard_error);
    }
}
}

std::string slash_event_flag(SlashEvent event) {
    switch (event) {
        case SlashEvent::Boot: return "--show-on-boot";
        case SlashEvent::Shutdown: return "--show-on-shutdown";
        case SlashEvent::Sleep: return "--show-on-sleep";
        case SlashEvent::Battery: return "--show-on-battery";
        case SlashEvent::BatteryWarning: return "--show-battery-warning";
    }
    return "";
}

std::string slash_event_property(SlashEvent event) {
    switch (event) {
        case SlashEvent::Boot: return "ShowOnBoot";
        case SlashEvent::Shutdown: return "ShowOnShutdown";
        case SlashEvent::Sleep: return "ShowOnSleep";
        case SlashEvent::Battery: return "ShowOnBattery";
        case SlashEvent::BatteryWarning: return "ShowBatteryWarning";
    }
    return "";
}

std::vector<std::string> kbd_brightness_args(KeyboardBrightness level) {
    return {"--kbd-bright", to_string(level)};
}

std::vector<std::string> profile_set_args(PowerProfile profile) {
    return {"profile", "--profile-set", to_string(profile)};
}

std::vector<std::string> charge_limit_args(uint8_t limit) {
    return {"--chg-limit", std::to_string(limit)};
}

std::vector<std::string> slash_enable_args(bool enabled) {
    return {"slash", enabled ? "--enable" : "--disable"};
}

std::vector<std::string> slash_brightness_args(uint8_t brightness) {
    return {"slash", "--brightness", std::to_string(brightness)};
}

std::vector<std::string> slash_mode_args(SlashMode mode) {
    return {"slash", "--mode", to_string(mode)};
}

std::vector<std::string> slash_interval_args(uint8_t interval) {
    return {"slash", "--interval", std::to_string(interval)};
}

std::vector<std::string> slash_show_args(SlashEvent event, bool value) {
    return {"slash", slash_event_flag(event), bool_arg(value)};
}

std::string checked_asusctl_output(const ProcessOutput& output) {
    if (mentions(output.standard_error, "Connection refused") ||
        mentions(output.standard_error, "asusd")) {
        throw AsusctlError::service_not_running();
    }
    return output.standard_output;
}

AsusctlBackend::AsusctlBackend(BackendConfig config, std::shared_ptr<const ProcessRunner> runner)
    : m_config(std::move(config)),
      m_runner(std::move(runner)),
      m_bus(m_runner, m_config.busctl_binary, m_config.dbus_destination) {}

std::string AsusctlBackend::run_asusctl(const std::vector<std::string>& args) const {
    return checked_asusctl_output(spawn_tool(*m_runner, m_config.asusctl_binary, args));
}

SystemInfo AsusctlBackend::get_system_info() const {
    return parsers::parse_system_info(run_asusctl({"--version"}));
}

SupportedFeatures AsusctlBackend::get_supported_features() const {
    return parsers::parse_supported_features(run_asusctl({"--show-supported"}));
}

KeyboardBrightness AsusctlBackend::get_keyboard_brightness() const {
    const std::string reply =
        m_bus.read_property(m_config.aura_path, m_config.aura_interface, "Brightness");
    return keyboard_brightness_from_level(decode_dbus_uint(reply));
}

void AsusctlBackend::set_keyboard_brightness(KeyboardBrightness level) const {
    run_asusctl(kbd_brightness_args(level));
}

ProfileState AsusctlBackend::get_profile_state() const {
    return parsers::parse_profile_state(run_asusctl({"profile", "--profile-get"}));
}

// The setters hold their own runner and binary names, so they outlive the backend.
std::vector<ProfileSetter> AsusctlBackend::profile_setters() const {
    const auto runner = m_runner;
    const std::string ppd_binary = m_config.power_profiles_binary;
    const std::string asusctl_binary = m_config.asusctl_binary;
    return {
        {ppd_binary,
         [runner, ppd_binary](PowerProfile profile) {
             set_profile_power_profiles_daemon(*runner, ppd_binary, profile);
         }},
        {asusctl_binary,
         [runner, asusctl_binary](PowerProfile profile) {
             checked_asusctl_output(
                 spawn_tool(*runner, asusctl_binary, profile_set_args(profile)));
         }},
    };
}

void AsusctlBackend::set_profile(PowerProfile profile) const {
    const auto setters = profile_setters();
    for (size_t i = 0; i < setters.size(); ++i) {
        try {
            setters[i].apply(profile);
        } catch (const AsusctlError&) {
            if (i + 1 == setters.size()) {
                throw;
            }
            continue;
        }
        std::cerr << "[asusctl-panel] Set power profile to " << to_string(profile)
                  << ", using " << setters[i].name << '\n';
        return;
    }
}

uint8_t AsusctlBackend::get_charge_limit() const {
    const std::string reply = m_bus.read_property(m_config.platform_path,
                                                  m_config.platform_interface,
                                                  "ChargeControlEndThreshold");
    return decode_dbus_byte(reply);
}

void AsusctlBackend::set_charge_limit(uint8_t limit) const {
    if (limit < CHARGE_LIMIT_MIN || limit > CHARGE_LIMIT_MAX) {
        throw AsusctlError::out_of_range("charge limit " + std::to_string(limit) +
                                         " is outside 20-100");
    }
    run_asusctl(charge_limit_args(limit));
}

std::string AsusctlBackend::read_slash_property(const std::string& property) const {
    return m_bus.read_property(m_config.slash_path, m_config.slash_interface, property);
}

SlashState AsusctlBackend::read_slash_config() const {
    return ConfigIO::readSlashConfig(m_config.slash_config_path);
}

bool AsusctlBackend::get_slash_enabled() const {
    try {
        return decode_dbus_bool(read_slash_property("Enabled"));
    } catch (const AsusctlError&) {
        return read_slash_config().enabled;
    }
}

uint8_t AsusctlBackend::get_slash_brightness() const {
    try {
        return decode_dbus_byte(read_slash_property("Brightness"));
    } catch (const AsusctlError&) {
        return read_slash_config().brightness;
    }
}

uint8_t AsusctlBackend::get_slash_interval() const {
    try {
        return decode_dbus_byte(read_slash_property("Interval"));
    } catch (const AsusctlError&) {
        return read_slash_config().interval;
    }
}

// The bus exposes the mode only as a numeric code, so slash.ron is authoritative.
SlashMode AsusctlBackend::get_slash_mode() const {
    return read_slash_config().mode;
}

SlashState AsusctlBackend::get_slash_state() const {
    SlashState state;
    try {
        state.enabled = decode_dbus_bool(read_slash_property("Enabled"));
        state.brightness = decode_dbus_byte(read_slash_property("Brightness"));
        state.interval = decode_dbus_byte(read_slash_property("Interval"));
    } catch (const AsusctlError&) {
        return read_slash_config();
    }

    try {
        state.mode = read_slash_config().mode;
    } catch (const AsusctlError&) {
        state.mode = DEFAULT_SLASH_MODE;
    }
    return state;
}

bool AsusctlBackend::get_slash_show(SlashEvent event) const {
    return decode_dbus_bool(read_slash_property(slash_event_property(event)));
}

void AsusctlBackend::set_slash_enabled(bool enabled) const {
    run_asusctl(slash_enable_args(enabled));
}

void AsusctlBackend::set_slash_brightness(uint8_t brightness) const {
    run_asusctl(slash_brightness_args(brightness));
}

void AsusctlBackend::set_slash_mode(SlashMode mode) const {
    run_asusctl(slash_mode_args(mode));
}

void AsusctlBackend::set_slash_interval(uint8_t interval) const {
    if (interval > SLASH_INTERVAL_MAX) {
        throw AsusctlError::out_of_range("slash interval " + std::to_string(interval) +
                                         " is outside 0-5");
    }
    run_asusctl(slash_interval_args(interval));
}

void AsusctlBackend::set_slash_show(SlashEvent event, bool value) const {
    run_asusctl(slash_show_args(event, value));
}

}  // namespace asusctl
