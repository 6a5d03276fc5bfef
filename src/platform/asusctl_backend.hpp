#ifndef PLATFORM_ASUSCTL_BACKEND_HPP
#define PLATFORM_ASUSCTL_BACKEND_HPP

#include "core/backend_config.hpp"
#include "core/models.hpp"
#include "platform/dbus_property_reader.hpp"
#include "platform/process_runner.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace asusctl {

// Events on which the slash LED bar can show its animation.
enum class SlashEvent {
    Boot,
    Shutdown,
    Sleep,
    Battery,
    BatteryWarning
};

std::string slash_event_flag(SlashEvent event);
std::string slash_event_property(SlashEvent event);

std::vector<std::string> kbd_brightness_args(KeyboardBrightness level);
std::vector<std::string> profile_set_args(PowerProfile profile);
std::vector<std::string> charge_limit_args(uint8_t limit);
std::vector<std::string> slash_enable_args(bool enabled);
std::vector<std::string> slash_brightness_args(uint8_t brightness);
std::vector<std::string> slash_mode_args(SlashMode mode);
std::vector<std::string> slash_interval_args(uint8_t interval);
std::vector<std::string> slash_show_args(SlashEvent event, bool value);

// asusctl exits non-zero even when stdout is usable, so only stderr decides.
// Throws ServiceNotRunning when stderr mentions asusd or a refused connection.
std::string checked_asusctl_output(const ProcessOutput& output);

// One way of applying a power profile. apply() throws AsusctlError on failure.
struct ProfileSetter {
    std::string name;
    std::function<void(PowerProfile)> apply;
};

constexpr uint8_t CHARGE_LIMIT_MIN = 20;
constexpr uint8_t CHARGE_LIMIT_MAX = 100;
constexpr uint8_t SLASH_INTERVAL_MAX = 5;

class AsusctlBackend {
public:
    explicit AsusctlBackend(BackendConfig config = BackendConfig(),
                            std::shared_ptr<const ProcessRunner> runner =
                                std::make_shared<SpawnProcessRunner>());

    const BackendConfig& config() const { return m_config; }

    std::string run_asusctl(const std::vector<std::string>& args) const;

    SystemInfo get_system_info() const;
    SupportedFeatures get_supported_features() const;

    KeyboardBrightness get_keyboard_brightness() const;
    void set_keyboard_brightness(KeyboardBrightness level) const;

    ProfileState get_profile_state() const;
    // Tries profile_setters() in order; only the last failure is reported.
    void set_profile(PowerProfile profile) const;
    // Each setter owns copies of what it needs and stays valid after the backend is gone.
    std::vector<ProfileSetter> profile_setters() const;

    uint8_t get_charge_limit() const;
    void set_charge_limit(uint8_t limit) const;

    // Bus first, slash config file on any bus error.
    bool get_slash_enabled() const;
    uint8_t get_slash_brightness() const;
    uint8_t get_slash_interval() const;
    // Config file only.
    SlashMode get_slash_mode() const;
    SlashState get_slash_state() const;
    // Bus only.
    bool get_slash_show(SlashEvent event) const;

    void set_slash_enabled(bool enabled) const;
    void set_slash_brightness(uint8_t brightness) const;
    void set_slash_mode(SlashMode mode) const;
    void set_slash_interval(uint8_t interval) const;
    void set_slash_show(SlashEvent event, bool value) const;

private:
    std::string read_slash_property(const std::string& property) const;
    SlashState read_slash_config() const;

    BackendConfig m_config;
    std::shared_ptr<const ProcessRunner> m_runner;
    DbusPropertyReader m_bus;
};

}  // namespace asusctl

#endif
