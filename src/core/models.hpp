#ifndef CORE_MODELS_HPP
#define CORE_MODELS_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace asusctl {

// Ordinals match the numeric encoding used on the property bus.
enum class KeyboardBrightness : uint8_t {
    Off = 0,
    Low = 1,
    Med = 2,
    High = 3
};

enum class PowerProfile : uint8_t {
    Quiet = 0,
    Balanced = 1,
    Performance = 2
};

enum class AuraMode : uint8_t {
    Static,
    Breathe,
    Pulse
};

enum class SlashMode : uint8_t {
    Bounce,
    Slash,
    Loading,
    BitStream,
    Transmission,
    Flow,
    Flux,
    Phantom,
    Spectrum,
    Hazard,
    Interfacing,
    Ramp,
    GameOver,
    Start,
    Buzzer
};

constexpr KeyboardBrightness DEFAULT_KEYBOARD_BRIGHTNESS = KeyboardBrightness::High;
constexpr PowerProfile DEFAULT_POWER_PROFILE = PowerProfile::Balanced;
constexpr AuraMode DEFAULT_AURA_MODE = AuraMode::Static;
constexpr SlashMode DEFAULT_SLASH_MODE = SlashMode::Flow;

extern const std::array<KeyboardBrightness, 4> ALL_KEYBOARD_BRIGHTNESS;
extern const std::array<PowerProfile, 3> ALL_POWER_PROFILES;
extern const std::array<AuraMode, 3> ALL_AURA_MODES;
extern const std::array<SlashMode, 15> ALL_SLASH_MODES;

// Lowercase form, as passed to `asusctl --kbd-bright`.
std::string to_string(KeyboardBrightness level);
// Capitalized form, as printed by asusctl.
std::string display_name(KeyboardBrightness level);
// Case-insensitive. Throws AsusctlError (ParseError) on unknown names.
KeyboardBrightness parse_keyboard_brightness(const std::string& text);
// Throws AsusctlError (ParseError) outside 0-3.
KeyboardBrightness keyboard_brightness_from_level(uint32_t level);

std::string to_string(PowerProfile profile);
// Vocabulary of power-profiles-daemon: power-saver, balanced, performance.
std::string power_profiles_daemon_name(PowerProfile profile);
PowerProfile parse_power_profile(const std::string& text);

std::string to_string(AuraMode mode);
AuraMode parse_aura_mode(const std::string& text);

std::string to_string(SlashMode mode);
// Case-sensitive, unlike the other enumerations.
SlashMode parse_slash_mode(const std::string& text);

struct ProfileState {
    PowerProfile active = DEFAULT_POWER_PROFILE;
    PowerProfile on_ac = DEFAULT_POWER_PROFILE;
    PowerProfile on_battery = DEFAULT_POWER_PROFILE;
};

struct SlashState {
    bool enabled = false;
    uint8_t brightness = 0;
    uint8_t interval = 0;
    SlashMode mode = DEFAULT_SLASH_MODE;
};

struct SupportedFeatures {
    bool has_aura = false;
    bool has_platform = false;
    bool has_fan_curves = false;
    bool has_slash = false;
    bool has_charge_control = false;
    bool has_throttle_policy = false;
    std::vector<KeyboardBrightness> keyboard_brightness_levels;
    std::vector<AuraMode> aura_modes;
};

struct SystemInfo {
    std::string asusctl_version;
    std::string product_family;
    std::string board_name;
};

}  // namespace asusctl

#endif
