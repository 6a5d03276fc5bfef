#include "core/models.hpp"

#include "core/asusctl_error.hpp"

#include <algorithm>
#include <cctype>

namespace asusctl {
namespace {
std::string lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}
}

const std::array<KeyboardBrightness, 4> ALL_KEYBOARD_BRIGHTNESS = {
    KeyboardBrightness::Off, KeyboardBrightness::Low, KeyboardBrightness::Med,
    KeyboardBrightness::High};

const std::array<PowerProfile, 3> ALL_POWER_PROFILES = {
    PowerProfile::Quiet, PowerProfile::Balanced, PowerProfile::Performance};

const std::array<AuraMode, 3> ALL_AURA_MODES = {
    AuraMode::Static, AuraMode::Breathe, AuraMode::Pulse};

const std::array<SlashMode, 15> ALL_SLASH_MODES = {
    SlashMode::Bounce, SlashMode::Slash, SlashMode::Loading, SlashMode::BitStream,
    SlashMode::Transmission, SlashMode::Flow, SlashMode::Flux, SlashMode::Phantom,
    SlashMode::Spectrum, SlashMode::Hazard, SlashMode::Interfacing, SlashMode::Ramp,
    SlashMode::GameOver, SlashMode::Start, SlashMode::Buzzer};

std::string to_string(KeyboardBrightness level) {
    switch (level) {
        case KeyboardBrightness::Off: return "off";
        case KeyboardBrightness::Low: return "low";
        case KeyboardBrightness::Med: return "med";
        case KeyboardBrightness::High: return "high";
    }
    return "high";
}

std::string display_name(KeyboardBrightness level) {
    std::string name = to_string(level);
    name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name;
}

KeyboardBrightness parse_keyboard_brightness(const std::string& text) {
    const std::string lowered = lower_copy(text);
    for (KeyboardBrightness level : ALL_KEYBOARD_BRIGHTNESS) {
        if (lowered == to_string(level)) {
            return level;
        }
    }
    throw AsusctlError::parse_error("Unknown brightness level: " + text);
}

KeyboardBrightness keyboard_brightness_from_level(uint32_t level) {
    if (level >= ALL_KEYBOARD_BRIGHTNESS.size()) {
        throw AsusctlError::parse_error("Unknown brightness value: " + std::to_string(level));
    }
    return ALL_KEYBOARD_BRIGHTNESS[level];
}

std::string to_string(PowerProfile profile) {
    switch (profile) {
        case PowerProfile::Quiet: return "Quiet";
        case PowerProfile::Balanced: return "Balanced";
        case PowerProfile::Performance: return "Performance";
    }
    return "Balanced";
}

std::string power_profiles_daemon_name(PowerProfile profile) {
    switch (profile) {
        case PowerProfile::Quiet: return "power-saver";
        case PowerProfile::Balanced: return "balanced";
        case PowerProfile::Performance: return "performance";
    }
    return "balanced";
}

PowerProfile parse_power_profile(const std::string& text) {
    const std::string lowered = lower_copy(text);
    for (PowerProfile profile : ALL_POWER_PROFILES) {
        if (lowered == lower_copy(to_string(profile))) {
            return profile;
        }
    }
    throw AsusctlError::parse_error("Unknown power profile: " + text);
}

std::string to_string(AuraMode mode) {
    switch (mode) {
        case AuraMode::Static: return "Static";
        case AuraMode::Breathe: return "Breathe";
        case AuraMode::Pulse: return "Pulse";
    }
    return "Static";
}

AuraMode parse_aura_mode(const std::string& text) {
    const std::string lowered = lower_copy(text);
    for (AuraMode mode : ALL_AURA_MODES) {
        if (lowered == lower_copy(to_string(mode))) {
            return mode;
        }
    }
    throw AsusctlError::parse_error("Unknown aura mode: " + text);
}

std::string to_string(SlashMode mode) {
    switch (mode) {
        case SlashMode::Bounce: return "Bounce";
        case SlashMode::Slash: return "Slash";
        case SlashMode::Loading: return "Loading";
        case SlashMode::BitStream: return "BitStream";
        case SlashMode::Transmission: return "Transmission";
        case SlashMode::Flow: return "Flow";
        case SlashMode::Flux: return "Flux";
        case SlashMode::Phantom: return "Phantom";
        case SlashMode::Spectrum: return "Spectrum";
        case SlashMode::Hazard: return "Hazard";
        case SlashMode::Interfacing: return "Interfacing";
        case SlashMode::Ramp: return "Ramp";
        case SlashMode::GameOver: return "GameOver";
        case SlashMode::Start: return "Start";
        case SlashMode::Buzzer: return "Buzzer";
    }
    return "Flow";
}

SlashMode parse_slash_mode(const std::string& text) {
    for (SlashMode mode : ALL_SLASH_MODES) {
        if (text == to_string(mode)) {
            return mode;
        }
    }
    throw AsusctlError::parse_error("Unknown slash mode: " + text);
}

}  // namespace asusctl
