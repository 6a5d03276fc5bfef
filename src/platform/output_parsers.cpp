#include "platform/output_parsers.hpp"

#include "core/asusctl_error.hpp"
#include "core/text_utils.hpp"

#include <algorithm>

namespace asusctl::parsers {
namespace {
bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

int bracket_balance(const std::string& line) {
    const auto opened = std::count(line.begin(), line.end(), '[');
    const auto closed = std::count(line.begin(), line.end(), ']');
    return static_cast<int>(opened - closed);
}
}

SystemInfo parse_system_info(const std::string& output) {
    SystemInfo info;
    bool have_version = false;
    bool have_family = false;
    bool have_board = false;

    for (const auto& raw : split_lines(output)) {
        const std::string line = trim_copy(raw);

        if (auto version = strip_prefix(line, "asusctl version:")) {
            if (!have_version) {
                info.asusctl_version = trim_copy(*version);
                have_version = true;
            }
        } else if (auto family = strip_prefix(line, "Product family:")) {
            if (!have_family) {
                info.product_family = trim_copy(*family);
                have_family = true;
            }
        } else if (auto board = strip_prefix(line, "Board name:")) {
            if (!have_board) {
                info.board_name = trim_copy(*board);
                have_board = true;
            }
        }
    }

    return info;
}

ProfileState parse_profile_state(const std::string& output) {
    ProfileState state;

    for (const auto& raw : split_lines(output)) {
        const std::string line = trim_copy(raw);

        if (auto active = strip_prefix(line, "Active profile is")) {
            state.active = parse_power_profile(trim_copy(*active));
        } else if (auto on_ac = strip_prefix(line, "Profile on AC is")) {
            state.on_ac = parse_power_profile(trim_copy(*on_ac));
        } else if (auto on_battery = strip_prefix(line, "Profile on Battery is")) {
            state.on_battery = parse_power_profile(trim_copy(*on_battery));
        }
    }

    return state;
}

SupportedFeatures parse_supported_features(const std::string& output) {
    SupportedFeatures features;

    features.has_aura = contains(output, "xyz.ljones.Aura");
    features.has_platform = contains(output, "xyz.ljones.Platform");
    features.has_fan_curves = contains(output, "xyz.ljones.FanCurves");
    features.has_slash = contains(output, "xyz.ljones.Slash");

    features.has_charge_control = contains(output, "ChargeControlEndThreshold");
    features.has_throttle_policy = contains(output, "ThrottlePolicy");

    const std::string brightness_section = extract_section(output, "Supported Keyboard Brightness:");
    for (KeyboardBrightness level : ALL_KEYBOARD_BRIGHTNESS) {
        if (contains(brightness_section, display_name(level))) {
            features.keyboard_brightness_levels.push_back(level);
        }
    }

    const std::string aura_section = extract_section(output, "Supported Aura Modes:");
    for (AuraMode mode : ALL_AURA_MODES) {
        if (contains(aura_section, to_string(mode))) {
            features.aura_modes.push_back(mode);
        }
    }

    return features;
}

KeyboardBrightness parse_keyboard_brightness_report(const std::string& output) {
    for (const auto& line : split_lines(output)) {
        if (!contains(line, "Current keyboard led brightness:")) {
            continue;
        }

        const size_t colon = line.find(':');
        const size_t next = line.find(':', colon + 1);
        const std::string level = trim_copy(line.substr(colon + 1, next == std::string::npos
                                                                        ? std::string::npos
                                                                        : next - colon - 1));
        return parse_keyboard_brightness(level);
    }
    throw AsusctlError::parse_error("Could not find brightness level in output");
}

std::string extract_section(const std::string& output, const std::string& header) {
    std::string section;
    bool in_section = false;
    int depth = 0;

    for (const auto& line : split_lines(output)) {
        std::string part = line;
        if (!in_section) {
            const size_t pos = line.find(header);
            if (pos == std::string::npos) {
                continue;
            }
            in_section = true;
            part = line.substr(pos + header.size());
            if (trim_copy(part).empty()) {
                continue;
            }
        }

        depth += bracket_balance(part);
        section += part;
        section += '\n';

        if (depth <= 0 && contains(part, "]")) {
            break;
        }
    }

    return section;
}

}  // namespace asusctl::parsers
