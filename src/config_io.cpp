#include "config_io.hpp"

#include "core/asusctl_error.hpp"
#include "core/text_utils.hpp"

#include <glibmm/fileutils.h>

namespace asusctl {

SlashState ConfigIO::readSlashConfig(const std::string& filePath) {
    std::string content;
    try {
        content = Glib::file_get_contents(filePath);
    } catch (const Glib::FileError& e) {
        throw AsusctlError::parse_error(std::string("Failed to read slash config: ") + e.what());
    }
    return parseSlashConfig(content);
}

SlashState ConfigIO::parseSlashConfig(const std::string& content) {
    SlashState state;

    for (const auto& raw : split_lines(content)) {
        const std::string line = trim_copy(raw);

        if (auto rest = strip_prefix(line, "enabled:")) {
            state.enabled = rest->find("true") != std::string::npos;
        } else if (starts_with(line, "brightness:")) {
            if (auto value = extractNumber(line)) {
                // Values above 255 wrap into the byte.
                state.brightness = static_cast<uint8_t>(*value);
            }
        } else if (starts_with(line, "display_interval:")) {
            if (auto value = extractNumber(line)) {
                state.interval = static_cast<uint8_t>(*value);
            }
        } else if (starts_with(line, "display_mode:")) {
            if (auto mode = extractStringValue(line)) {
                try {
                    state.mode = parse_slash_mode(*mode);
                } catch (const AsusctlError&) {
                    state.mode = DEFAULT_SLASH_MODE;
                }
            }
        }
    }

    return state;
}

std::optional<uint32_t> ConfigIO::extractNumber(const std::string& line) {
    auto value = extractStringValue(line);
    if (!value) {
        return std::nullopt;
    }
    return parse_unsigned(*value);
}

// "display_mode: BitStream," -> "BitStream"
std::optional<std::string> ConfigIO::extractStringValue(const std::string& line) {
    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    std::string value = trim_copy(line.substr(colon + 1));
    if (!value.empty() && value.back() == ',') {
        value.pop_back();
    }
    return trim_copy(value);
}

}  // namespace asusctl
