#ifndef PLATFORM_OUTPUT_PARSERS_HPP
#define PLATFORM_OUTPUT_PARSERS_HPP

#include "core/models.hpp"

#include <string>

// Parsers for the human-readable reports printed by asusctl. They take the
// complete captured stdout and never touch the system.
namespace asusctl::parsers {

// `asusctl --version`. Labels that are missing leave their field empty.
SystemInfo parse_system_info(const std::string& output);

// `asusctl profile --profile-get`. Throws ParseError on an unknown profile name.
ProfileState parse_profile_state(const std::string& output);

// `asusctl --show-supported`. Presence tests only, never throws.
SupportedFeatures parse_supported_features(const std::string& output);

// Line "Current keyboard led brightness: <Name>". Throws ParseError when absent.
KeyboardBrightness parse_keyboard_brightness_report(const std::string& output);

// Text following `header` up to the line where the bracketed block that
// starts there closes. Text after the header on its own line is included.
// Empty when the header is missing; runs to the end when brackets never close.
std::string extract_section(const std::string& output, const std::string& header);

}  // namespace asusctl::parsers

#endif
