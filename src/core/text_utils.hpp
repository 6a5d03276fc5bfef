#ifndef CORE_TEXT_UTILS_HPP
#define CORE_TEXT_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace asusctl {
std::string trim_copy(const std::string& value);

// Splits on '\n' and drops a trailing '\r' from each line. Lines are not trimmed.
std::vector<std::string> split_lines(const std::string& text);

bool starts_with(const std::string& value, const std::string& prefix);

// Remainder after prefix, or nullopt when value does not start with it.
std::optional<std::string> strip_prefix(const std::string& value, const std::string& prefix);

// Decimal digits only, no sign or whitespace, must fit in 32 bits.
std::optional<uint32_t> parse_unsigned(const std::string& value);
}

#endif
