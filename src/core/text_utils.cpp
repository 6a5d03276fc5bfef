#include "core/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace asusctl {

std::string trim_copy(const std::string& value) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    auto begin = std::find_if(value.begin(), value.end(), not_space);
    auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::string> strip_prefix(const std::string& value, const std::string& prefix) {
    if (!starts_with(value, prefix)) {
        return std::nullopt;
    }
    return value.substr(prefix.size());
}

std::optional<uint32_t> parse_unsigned(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }

    uint64_t parsed = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        parsed = parsed * 10 + static_cast<uint64_t>(c - '0');
        if (parsed > std::numeric_limits<uint32_t>::max()) {
            return std::nullopt;
        }
    }
    return static_cast<uint32_t>(parsed);
}

}  // namespace asusctl
