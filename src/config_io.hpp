#ifndef CONFIG_IO_HPP
#define CONFIG_IO_HPP

#include "core/models.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace asusctl {

// Reader for asusd's slash.ron. Only the handful of "key: value," lines the
// panel needs are recognised; everything else in the file is skipped.
class ConfigIO {
public:
    // Throws AsusctlError (ParseError) when the file cannot be read.
    static SlashState readSlashConfig(const std::string& filePath);
    static SlashState parseSlashConfig(const std::string& content);

    static std::optional<uint32_t> extractNumber(const std::string& line);
    static std::optional<std::string> extractStringValue(const std::string& line);
};

}  // namespace asusctl

#endif // CONFIG_IO_HPP
