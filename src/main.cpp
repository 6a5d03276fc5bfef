#include "core/asusctl_error.hpp"
#include "core/backend_config.hpp"
#include "core/models.hpp"
#include "core/text_utils.hpp"
#include "features/device_controller.hpp"

#include <glibmm/init.h>
#include <glibmm/optioncontext.h>
#include <glibmm/optionentry.h>
#include <glibmm/optiongroup.h>

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using asusctl::features::ApplyResult;
using asusctl::features::DeviceController;
using asusctl::features::DeviceSnapshot;

namespace {
const char* const USAGE =
    "Commands:\n"
    "  status                         Show the current device state (default)\n"
    "  kbd-brightness off|low|med|high\n"
    "  profile quiet|balanced|performance\n"
    "  charge-limit 20-100\n"
    "  slash enable|disable\n"
    "  slash brightness 0-255\n"
    "  slash mode NAME\n"
    "  slash interval 0-5\n"
    "  slash show-on-boot|show-on-shutdown|show-on-sleep|show-on-battery|show-battery-warning true|false\n";

const std::map<std::string, asusctl::SlashEvent> SLASH_EVENT_COMMANDS = {
    {"show-on-boot", asusctl::SlashEvent::Boot},
    {"show-on-shutdown", asusctl::SlashEvent::Shutdown},
    {"show-on-sleep", asusctl::SlashEvent::Sleep},
    {"show-on-battery", asusctl::SlashEvent::Battery},
    {"show-battery-warning", asusctl::SlashEvent::BatteryWarning},
};

std::optional<bool> parse_bool_arg(const std::string& value) {
    if (value == "true" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "off" || value == "0") {
        return false;
    }
    return std::nullopt;
}

std::optional<uint8_t> parse_byte_arg(const std::string& value) {
    auto parsed = asusctl::parse_unsigned(value);
    if (!parsed || *parsed > 255) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(*parsed);
}

const char* yes_no(bool value) {
    return value ? "yes" : "no";
}

void print_snapshot(const DeviceSnapshot& snapshot) {
    if (snapshot.system_info) {
        std::cout << "asusctl version:     " << snapshot.system_info->asusctl_version << '\n'
                  << "Product family:      " << snapshot.system_info->product_family << '\n'
                  << "Board name:          " << snapshot.system_info->board_name << '\n';
    }

    if (snapshot.supported_features) {
        const auto& features = *snapshot.supported_features;
        std::cout << "Aura:                " << yes_no(features.has_aura) << '\n'
                  << "Platform:            " << yes_no(features.has_platform) << '\n'
                  << "Fan curves:          " << yes_no(features.has_fan_curves) << '\n'
                  << "Slash:               " << yes_no(features.has_slash) << '\n'
                  << "Charge control:      " << yes_no(features.has_charge_control) << '\n'
                  << "Throttle policy:     " << yes_no(features.has_throttle_policy) << '\n';
        std::cout << "Brightness levels:  ";
        for (auto level : features.keyboard_brightness_levels) {
            std::cout << ' ' << asusctl::display_name(level);
        }
        std::cout << "\nAura modes:         ";
        for (auto mode : features.aura_modes) {
            std::cout << ' ' << asusctl::to_string(mode);
        }
        std::cout << '\n';
    }

    if (snapshot.keyboard_brightness) {
        std::cout << "Keyboard brightness: " << asusctl::display_name(*snapshot.keyboard_brightness)
                  << '\n';
    }

    if (snapshot.profile_state) {
        std::cout << "Active profile:      " << asusctl::to_string(snapshot.profile_state->active) << '\n'
                  << "Profile on AC:       " << asusctl::to_string(snapshot.profile_state->on_ac) << '\n'
                  << "Profile on battery:  " << asusctl::to_string(snapshot.profile_state->on_battery)
                  << '\n';
    }

    if (snapshot.charge_limit) {
        std::cout << "Charge limit:        " << static_cast<int>(*snapshot.charge_limit) << "%\n";
    }

    if (snapshot.slash_state) {
        const auto& slash = *snapshot.slash_state;
        std::cout << "Slash enabled:       " << yes_no(slash.enabled) << '\n'
                  << "Slash brightness:    " << static_cast<int>(slash.brightness) << '\n'
                  << "Slash interval:      " << static_cast<int>(slash.interval) << '\n'
                  << "Slash mode:          " << asusctl::to_string(slash.mode) << '\n';
    }

    for (const auto& entry : snapshot.slash_show) {
        std::cout << "Slash " << asusctl::slash_event_flag(entry.first).substr(2) << ": "
                  << yes_no(entry.second) << '\n';
    }

    for (const auto& error : snapshot.errors) {
        std::cerr << "[asusctl-panel] " << error << '\n';
    }
}

std::optional<ApplyResult> run_slash_command(const DeviceController& controller,
                                             const std::vector<std::string>& args) {
    if (args.size() == 2 && args[1] == "enable") {
        return controller.apply_slash_enabled(true);
    }
    if (args.size() == 2 && args[1] == "disable") {
        return controller.apply_slash_enabled(false);
    }
    if (args.size() != 3) {
        return std::nullopt;
    }

    const std::string& option = args[1];
    const std::string& value = args[2];
    if (option == "brightness") {
        if (auto brightness = parse_byte_arg(value)) {
            return controller.apply_slash_brightness(*brightness);
        }
    } else if (option == "interval") {
        if (auto interval = parse_byte_arg(value)) {
            return controller.apply_slash_interval(*interval);
        }
    } else if (option == "mode") {
        return controller.apply_slash_mode(asusctl::parse_slash_mode(value));
    } else {
        auto event = SLASH_EVENT_COMMANDS.find(option);
        auto flag = parse_bool_arg(value);
        if (event != SLASH_EVENT_COMMANDS.end() && flag) {
            return controller.apply_slash_show(event->second, *flag);
        }
    }
    return std::nullopt;
}

std::optional<ApplyResult> run_command(const DeviceController& controller,
                                       const std::vector<std::string>& args) {
    const std::string& command = args[0];
    if (command == "kbd-brightness" && args.size() == 2) {
        return controller.apply_keyboard_brightness(asusctl::parse_keyboard_brightness(args[1]));
    }
    if (command == "profile" && args.size() == 2) {
        return controller.apply_profile(asusctl::parse_power_profile(args[1]));
    }
    if (command == "charge-limit" && args.size() == 2) {
        if (auto limit = parse_byte_arg(args[1])) {
            return controller.apply_charge_limit(*limit);
        }
        return std::nullopt;
    }
    if (command == "slash") {
        return run_slash_command(controller, args);
    }
    return std::nullopt;
}
}  // namespace

int main(int argc, char* argv[])
{
    Glib::init();

    std::string config_path = asusctl::default_backend_config_path();
    std::string slash_config_path;

    Glib::OptionContext context("[COMMAND [ARGS...]]");
    context.set_description(USAGE);

    Glib::OptionGroup group("panel", "asusctl-panel options", "Show asusctl-panel options");
    Glib::OptionEntry config_entry;
    config_entry.set_long_name("config");
    config_entry.set_arg_description("FILE");
    config_entry.set_description("Backend configuration key file");
    group.add_entry_filename(config_entry, config_path);

    Glib::OptionEntry slash_entry;
    slash_entry.set_long_name("slash-config");
    slash_entry.set_arg_description("FILE");
    slash_entry.set_description("Override the slash.ron path");
    group.add_entry_filename(slash_entry, slash_config_path);
    context.set_main_group(group);

    try {
        context.parse(argc, argv);
    } catch (const Glib::OptionError& e) {
        std::cerr << e.what() << '\n' << USAGE;
        return 1;
    }

    asusctl::BackendConfig config = asusctl::load_backend_config(config_path);
    if (!slash_config_path.empty()) {
        config.slash_config_path = slash_config_path;
    }
    const DeviceController controller{asusctl::AsusctlBackend(config)};

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || (args.size() == 1 && args[0] == "status")) {
        print_snapshot(controller.load_snapshot());
        return 0;
    }

    std::optional<ApplyResult> result;
    try {
        result = run_command(controller, args);
    } catch (const asusctl::AsusctlError& e) {
        std::cerr << "[asusctl-panel] " << asusctl::kind_name(e.kind()) << ": " << e.what() << '\n';
        return 1;
    }

    if (!result) {
        std::cerr << "Unrecognized command\n" << USAGE;
        return 1;
    }

    if (!result->ok) {
        std::cerr << "[asusctl-panel] " << result->message << '\n';
        return 1;
    }
    std::cout << result->message << '\n';
    return 0;
}
