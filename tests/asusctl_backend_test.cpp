#include "core/asusctl_error.hpp"
#include "features/device_controller.hpp"
#include "platform/asusctl_backend.hpp"
#include "test_support.hpp"

#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>

#include <cassert>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using asusctl::AsusctlBackend;
using asusctl::AsusctlError;
using asusctl::BackendConfig;
using asusctl::PowerProfile;
using asusctl::SlashEvent;
using asusctl::SlashMode;
using testing_support::ScriptedProcessRunner;
using testing_support::error_kind;

namespace {
const std::string SLASH_BUS =
    "busctl get-property xyz.ljones.Asusd /xyz/ljones/aura/193b_5_5 xyz.ljones.Slash ";
const std::string AURA_BUS =
    "busctl get-property xyz.ljones.Asusd /xyz/ljones/aura/19b6_4_4 xyz.ljones.Aura ";
const std::string PLATFORM_BUS =
    "busctl get-property xyz.ljones.Asusd /xyz/ljones xyz.ljones.Platform ";

BackendConfig config_with_slash_file(const std::string& path) {
    BackendConfig config;
    config.slash_config_path = path;
    return config;
}

std::string write_slash_config(const std::string& content) {
    const std::string path =
        Glib::build_filename(Glib::get_tmp_dir(), "asusctl-panel-backend-test-slash.ron");
    Glib::file_set_contents(path, content);
    return path;
}

std::vector<std::string> args(std::initializer_list<const char*> list) {
    return std::vector<std::string>(list.begin(), list.end());
}
}

int main() {
    {
        assert(asusctl::kbd_brightness_args(asusctl::KeyboardBrightness::Med) ==
               args({"--kbd-bright", "med"}));
        assert(asusctl::profile_set_args(PowerProfile::Performance) ==
               args({"profile", "--profile-set", "Performance"}));
        assert(asusctl::charge_limit_args(80) == args({"--chg-limit", "80"}));
        assert(asusctl::slash_enable_args(true) == args({"slash", "--enable"}));
        assert(asusctl::slash_enable_args(false) == args({"slash", "--disable"}));
        assert(asusctl::slash_brightness_args(255) == args({"slash", "--brightness", "255"}));
        assert(asusctl::slash_mode_args(SlashMode::GameOver) == args({"slash", "--mode", "GameOver"}));
        assert(asusctl::slash_interval_args(0) == args({"slash", "--interval", "0"}));
        assert(asusctl::slash_show_args(SlashEvent::Sleep, true) ==
               args({"slash", "--show-on-sleep", "true"}));
        assert(asusctl::slash_show_args(SlashEvent::BatteryWarning, false) ==
               args({"slash", "--show-battery-warning", "false"}));
    }

    {
        asusctl::ProcessOutput output;
        output.standard_output = "Active profile is Quiet\n";
        output.standard_error = "Error: asusd is not reachable";
        output.exit_status = 0;
        assert(error_kind([&] { asusctl::checked_asusctl_output(output); }) ==
               AsusctlError::Kind::ServiceNotRunning);

        output.standard_error = "zbus: Connection refused";
        assert(error_kind([&] { asusctl::checked_asusctl_output(output); }) ==
               AsusctlError::Kind::ServiceNotRunning);

        output.standard_error = "warning: unknown flag";
        output.exit_status = 2;
        assert(asusctl::checked_asusctl_output(output) == "Active profile is Quiet\n");
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond("asusctl profile --profile-get",
                        "Starting version 6.2.0\nActive profile is Performance\n"
                        "Profile on AC is Performance\nProfile on Battery is Quiet\n",
                        "", 1);
        AsusctlBackend backend(BackendConfig(), runner);
        auto state = backend.get_profile_state();
        assert(state.active == PowerProfile::Performance);
        assert(state.on_battery == PowerProfile::Quiet);
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->missing_binary("asusctl");
        AsusctlBackend backend(BackendConfig(), runner);
        assert(error_kind([&] { backend.get_system_info(); }) == AsusctlError::Kind::NotInstalled);
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond(AURA_BUS + "Brightness", "u 2\n");
        runner->respond(PLATFORM_BUS + "ChargeControlEndThreshold", "y 80\n");
        AsusctlBackend backend(BackendConfig(), runner);
        assert(backend.get_keyboard_brightness() == asusctl::KeyboardBrightness::Med);
        assert(backend.get_charge_limit() == 80);
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond(AURA_BUS + "Brightness", "", "No such object path '/xyz/ljones/aura/19b6_4_4'", 1);
        AsusctlBackend backend(BackendConfig(), runner);
        assert(error_kind([&] { backend.get_keyboard_brightness(); }) ==
               AsusctlError::Kind::ServiceNotRunning);
        assert(error_kind([&] { backend.get_charge_limit(); }) == AsusctlError::Kind::CommandFailed);
    }

    {
        const std::string path = write_slash_config(
            "(\n    enabled: true,\n    brightness: 120,\n    display_interval: 3,\n"
            "    display_mode: Spectrum,\n)\n");
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond(SLASH_BUS + "Enabled", "", "Failed to connect to bus: No such file or directory", 1);
        runner->respond(SLASH_BUS + "Brightness", "s \"bright\"\n");
        AsusctlBackend backend(config_with_slash_file(path), runner);

        assert(backend.get_slash_enabled());
        assert(backend.get_slash_brightness() == 120);
        assert(backend.get_slash_interval() == 3);
        assert(backend.get_slash_mode() == SlashMode::Spectrum);

        auto state = backend.get_slash_state();
        assert(state.enabled);
        assert(state.brightness == 120);
        assert(state.interval == 3);
        assert(state.mode == SlashMode::Spectrum);

        assert(error_kind([&] { backend.get_slash_show(SlashEvent::Boot); }) ==
               AsusctlError::Kind::CommandFailed);
        std::remove(path.c_str());
    }

    {
        const std::string path = write_slash_config("enabled: false,\ndisplay_mode: Ramp,\n");
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond(SLASH_BUS + "Enabled", "b true\n");
        runner->respond(SLASH_BUS + "Brightness", "y 200\n");
        runner->respond(SLASH_BUS + "Interval", "y 1\n");
        runner->respond(SLASH_BUS + "ShowBatteryWarning", "b false\n");
        AsusctlBackend backend(config_with_slash_file(path), runner);

        assert(backend.get_slash_enabled());
        auto state = backend.get_slash_state();
        assert(state.enabled);
        assert(state.brightness == 200);
        assert(state.interval == 1);
        assert(state.mode == SlashMode::Ramp);
        assert(!backend.get_slash_show(SlashEvent::BatteryWarning));
        std::remove(path.c_str());
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond(SLASH_BUS + "Enabled", "b true\n");
        runner->respond(SLASH_BUS + "Brightness", "y 90\n");
        runner->respond(SLASH_BUS + "Interval", "y 4\n");
        AsusctlBackend backend(config_with_slash_file("/nonexistent/slash.ron"), runner);

        auto state = backend.get_slash_state();
        assert(state.enabled);
        assert(state.brightness == 90);
        assert(state.interval == 4);
        assert(state.mode == SlashMode::Flow);
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        AsusctlBackend backend(config_with_slash_file("/nonexistent/slash.ron"), runner);
        assert(error_kind([&] { backend.get_slash_enabled(); }) == AsusctlError::Kind::ParseError);
        assert(error_kind([&] { backend.get_slash_mode(); }) == AsusctlError::Kind::ParseError);
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond("powerprofilesctl set power-saver", "");
        AsusctlBackend backend(BackendConfig(), runner);
        backend.set_profile(PowerProfile::Quiet);
        assert(runner->calls().size() == 1);
        assert(runner->calls()[0] == "powerprofilesctl set power-saver");
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->missing_binary("powerprofilesctl");
        runner->respond("asusctl profile --profile-set Performance", "");
        AsusctlBackend backend(BackendConfig(), runner);
        backend.set_profile(PowerProfile::Performance);
        assert(runner->calls().size() == 2);
        assert(runner->calls()[1] == "asusctl profile --profile-set Performance");
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond("powerprofilesctl set balanced", "", "Failed to communicate", 1);
        runner->respond("asusctl profile --profile-set Balanced", "", "asusd not running", 1);
        AsusctlBackend backend(BackendConfig(), runner);
        assert(error_kind([&] { backend.set_profile(PowerProfile::Balanced); }) ==
               AsusctlError::Kind::ServiceNotRunning);

        auto setters = backend.profile_setters();
        assert(setters.size() == 2);
        assert(setters[0].name == "powerprofilesctl");
        assert(setters[1].name == "asusctl");
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond("powerprofilesctl set performance", "");
        std::vector<asusctl::ProfileSetter> setters;
        {
            AsusctlBackend backend(BackendConfig(), runner);
            setters = backend.profile_setters();
            asusctl::features::DeviceController controller(std::move(backend));
        }
        setters[0].apply(PowerProfile::Performance);
        assert(runner->calls().back() == "powerprofilesctl set performance");
        setters[1].apply(PowerProfile::Quiet);
        assert(runner->calls().back() == "asusctl profile --profile-set Quiet");
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond("asusctl --chg-limit 60", "");
        runner->respond("asusctl slash --interval 5", "");
        AsusctlBackend backend(BackendConfig(), runner);

        assert(error_kind([&] { backend.set_charge_limit(19); }) == AsusctlError::Kind::OutOfRange);
        assert(error_kind([&] { backend.set_charge_limit(101); }) == AsusctlError::Kind::OutOfRange);
        assert(error_kind([&] { backend.set_slash_interval(6); }) == AsusctlError::Kind::OutOfRange);
        assert(runner->calls().empty());

        backend.set_charge_limit(60);
        backend.set_slash_interval(5);
        assert(runner->calls().size() == 2);
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        AsusctlBackend backend(BackendConfig(), runner);
        backend.set_keyboard_brightness(asusctl::KeyboardBrightness::Off);
        backend.set_slash_enabled(false);
        backend.set_slash_brightness(10);
        backend.set_slash_mode(SlashMode::Hazard);
        backend.set_slash_show(SlashEvent::Shutdown, true);

        const std::vector<std::string> expected = {
            "asusctl --kbd-bright off",
            "asusctl slash --disable",
            "asusctl slash --brightness 10",
            "asusctl slash --mode Hazard",
            "asusctl slash --show-on-shutdown true",
        };
        assert(runner->calls() == expected);
    }

    {
        auto runner = std::make_shared<ScriptedProcessRunner>();
        runner->respond("asusctl --version", "asusctl version: 6.2.0\n Board name: GA403UV\n");
        runner->respond(AURA_BUS + "Brightness", "u 1\n");
        runner->respond(SLASH_BUS + "ShowOnBoot", "b true\n");
        runner->respond("asusctl profile --profile-get", "", "Error: Connection refused", 1);
        runner->respond("asusctl --kbd-bright high", "", "asusd: Connection refused", 0);
        asusctl::features::DeviceController controller(
            AsusctlBackend(config_with_slash_file("/nonexistent/slash.ron"), runner));

        auto snapshot = controller.load_snapshot();
        assert(snapshot.system_info);
        assert(snapshot.system_info->board_name == "GA403UV");
        assert(snapshot.keyboard_brightness == asusctl::KeyboardBrightness::Low);
        assert(!snapshot.profile_state);
        assert(!snapshot.charge_limit);
        assert(!snapshot.slash_state);
        assert(snapshot.slash_show.size() == 1);
        assert(snapshot.slash_show.at(SlashEvent::Boot));
        assert(!snapshot.errors.empty());

        auto result = controller.apply_keyboard_brightness(asusctl::KeyboardBrightness::High);
        assert(!result.ok);
        assert(result.message == "asusd service is not running");

        runner->respond("asusctl slash --mode Flux", "");
        result = controller.apply_slash_mode(SlashMode::Flux);
        assert(result.ok);
        assert(result.message == "Applied slash mode Flux");

        result = controller.apply_charge_limit(5);
        assert(!result.ok);
    }

    return 0;
}
