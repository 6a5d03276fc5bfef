#include "platform/process_runner.hpp"

#include <glib.h>
#include <glibmm/spawn.h>
#include <glibmm/utility.h>

#include <sys/wait.h>

namespace asusctl {

std::string make_valid_utf8(const std::string& text) {
    return Glib::convert_return_gchar_ptr_to_stdstring(
        g_utf8_make_valid(text.data(), static_cast<gssize>(text.size())));
}

ProcessOutput SpawnProcessRunner::run(const std::string& binary,
                                      const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary);
    argv.insert(argv.end(), args.begin(), args.end());

    std::string standard_output;
    std::string standard_error;
    int wait_status = 0;
    Glib::spawn_sync("", argv, Glib::SpawnFlags::SEARCH_PATH, {},
                     &standard_output, &standard_error, &wait_status);

    ProcessOutput output;
    output.standard_output = make_valid_utf8(standard_output);
    output.standard_error = make_valid_utf8(standard_error);
    if (WIFEXITED(wait_status)) {
        output.exit_status = WEXITSTATUS(wait_status);
    } else {
        output.exit_status = -1;
    }
    return output;
}

}  // namespace asusctl
