#ifndef PLATFORM_PROCESS_RUNNER_HPP
#define PLATFORM_PROCESS_RUNNER_HPP

#include <string>
#include <vector>

namespace asusctl {

struct ProcessOutput {
    std::string standard_output;
    std::string standard_error;
    int exit_status = 0;
};

// Runs one child process to completion. Spawn failures surface as
// Glib::SpawnError so each caller can classify them for its own tool.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessOutput run(const std::string& binary,
                              const std::vector<std::string>& args) const = 0;
};

// Searches PATH for the binary and blocks until it exits. No timeout.
class SpawnProcessRunner : public ProcessRunner {
public:
    ProcessOutput run(const std::string& binary,
                      const std::vector<std::string>& args) const override;
};

// Replaces invalid UTF-8 sequences with U+FFFD.
std::string make_valid_utf8(const std::string& text);

}  // namespace asusctl

#endif
