#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <string>
#include <vector>
#include <optional>

struct ExecResult {
    int exit_code;
    // stdout and stderr, interleaved as the child wrote them
    std::string output;

    bool ok() const { return exit_code == 0; }
};

// Runs args[0] with the given argument vector (no shell) and blocks until it exits.
// A child that cannot be exec'ed reports exit code 127; one killed by a signal 128+signo.
ExecResult exec_command(const std::vector<std::string>& args);

// Resolves a tool name to an executable path. Names containing '/' are checked
// as given; bare names are searched in $PATH.
std::optional<std::string> find_executable(const std::string& name);

// Renders an argument vector for log output.
std::string format_command(const std::vector<std::string>& args);

#endif // PROCESS_RUNNER_HPP
