#pragma once

#include <functional>
#include <string>
#include <vector>

namespace eqrender::core {

// Runs args[0] (looked up on PATH) and waits for it. Returns false when the
// process could not be started; otherwise stores its exit status. With
// discard_output the child's stdout and stderr go to /dev/null. The child runs
// in its own process group, so SIGINT from the terminal does not reach it.
bool run_process(const std::vector<std::string>& args, bool discard_output, int& exit_code, std::string& error);

using CommandRunner =
    std::function<bool(const std::vector<std::string>& args, bool discard_output, int& exit_code, std::string& error)>;

CommandRunner system_command_runner();

std::string format_command(const std::vector<std::string>& args);

} // namespace eqrender::core
