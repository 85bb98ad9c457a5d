#pragma once

#include <kiln/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace kiln {

struct CommandResult {
    int exit_code = -1;
    std::string stdout_str;
    std::string stderr_str;

    bool success() const { return exit_code == 0; }
    // stderr followed by stdout, for diagnostics
    std::string combined_output() const;
};

struct CommandOptions {
    std::string working_dir;
    std::map<std::string, std::string> env;   // added to / overriding the parent env
    int timeout_seconds = 0;                  // 0 waits forever
};

// Run an external command, capturing stdout and stderr. A non-zero exit is
// reported through CommandResult; only spawn failures, a command that cannot
// be executed and timeouts are errors.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options = {});

} // namespace kiln
