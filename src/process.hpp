#pragma once
#include <string>
#include <vector>

namespace collab {

struct ProcessResult {
    int exit_code = -1;     // -1 if the process could not be started or was killed
    std::string out;        // captured stdout
    std::string err;        // captured stderr, or the spawn error
    bool ok() const { return exit_code == 0; }
};

// Run argv[0] (looked up in PATH) with the given arguments, without a shell.
// Stdin is /dev/null; stdout and stderr are captured separately.
// `cwd` empty = inherit the current directory.
ProcessResult run_process(const std::vector<std::string>& argv, const std::string& cwd = "");

} // namespace collab
