#pragma once

#include <string>
#include <vector>

namespace ci::util {

struct ExecResult {
    int exit_code = -1;          // -1 when the child was killed by a signal
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

// fork/execvp argv[0] with stdin on /dev/null, stdout and stderr captured.
// Throws std::runtime_error when the child cannot be started at all.
ExecResult execCapture(const std::vector<std::string>& argv);

// True when `program` resolves to an executable through $PATH
bool onPath(const std::string& program);

}
