#pragma once
#include <string>

namespace procutil {

struct ProcResult {
    int exit_code = -1;   // -1: could not start
    std::string output;   // stdout+stderr (merged)
};

// Runs a shell command line and captures its merged output.
ProcResult run_capture(const std::string& cmdline);

// Single-quotes `s` for /bin/sh.
std::string shell_quote(const std::string& s);

} // namespace procutil
