#include "llm/ProcUtil.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace procutil {

ProcResult run_capture(const std::string& cmdline) {
    ProcResult r;

    // merge stderr into the pipe for every command in the line
    const std::string full = "{ " + cmdline + "\n} 2>&1";
    FILE* pipe = ::popen(full.c_str(), "r");
    if (!pipe) return r;

    std::string out;
    out.reserve(8192);

    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        out.append(buf, buf + n);
    }

    int status = ::pclose(pipe);
    if (status == -1) {
        r.exit_code = -1;
    } else if (WIFEXITED(status)) {
        r.exit_code = WEXITSTATUS(status);
    } else {
        r.exit_code = 128;
    }
    r.output = std::move(out);
    return r;
}

std::string shell_quote(const std::string& s) {
    std::string o;
    o.reserve(s.size() + 8);
    o += '\'';
    for (char c : s) {
        if (c == '\'') o += "'\\''";
        else o += c;
    }
    o += '\'';
    return o;
}

} // namespace procutil
