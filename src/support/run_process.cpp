//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the helper used to launch external processes. The routine builds
// a shell command line from argv fragments, changes into the requested working
// directory inside the child shell, invokes `popen`, and collects stdout.
//
//===----------------------------------------------------------------------===//

#include "support/run_process.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace thymus::support
{

std::string quoteShellArgument(const std::string &arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('\'');
    for (const char ch : arg)
    {
        if (ch == '\'')
        {
            quoted += "'\\''";
            continue;
        }
        quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

RunResult runProcess(const std::vector<std::string> &argv, const std::optional<std::string> &cwd)
{
    RunResult rr;
    if (argv.empty())
    {
        rr.exitCode = -1;
        return rr;
    }

    std::string cmd;
    if (cwd)
        cmd += "cd " + quoteShellArgument(*cwd) + " && ";
    for (size_t i = 0; i < argv.size(); ++i)
    {
        if (i != 0)
            cmd += ' ';
        cmd += quoteShellArgument(argv[i]);
    }
    cmd += " 2>/dev/null";

    FILE *pipe = popen(cmd.c_str(), "r");
    if (!pipe)
    {
        rr.exitCode = -1;
        return rr;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe))
        rr.out += buffer;

    const int status = pclose(pipe);
    if (status == -1)
        rr.exitCode = -1;
    else if (WIFEXITED(status))
        rr.exitCode = WEXITSTATUS(status);
    else
        rr.exitCode = status;
    return rr;
}

} // namespace thymus::support
