#include "ProcessUtils.h"

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#define popen_compat _popen
#define pclose_compat _pclose
#else
#include <sys/wait.h>
#define popen_compat popen
#define pclose_compat pclose
#endif

namespace SceneStitch {

int runCommand(const std::string& cmdLine, std::string& output) {
    if (cmdLine.empty()) {
        output += "Error: empty command line";
        return -1;
    }

    std::string fullCmd = cmdLine + " 2>&1";
    FILE* pipe = popen_compat(fullCmd.c_str(), "r");
    if (!pipe) {
        output += "Error: could not start command";
        return -1;
    }

    char buffer[512];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }
    int status = pclose_compat(pipe);

#ifdef _WIN32
    return status;
#else
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
#endif
}

std::string shellQuote(const std::string& arg) {
#ifdef _WIN32
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"') quoted += "\\\"";
        else quoted += c;
    }
    quoted += "\"";
    return quoted;
#else
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
#endif
}

} // namespace SceneStitch
