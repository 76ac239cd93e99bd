#pragma once

#include <string>

namespace SceneStitch {

// Run a command through the shell and capture stdout+stderr.
// Returns the command's exit code, or -1 if it could not be started or was
// killed by a signal; output is appended to 'output'.
int runCommand(const std::string& cmdLine, std::string& output);

// Quote one argument for the shell used by runCommand.
std::string shellQuote(const std::string& arg);

} // namespace SceneStitch
