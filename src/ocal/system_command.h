#ifndef CALCPILOT_SYSTEM_COMMAND_H
#define CALCPILOT_SYSTEM_COMMAND_H

#include <string>
#include <optional>

namespace calcpilot {
namespace ocal {
namespace system {

struct CommandResult {
    bool success;
    unsigned long processId;
    std::string error;
    std::string command;

    CommandResult() : success(false), processId(0) {}
};

/**
 * Start a command without waiting for it
 *
 * Windows runs the command line directly through CreateProcessW; other
 * platforms hand it to /bin/sh -c in a detached child.
 *
 * @param command Command line to start
 * @return CommandResult with the child's process id on success
 */
CommandResult launchDetached(const std::string& command);

struct ProcessStatus {
    bool running;
    std::optional<int> exitCode;

    ProcessStatus() : running(false) {}
};

// For a child started by launchDetached this also collects its exit status
ProcessStatus queryProcess(unsigned long processId);

// Exit codes a shell uses when the command could not be found or executed
bool isLaunchFailureExitCode(int exitCode);

} // namespace system
} // namespace ocal
} // namespace calcpilot

#endif // CALCPILOT_SYSTEM_COMMAND_H
