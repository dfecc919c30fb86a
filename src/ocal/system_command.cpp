#include "system_command.h"
#include "../common/structured_logger.h"
#include "../common/string_utils.h"
#include "../common/raii_wrappers.h"
#include <cstring>
#include <cerrno>

#ifndef _WIN32
#include <unistd.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#endif

namespace calcpilot {
namespace ocal {
namespace system {

#ifdef _WIN32
namespace {
    std::wstring utf8ToWide(const std::string& text) {
        int size = MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, nullptr, 0);
        if (size <= 1) {
            return L"";
        }
        std::wstring result(static_cast<size_t>(size - 1), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, &result[0], size);
        return result;
    }
}
#endif

CommandResult launchDetached(const std::string& command) {
    CommandResult result;
    result.command = command;

    if (utils::StringUtils::isWhitespaceOnly(command)) {
        result.error = "Launch command is empty";
        return result;
    }

    SLOG_DEBUG().component("system").message("Launching command").context("command", command);

#ifdef _WIN32
    STARTUPINFOW si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    ZeroMemory(&pi, sizeof(pi));
    si.cb = sizeof(si);

    std::wstring commandLine = utf8ToWide(command);
    BOOL started = CreateProcessW(
        nullptr,
        &commandLine[0],
        nullptr,
        nullptr,
        FALSE,
        DETACHED_PROCESS,
        nullptr,
        nullptr,
        &si,
        &pi
    );

    if (!started) {
        result.error = "CreateProcessW failed with error " + std::to_string(GetLastError());
        return result;
    }

    raii::ProcessHandles handles(pi);
    result.success = true;
    result.processId = pi.dwProcessId;
#else
    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        // Child: new session so the application outlives us
        setsid();
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    result.success = true;
    result.processId = static_cast<unsigned long>(pid);
#endif

    SLOG_INFO().component("system")
        .message("Command launched")
        .context("command", command)
        .context("pid", result.processId);
    return result;
}

ProcessStatus queryProcess(unsigned long processId) {
    ProcessStatus status;
    if (processId == 0) {
        return status;
    }
#ifdef _WIN32
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(processId));
    if (!process) {
        return status;
    }
    DWORD exitCode = 0;
    BOOL queried = GetExitCodeProcess(process, &exitCode);
    CloseHandle(process);
    if (queried) {
        status.running = exitCode == STILL_ACTIVE;
        if (!status.running) {
            status.exitCode = static_cast<int>(exitCode);
        }
    }
#else
    // Reaps our own children once they exit
    int waitStatus = 0;
    pid_t waited = waitpid(static_cast<pid_t>(processId), &waitStatus, WNOHANG);
    if (waited == 0) {
        status.running = true;
    } else if (waited > 0) {
        if (WIFEXITED(waitStatus)) {
            status.exitCode = WEXITSTATUS(waitStatus);
        } else if (WIFSIGNALED(waitStatus)) {
            status.exitCode = 128 + WTERMSIG(waitStatus);
        }
    } else {
        status.running = kill(static_cast<pid_t>(processId), 0) == 0;
    }
#endif
    return status;
}

bool isLaunchFailureExitCode(int exitCode) {
    return exitCode == 126 || exitCode == 127;
}

} // namespace system
} // namespace ocal
} // namespace calcpilot
