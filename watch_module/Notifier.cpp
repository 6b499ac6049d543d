#include "Notifier.h"

#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include "Errors.h"
#include "Log.h"

extern char** environ;

void StdoutConsole::printLine(const std::string& line) {
    writeStdoutLine(line);
}

DesktopNotifier::DesktopNotifier(std::string prog) : program(std::move(prog)) {}

void DesktopNotifier::notify(const std::string& summary, const std::string& body) {
    std::vector<std::string> args = {program, summary, body};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    // posix_spawnp ищет программу по PATH в родителе, в дочернем только exec
    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        throw NotifyError("cannot start " + program + ": " + std::strerror(rc));
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw NotifyError(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw NotifyError(program + " exited with status " + std::to_string(code));
    }
}

void LogNotifier::notify(const std::string& summary, const std::string& body) {
    logInfo("notify", summary + " | " + body);
}
