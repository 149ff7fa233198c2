
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cstdio>
#include <cstring>
#include <cerrno>

#include "planner/process_planner.h"
#include "planner/pddl_writer.h"
#include "planner/plan_parser.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/signal_manager.h"

namespace {
    std::string quote(const std::string& path) {
        std::string out = "'";
        for (char c : path) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        return out + "'";
    }
    void replaceAll(std::string& str, const std::string& from, const std::string& to) {
        size_t pos = 0;
        while ((pos = str.find(from, pos)) != std::string::npos) {
            str.replace(pos, from.size(), to);
            pos += to.size();
        }
    }
}

std::string ProcessPlanner::buildCommand() const {
    std::string cmd = _config.command;
    replaceAll(cmd, "{domain}", quote(getDomainFile()));
    replaceAll(cmd, "{problem}", quote(getProblemFile()));
    replaceAll(cmd, "{plan}", quote(getPlanFile()));
    return cmd;
}

bool ProcessPlanner::isUnsolvableExitCode(int code) const {
    for (int c : _config.unsolvableExitCodes) if (c == code) return true;
    return false;
}

PlannerResult ProcessPlanner::findPlan(const Problem& problem, const Deadline& deadline) {

    PlannerResult result;
    if (_config.command.empty()) {
        result.message = "No planner command configured";
        return result;
    }

    try {
        PddlWriter writer(problem);
        if (!writer.writeFiles(getDomainFile(), getProblemFile())) {
            result.message = "Cannot write PDDL files to " + _config.workDir;
            return result;
        }
    } catch (const EncodingError& e) {
        result.message = std::string("Cannot serialize problem: ") + e.what();
        return result;
    }
    // A stale plan file must not be mistaken for a result
    std::remove(getPlanFile().c_str());

    std::string cmd = buildCommand();
    std::string logFile = getLogFile();
    Log::v("Executing: %s\n", cmd.c_str());

    pid_t pid = fork();
    if (pid < 0) {
        result.message = std::string("fork failed: ") + strerror(errno);
        return result;
    }
    if (pid == 0) {
        // Child: own process group, output to the log file
        setpgid(0, 0);
        int fd = open(logFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd >= 0) {
            dup2(fd, STDOUT_FILENO);
            dup2(fd, STDERR_FILENO);
            close(fd);
        }
        execl("/bin/sh", "sh", "-c", cmd.c_str(), (char*) nullptr);
        _exit(127);
    }
    // Also set in the parent so that the group exists before any kill
    setpgid(pid, pid);

    int status = 0;
    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            result.message = std::string("waitpid failed: ") + strerror(errno);
            kill(-pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return result;
        }
        if (deadline.expired() || SignalManager::isExitSet()) {
            kill(-pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            result.status = TIMEOUT;
            result.message = SignalManager::isExitSet() ? "Interrupted" : "Planner exceeded the time budget";
            return result;
        }
        usleep(1000 * _config.pollMillis);
    }

    if (WIFSIGNALED(status)) {
        result.message = "Planner was killed by signal " + std::to_string(WTERMSIG(status));
        return result;
    }
    int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    Log::v("Planner exited with code %i\n", exitCode);
    if (isUnsolvableExitCode(exitCode)) {
        result.status = UNSATISFIABLE;
        result.message = "Planner reports that no plan exists (exit code " + std::to_string(exitCode) + ")";
        return result;
    }

    struct stat st;
    if (stat(getPlanFile().c_str(), &st) != 0) {
        result.message = "Planner exited with code " + std::to_string(exitCode) + " without writing a plan";
        return result;
    }
    std::string error;
    if (!PlanParser(problem).parseFile(getPlanFile(), result.plan, error)) {
        result.message = "Malformed plan: " + error;
        return result;
    }
    if (exitCode != 0) Log::w("Planner exited with code %i but wrote a plan\n", exitCode);
    result.status = SOLVED;
    return result;
}
