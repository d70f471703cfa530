#include "backup/rsync_executor.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Child exit status used when exec itself fails.
constexpr int kExecFailed = 127;
constexpr int kPollIntervalMs = 200;
constexpr std::chrono::milliseconds kDefaultKillGracePeriod(10000);

const std::vector<std::string> kCommonOptions = {
    "--delete", "--delete-excluded", "--numeric-ids", "--outbuf=Line", "--stats", "--itemize-changes"
};

std::string withTrailingSlash(const std::string& path) {
    if (!path.empty() && path.back() == '/') {
        return path;
    }
    return path + "/";
}

} // namespace

RsyncExecutor::RsyncExecutor(const CancellationFlag* cancellation, const std::string& program)
    : cancellation_(cancellation)
    , program_(program)
    , killGracePeriod_(kDefaultKillGracePeriod) {
}

std::vector<std::string> RsyncExecutor::buildCommand(const SourceLocator& source,
                                                     const std::string& destination,
                                                     const ExclusionFilter& exclusions) const {
    std::vector<std::string> argv = {program_};
    std::string sourceArg;

    if (const auto* local = std::get_if<LocalSource>(&source)) {
        argv.push_back("-aAXh");
        argv.insert(argv.end(), kCommonOptions.begin(), kCommonOptions.end());
        sourceArg = withTrailingSlash(local->path);
    } else {
        const auto& remote = std::get<RemoteSource>(source);
        argv.push_back("-aXhzs");
        argv.insert(argv.end(), kCommonOptions.begin(), kCommonOptions.end());
        argv.push_back("-e" + remote.shell);
        sourceArg = remote.host + ":" + withTrailingSlash(remote.path);
    }

    // The explicit "- " rule prefix keeps rsync from reading a leading
    // "+ ", "- " or "!" of a name as a rule modifier.
    for (const auto& pattern : exclusions.toRsyncPatterns()) {
        argv.push_back("--exclude=- " + pattern);
    }
    argv.push_back(sourceArg);
    argv.push_back(destination);
    return argv;
}

ErrorKind RsyncExecutor::classifyExitCode(int exitCode, bool permissionDenied) {
    switch (exitCode) {
        case 0:
            return ErrorKind::None;
        case 5:    // error starting client-server protocol
        case 10:   // error in socket I/O
        case 12:   // error in rsync protocol data stream, usually the remote shell died
        case 30:   // timeout in data send/receive
        case 35:   // timeout waiting for daemon connection
        case 255:  // remote shell could not connect
            return ErrorKind::SourceUnreachable;
        case 20:   // received SIGUSR1 or SIGINT
            return ErrorKind::Interrupted;
        case 23:   // partial transfer due to error
            return permissionDenied ? ErrorKind::Permission : ErrorKind::Transfer;
        default:
            return ErrorKind::Transfer;
    }
}

SyncOutcome RsyncExecutor::reconcile(const SourceLocator& source,
                                     const std::string& destination,
                                     const ExclusionFilter& exclusions) {
    std::vector<std::string> argv = buildCommand(source, destination, exclusions);
    Logger::info(utils::joinCommand(argv));
    return runCommand(argv);
}

void RsyncExecutor::emitLine(const std::string& line, bool& permissionDenied) {
    if (line.find("Permission denied") != std::string::npos) {
        permissionDenied = true;
    }
    if (outputCallback_) {
        outputCallback_(line);
    } else {
        Logger::info(line);
    }
}

SyncOutcome RsyncExecutor::runCommand(const std::vector<std::string>& argv) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return SyncOutcome::failure(ErrorKind::Transfer, -1,
                                    std::string("cannot create pipe: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return SyncOutcome::failure(ErrorKind::Transfer, -1, std::string("cannot fork: ") + std::strerror(err));
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        execvp(args[0], args.data());
        _exit(kExecFailed);
    }
    ::close(fds[1]);

    bool permissionDenied = false;
    bool interrupted = false;
    bool killed = false;
    bool reaped = false;
    int status = 0;
    std::chrono::steady_clock::time_point terminatedAt;
    std::string pending;
    char buf[4096];
    struct pollfd pfd;
    pfd.fd = fds[0];
    pfd.events = POLLIN;

    for (;;) {
        if (!interrupted && cancellation_ && cancellation_->isCancelled()) {
            Logger::warning("Cancellation requested, stopping " + program_);
            kill(pid, SIGTERM);
            interrupted = true;
            terminatedAt = std::chrono::steady_clock::now();
        }
        if (interrupted) {
            if (!killed && std::chrono::steady_clock::now() - terminatedAt >= killGracePeriod_) {
                Logger::warning(program_ + " ignored SIGTERM, sending SIGKILL");
                kill(pid, SIGKILL);
                killed = true;
            }
            // A descendant may keep the pipe open after the child is gone.
            if (waitpid(pid, &status, WNOHANG) == pid) {
                reaped = true;
                break;
            }
        }
        int ready = poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        pending.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            emitLine(pending.substr(0, pos), permissionDenied);
            pending.erase(0, pos + 1);
        }
    }
    if (!pending.empty()) {
        emitLine(pending, permissionDenied);
    }
    ::close(fds[0]);

    while (!reaped && waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return SyncOutcome::failure(ErrorKind::Transfer, -1,
                                        std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (interrupted) {
        return SyncOutcome::failure(ErrorKind::Interrupted, WIFEXITED(status) ? WEXITSTATUS(status) : -1,
                                    program_ + " stopped by cancellation");
    }
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        return SyncOutcome::failure(sig == SIGINT || sig == SIGTERM ? ErrorKind::Interrupted : ErrorKind::Transfer,
                                    -1, program_ + " killed by signal " + std::to_string(sig));
    }

    int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exitCode == kExecFailed) {
        return SyncOutcome::failure(ErrorKind::Transfer, exitCode, "could not execute " + program_);
    }
    ErrorKind kind = classifyExitCode(exitCode, permissionDenied);
    if (kind == ErrorKind::None) {
        return SyncOutcome::success();
    }
    return SyncOutcome::failure(kind, exitCode,
                                program_ + " failed with exit code " + std::to_string(exitCode));
}
