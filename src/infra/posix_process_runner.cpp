#include "posix_process_runner.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging_manager.h"

namespace infra {

static constexpr const char *TAG = "ProcessRunner";

const char *processStatusName(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::Exited:      return "exited";
        case ProcessStatus::NotFound:    return "not_found";
        case ProcessStatus::TimedOut:    return "timeout";
        case ProcessStatus::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}

namespace {

using Clock = std::chrono::steady_clock;

void closeFd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int fds[2] = {-1, -1};

    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    int &readEnd() { return fds[0]; }
    int &writeEnd() { return fds[1]; }
    void closeBoth() {
        closeFd(fds[0]);
        closeFd(fds[1]);
    }
};

// SIGPIPE is ignored while feeding stdin so a child that exits early cannot kill us.
class ScopedIgnoreSigpipe {
public:
    ScopedIgnoreSigpipe() {
        struct sigaction ignore;
        std::memset(&ignore, 0, sizeof(ignore));
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        m_installed = ::sigaction(SIGPIPE, &ignore, &m_previous) == 0;
    }
    ~ScopedIgnoreSigpipe() {
        if (m_installed) {
            ::sigaction(SIGPIPE, &m_previous, nullptr);
        }
    }

private:
    struct sigaction m_previous;
    bool m_installed = false;
};

long remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<long>(left) : 0;
}

void writeAll(int fd, const std::string &data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_DEBUG(TAG, "stdin write stopped: %s", std::strerror(errno));
            return;
        }
        offset += static_cast<size_t>(n);
    }
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

}  // namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string> &argv,
                                      unsigned long timeoutMs,
                                      const std::string &input) {
    ProcessResult result;
    if (argv.empty() || argv.front().empty()) {
        LOG_ERROR(TAG, "Refusing to run an empty argument vector");
        return result;
    }

    PipePair stdinPipe;
    PipePair stdoutPipe;
    PipePair stderrPipe;
    PipePair execPipe;
    if (!stdinPipe.open() || !stdoutPipe.open() || !stderrPipe.open() || !execPipe.open()) {
        LOG_ERROR(TAG, "pipe2() failed: %s", std::strerror(errno));
        stdinPipe.closeBoth();
        stdoutPipe.closeBoth();
        stderrPipe.closeBoth();
        execPipe.closeBoth();
        return result;
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    ScopedIgnoreSigpipe sigpipeGuard;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);

    pid_t pid = ::fork();
    if (pid < 0) {
        LOG_ERROR(TAG, "fork() failed: %s", std::strerror(errno));
        stdinPipe.closeBoth();
        stdoutPipe.closeBoth();
        stderrPipe.closeBoth();
        execPipe.closeBoth();
        return result;
    }

    if (pid == 0) {
        ::dup2(stdinPipe.readEnd(), STDIN_FILENO);
        ::dup2(stdoutPipe.writeEnd(), STDOUT_FILENO);
        ::dup2(stderrPipe.writeEnd(), STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(args[0], args.data());
        int execErrno = errno;
        ssize_t written = ::write(execPipe.writeEnd(), &execErrno, sizeof(execErrno));
        (void)written;
        ::_exit(127);
    }

    closeFd(stdinPipe.readEnd());
    closeFd(stdoutPipe.writeEnd());
    closeFd(stderrPipe.writeEnd());
    closeFd(execPipe.writeEnd());

    // The exec pipe is close-on-exec: EOF means exec succeeded, an int means it failed.
    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe.readEnd(), &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe.readEnd());

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        closeFd(stdinPipe.writeEnd());
        closeFd(stdoutPipe.readEnd());
        closeFd(stderrPipe.readEnd());
        result.status = (execErrno == ENOENT || execErrno == ENOTDIR)
                            ? ProcessStatus::NotFound
                            : ProcessStatus::SpawnFailed;
        result.stderrText = std::strerror(execErrno);
        LOG_WARN(TAG, "exec %s failed: %s", argv.front().c_str(), result.stderrText.c_str());
        return result;
    }

    if (!input.empty()) {
        writeAll(stdinPipe.writeEnd(), input);
    }
    closeFd(stdinPipe.writeEnd());

    bool timedOut = false;
    char buffer[4096];
    while (stdoutPipe.readEnd() >= 0 || stderrPipe.readEnd() >= 0) {
        struct pollfd fds[2];
        nfds_t count = 0;
        int *owners[2];
        std::string *sinks[2];
        if (stdoutPipe.readEnd() >= 0) {
            fds[count].fd = stdoutPipe.readEnd();
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            owners[count] = &stdoutPipe.readEnd();
            sinks[count] = &result.stdoutText;
            ++count;
        }
        if (stderrPipe.readEnd() >= 0) {
            fds[count].fd = stderrPipe.readEnd();
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            owners[count] = &stderrPipe.readEnd();
            sinks[count] = &result.stderrText;
            ++count;
        }

        long waitMs = remainingMs(deadline);
        if (waitMs == 0) {
            timedOut = true;
            break;
        }
        int ready = ::poll(fds, count, static_cast<int>(waitMs));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(TAG, "poll() failed: %s", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            timedOut = true;
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (got > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                closeFd(*owners[i]);
            }
        }
    }

    int status = 0;
    while (!timedOut) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            LOG_ERROR(TAG, "waitpid() failed: %s", std::strerror(errno));
            closeFd(stdoutPipe.readEnd());
            closeFd(stderrPipe.readEnd());
            return result;
        }
        if (remainingMs(deadline) == 0) {
            timedOut = true;
            break;
        }
        ::usleep(5000);
    }

    closeFd(stdoutPipe.readEnd());
    closeFd(stderrPipe.readEnd());

    if (timedOut) {
        ::kill(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        result.status = ProcessStatus::TimedOut;
        LOG_WARN(TAG, "%s timed out after %lu ms", argv.front().c_str(), timeoutMs);
        return result;
    }

    result.status = ProcessStatus::Exited;
    result.exitCode = decodeWaitStatus(status);
    LOG_DEBUG(TAG, "%s exited with %d", argv.front().c_str(), result.exitCode);
    return result;
}

} // namespace infra
