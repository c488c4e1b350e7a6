/**
 * ProcessRunner.cpp - Spawn a utility, capture its output, bound its runtime
 *
 * fork/exec with pipes for stdout and stderr and a close-on-exec status pipe
 * that reports chdir/exec failures back to the parent.
 */

#include "ut/ProcessRunner.hpp"
#include "ut/Log.hpp"
#include "ut/Result.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ut {

namespace {

const size_t MAX_CAPTURE = 1024 * 1024;
const int POLL_SLICE_MS = 50;

enum ChildStage : int { STAGE_CHDIR = 1, STAGE_EXEC = 2 };

struct FailureReport {
    int stage;
    int error;
};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void killAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

void appendCapped(std::string& target, const char* data, size_t size, bool& truncated) {
    if (target.size() >= MAX_CAPTURE) {
        truncated = true;
        return;
    }
    size_t room = MAX_CAPTURE - target.size();
    if (size > room) {
        size = room;
        truncated = true;
    }
    target.append(data, size);
}

} // anonymous namespace

ProcessOutput ProcessRunner::run(const std::vector<std::string>& argv,
                                 const std::string& cwd,
                                 std::chrono::milliseconds timeout,
                                 const std::atomic<bool>* cancel) {
    if (argv.empty()) {
        throw HandlerError(ErrorKind::InvalidArgument, "no program given");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        for (int* fds : {out_pipe, err_pipe, status_pipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        throw HandlerError(ErrorKind::Internal, std::string("pipe failed: ") + std::strerror(saved));
    }

    std::vector<char*> c_argv;
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int* fds : {out_pipe, err_pipe, status_pipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        throw HandlerError(ErrorKind::Internal, std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        FailureReport report{0, 0};
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            report = {STAGE_CHDIR, errno};
        } else {
            ::execvp(c_argv[0], c_argv.data());
            report = {STAGE_EXEC, errno};
        }
        ssize_t written = ::write(status_pipe[1], &report, sizeof(report));
        (void)written;
        ::_exit(127);
    }

    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);
    closeFd(status_pipe[1]);

    FailureReport report{0, 0};
    ssize_t got;
    do {
        got = ::read(status_pipe[0], &report, sizeof(report));
    } while (got < 0 && errno == EINTR);
    closeFd(status_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(report))) {
        closeFd(out_pipe[0]);
        closeFd(err_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

        std::string what = report.stage == STAGE_CHDIR ? "cannot enter " + cwd : argv[0];
        std::string message = what + ": " + std::strerror(report.error);
        if (report.error == ENOENT || report.error == ENOTDIR) {
            throw HandlerError(ErrorKind::NotFound, message);
        }
        if (report.error == EACCES || report.error == EPERM) {
            throw HandlerError(ErrorKind::PermissionDenied, message);
        }
        throw HandlerError(ErrorKind::InvalidArgument, message);
    }

    Logger::debug("process", "spawned " + argv[0] + " pid=" + std::to_string(pid));

    auto deadline = std::chrono::steady_clock::now() + timeout;
    ProcessOutput output;
    bool truncated = false;
    char buffer[4096];

    auto checkLimits = [&]() {
        if (cancel != nullptr && cancel->load()) {
            killAndReap(pid);
            closeFd(out_pipe[0]);
            closeFd(err_pipe[0]);
            throw HandlerError(ErrorKind::Cancelled, argv[0] + ": interrupted");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            killAndReap(pid);
            closeFd(out_pipe[0]);
            closeFd(err_pipe[0]);
            throw HandlerError(ErrorKind::Timeout, argv[0] + ": timed out after " +
                               std::to_string(timeout.count()) + " ms");
        }
    };

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        checkLimits();

        pollfd fds[2];
        nfds_t count = 0;
        int* owners[2];
        std::string* sinks[2];
        if (out_pipe[0] >= 0) {
            fds[count] = {out_pipe[0], POLLIN, 0};
            owners[count] = &out_pipe[0];
            sinks[count] = &output.out;
            ++count;
        }
        if (err_pipe[0] >= 0) {
            fds[count] = {err_pipe[0], POLLIN, 0};
            owners[count] = &err_pipe[0];
            sinks[count] = &output.err;
            ++count;
        }

        int ready = ::poll(fds, count, POLL_SLICE_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            killAndReap(pid);
            closeFd(out_pipe[0]);
            closeFd(err_pipe[0]);
            throw HandlerError(ErrorKind::Internal, std::string("poll failed: ") + std::strerror(saved));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                appendCapped(*sinks[i], buffer, static_cast<size_t>(n), truncated);
            } else if (n == 0 || errno != EINTR) {
                closeFd(*owners[i]);
            }
        }
    }

    int status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            throw HandlerError(ErrorKind::Internal, std::string("waitpid failed: ") + std::strerror(errno));
        }
        checkLimits();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    output.exit_code = decodeStatus(status);
    if (truncated) {
        output.out += "\n... [output truncated]\n";
    }

    Logger::debug("process", argv[0] + " exited with " + std::to_string(output.exit_code));
    return output;
}

} // namespace ut
