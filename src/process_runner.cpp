#include "process_runner.hpp"
#include "console.h"
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace PakForge {

std::string describeCommand(const CommandSpec& spec) {
    std::string line = "\"" + spec.executable + "\"";
    for (const auto& arg : spec.args) {
        line += " \"" + arg + "\"";
    }
    return line;
}

static void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Append whatever is currently readable; closes the fd at EOF
static void drain(int& fd, std::string& into) {
    if (fd < 0) return;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            into.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            closeFd(fd);
        } else if (errno == EINTR) {
            continue;
        }
        return;
    }
}

CommandResult PosixCommandRunner::run(const CommandSpec& spec, const CancellationToken& token) {
    CommandResult result;

    if (token.isCancelled()) {
        result.status = CommandStatus::Cancelled;
        return result;
    }

    int outPipe[2], errPipe[2], execPipe[2];
    if (::pipe(outPipe) != 0) {
        result.launchError = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (::pipe(errPipe) != 0) {
        result.launchError = std::string("pipe failed: ") + std::strerror(errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return result;
    }
    if (::pipe2(execPipe, O_CLOEXEC) != 0) {
        result.launchError = std::string("pipe failed: ") + std::strerror(errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        return result;
    }

    std::vector<std::string> argStorage;
    argStorage.push_back(spec.executable);
    argStorage.insert(argStorage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& arg : argStorage) argv.push_back(&arg[0]);
    argv.push_back(nullptr);

    Console::debug("Running ", describeCommand(spec));

    pid_t pid = ::fork();
    if (pid < 0) {
        result.launchError = std::string("fork failed: ") + std::strerror(errno);
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1], execPipe[0], execPipe[1]}) ::close(fd);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        ::close(execPipe[0]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);

        if (!spec.workingDir.empty() && ::chdir(spec.workingDir.c_str()) != 0) {
            int code = errno;
            ssize_t ignored = ::write(execPipe[1], &code, sizeof(code));
            (void)ignored;
            ::_exit(127);
        }
        ::execvp(spec.executable.c_str(), argv.data());
        int code = errno;
        ssize_t ignored = ::write(execPipe[1], &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(execPipe[1]);

    // The exec pipe closes on a successful exec and carries errno otherwise
    int childErrno = 0;
    ssize_t got;
    do {
        got = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (got < 0 && errno == EINTR);
    ::close(execPipe[0]);

    int outFd = outPipe[0];
    int errFd = errPipe[0];

    if (got == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        closeFd(outFd);
        closeFd(errFd);
        result.launchError = "cannot start " + spec.executable + ": " + std::strerror(childErrno);
        return result;
    }

    ::fcntl(outFd, F_SETFL, O_NONBLOCK);
    ::fcntl(errFd, F_SETFL, O_NONBLOCK);

    Deadline deadline(spec.timeout);
    int status = 0;
    bool exited = false;

    while (true) {
        pollfd fds[2];
        nfds_t count = 0;
        if (outFd >= 0) fds[count++] = {outFd, POLLIN, 0};
        if (errFd >= 0) fds[count++] = {errFd, POLLIN, 0};
        if (count > 0) {
            ::poll(fds, count, 50);
        } else {
            ::usleep(50 * 1000);
        }
        drain(outFd, result.output);
        drain(errFd, result.errorOutput);

        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            exited = true;
            break;
        }

        if (token.isCancelled()) {
            result.status = CommandStatus::Cancelled;
            break;
        }
        if (deadline.expired()) {
            result.status = CommandStatus::TimedOut;
            break;
        }
    }

    if (!exited) {
        ::kill(-pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        Console::warn(spec.executable, result.status == CommandStatus::TimedOut ? " timed out" : " cancelled",
                      "; process group killed");
    }

    drain(outFd, result.output);
    drain(errFd, result.errorOutput);
    closeFd(outFd);
    closeFd(errFd);

    if (exited) {
        result.status = CommandStatus::Exited;
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }
    }
    return result;
}

} // namespace PakForge
