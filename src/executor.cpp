#include "cmdprove.h"
#include "utils.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace cmdprove {

namespace {

struct ScopedFd {
    int fd{-1};

    ScopedFd() = default;
    explicit ScopedFd(int value) : fd(value) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    void reset() {
        if (fd != -1) {
            close(fd);
            fd = -1;
        }
    }
};

// Writing to a pipe whose reader is gone must fail with EPIPE instead of killing
// the test script.
class SigpipeGuard {
public:
    SigpipeGuard() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGPIPE, &ignore, &previous_);
    }
    ~SigpipeGuard() { sigaction(SIGPIPE, &previous_, nullptr); }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    struct sigaction previous_ {};
};

int openCapture(const std::filesystem::path& path) {
    const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        throw TestError("Cannot open capture file '" + path.string() + "': " + std::strerror(errno));
    }
    return fd;
}

void makePipe(ScopedFd& readEnd, ScopedFd& writeEnd) {
    int pipeFd[2] = {-1, -1};
    if (pipe2(pipeFd, O_CLOEXEC) == -1) {
        throw TestError(std::string("pipe: ") + std::strerror(errno));
    }
    readEnd.fd = pipeFd[0];
    writeEnd.fd = pipeFd[1];
}

void drain(ScopedFd& source, TrailingNewlineFilter& filter) {
    char buffer[4096];
    const ssize_t count = read(source.fd, buffer, sizeof(buffer));
    if (count > 0) {
        filter.write(buffer, static_cast<std::size_t>(count));
    } else if (count == 0 || (errno != EINTR && errno != EAGAIN)) {
        source.reset();
    }
}

void feed(ScopedFd& sink, const std::string& input, std::size_t& offset) {
    if (offset < input.size()) {
        const ssize_t count = write(sink.fd, input.data() + offset, input.size() - offset);
        if (count > 0) {
            offset += static_cast<std::size_t>(count);
        } else if (count < 0 && errno != EINTR && errno != EAGAIN) {
            sink.reset();
            return;
        }
    }
    if (offset >= input.size()) {
        sink.reset();
    }
}

// Moves data between the parent and the running command until every pipe is closed.
void transfer(ScopedFd& outRead, ScopedFd& errRead, TrailingNewlineFilter& outFilter,
              TrailingNewlineFilter& errFilter, ScopedFd& inWrite, const std::string& input) {
    std::size_t inputOffset = 0;
    if (inWrite.fd != -1) {
        fcntl(inWrite.fd, F_SETFL, fcntl(inWrite.fd, F_GETFL) | O_NONBLOCK);
    }

    while (outRead.fd != -1 || errRead.fd != -1 || inWrite.fd != -1) {
        std::vector<pollfd> watched;
        if (outRead.fd != -1) {
            watched.push_back(pollfd{outRead.fd, POLLIN, 0});
        }
        if (errRead.fd != -1) {
            watched.push_back(pollfd{errRead.fd, POLLIN, 0});
        }
        if (inWrite.fd != -1) {
            watched.push_back(pollfd{inWrite.fd, POLLOUT, 0});
        }

        if (poll(watched.data(), watched.size(), -1) == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw TestError(std::string("poll: ") + std::strerror(errno));
        }

        for (const pollfd& entry : watched) {
            if (entry.revents == 0) {
                continue;
            }
            if (entry.fd == outRead.fd) {
                drain(outRead, outFilter);
            } else if (entry.fd == errRead.fd) {
                drain(errRead, errFilter);
            } else if (entry.fd == inWrite.fd) {
                feed(inWrite, input, inputOffset);
            }
        }
    }

    outFilter.finish();
    errFilter.finish();
}

} // namespace

int CommandRunner::run(const std::vector<std::string>& command, const CapturePaths& paths, bool preserveNewlines,
                       const std::optional<std::string>& input) const {
    if (command.empty()) {
        throw TestError("Please specify a command to test.");
    }

    ScopedFd outFile(openCapture(paths.out));
    ScopedFd errFile(openCapture(paths.err));
    ScopedFd outRead;
    ScopedFd outWrite;
    ScopedFd errRead;
    ScopedFd errWrite;
    ScopedFd inRead;
    ScopedFd inWrite;

    if (!preserveNewlines) {
        makePipe(outRead, outWrite);
        makePipe(errRead, errWrite);
    }
    if (input) {
        makePipe(inRead, inWrite);
    }

    std::vector<std::string> args = command;
    std::vector<char*> argv = toArgv(args);

    SigpipeGuard sigpipe;
    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = fork();
    if (pid < 0) {
        throw TestError(std::string("fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        signal(SIGPIPE, SIG_DFL);
        if (input) {
            dup2(inRead.fd, STDIN_FILENO);
        }
        dup2(preserveNewlines ? outFile.fd : outWrite.fd, STDOUT_FILENO);
        dup2(preserveNewlines ? errFile.fd : errWrite.fd, STDERR_FILENO);

        execvp(argv.front(), argv.data());
        const int error = errno;
        writeAll(STDERR_FILENO, "cmdprove: " + command.front() + ": " + std::strerror(error) + "\n");
        _exit(error == ENOENT ? 127 : 126);
    }

    outWrite.reset();
    errWrite.reset();
    inRead.reset();

    TrailingNewlineFilter outFilter(outFile.fd);
    TrailingNewlineFilter errFilter(errFile.fd);
    try {
        transfer(outRead, errRead, outFilter, errFilter, inWrite, input.value_or(std::string()));
    } catch (const TestError&) {
        // Closing our ends lets the command finish on EPIPE before it is reaped.
        outRead.reset();
        errRead.reset();
        inWrite.reset();
        waitForChild(pid);
        throw;
    }

    const int status = waitForChild(pid);
    writeFile(paths.ret, std::to_string(status) + "\n");
    return status;
}

int CommandRunner::waitForChild(pid_t pid) const {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw TestError(std::string("waitpid: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

} // namespace cmdprove
