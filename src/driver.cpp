#include "cmdprove.h"
#include "utils.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace cmdprove {

namespace {

const std::string kDetailsPrefix = "For details, see: ";

// Test scripts must be self-contained, so nothing they start may wait on our input.
void detachStandardInput() {
    const int devNull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devNull == -1) {
        close(STDIN_FILENO);
        return;
    }
    dup2(devNull, STDIN_FILENO);
    close(devNull);
}

} // namespace

StreamTee::StreamTee(int sourceFd, int liveFd, std::size_t captureLimit)
    : sourceFd_(sourceFd), liveFd_(liveFd), captureLimit_(captureLimit), reader_([this] { pump(); }) {}

StreamTee::~StreamTee() {
    if (reader_.joinable()) {
        reader_.join();
    }
    if (sourceFd_ != -1) {
        close(sourceFd_);
    }
}

std::string StreamTee::finish() {
    if (reader_.joinable()) {
        reader_.join();
    }
    if (sourceFd_ != -1) {
        close(sourceFd_);
        sourceFd_ = -1;
    }
    trim();
    return captured_;
}

void StreamTee::pump() {
    char buffer[4096];
    while (true) {
        const ssize_t count = read(sourceFd_, buffer, sizeof(buffer));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (count == 0) {
            break;
        }
        writeAll(liveFd_, buffer, static_cast<std::size_t>(count));
        captured_.append(buffer, static_cast<std::size_t>(count));
        // Trimming only past twice the limit keeps the copy cost linear in the stream size.
        if (captured_.size() >= 2 * captureLimit_) {
            trim();
        }
    }
}

void StreamTee::trim() {
    if (captured_.size() > captureLimit_) {
        captured_.erase(0, captured_.size() - captureLimit_);
    }
}

Driver::Driver(DriverOptions options) : options_(std::move(options)) {
    if (options_.debug) {
        setDebugEnabled(true);
    }
}

int Driver::runAll() {
    if (options_.scripts.empty()) {
        throw HarnessError("No tests given. Pass '--help' to see usage.");
    }

    detachStandardInput();

    int failures = 0;
    for (const auto& script : options_.scripts) {
        if (runScript(script) != kExitPassed) {
            ++failures;
        }
    }
    return failures == 0 ? kExitPassed : kExitFailed;
}

int Driver::runScript(const std::string& script) {
    if (script.empty() || !std::filesystem::is_regular_file(script)) {
        throw TestError("Test file not found: '" + script + "'.");
    }
    if (options_.outputDir.empty()) {
        options_.outputDir = createTempDir("/tmp/command-verify.XXXXXX");
        debug("Output dir: " + options_.outputDir.string());
    }

    // An explicit directory part keeps execve from searching PATH.
    const std::string path = script.front() == '/' ? script : "./" + script;
    say("# [RUNNING: " + path + "]");

    std::string capturedErr;
    const int rc = launch(path, buildEnvironment(script, path), capturedErr);

    switch (rc) {
        case kExitPassed: say("All tests passed in: '" + path + "'"); break;
        case kExitFailed: say("Some tests failed in: '" + path + "'"); break;
        case kExitAborted: say("Test script did not finish gracefully."); break;
        default: say("Unknown error when executing test script (retcode: " + std::to_string(rc) + ")."); break;
    }

    if (rc != kExitPassed) {
        printErrorDetails(capturedErr);
    }
    return rc;
}

const DriverOptions& Driver::options() const {
    return options_;
}

std::vector<std::string> Driver::filterFor(const std::string& script) const {
    std::vector<std::string> subtests;
    for (const auto& [function, owner] : options_.inclusion) {
        if (owner == script) {
            subtests.push_back(function);
        }
    }
    return subtests;
}

std::vector<std::string> Driver::buildEnvironment(const std::string& script, const std::string& path) const {
    std::map<std::string, std::string> variables;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string item = *entry;
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        variables[item.substr(0, eq)] = item.substr(eq + 1);
    }

    variables["TEST_OUT_DIR"] = options_.outputDir.string();
    variables["TEST_SOURCE_PATH"] = path;
    variables["TEST_SOURCE_DIR"] = std::filesystem::path(path).parent_path().string();
    variables["TEST_FUNC_PATTERN"] = options_.functionPattern;
    if (options_.debug) {
        variables["TEST_DEBUG"] = "1";
    }

    const std::vector<std::string> subtests = filterFor(script);
    if (subtests.empty()) {
        variables.erase("TEST_INCLUDE_SUBTESTS");
    } else {
        variables["TEST_INCLUDE_SUBTESTS"] = joinArgs(subtests);
    }

    std::vector<std::string> environment;
    environment.reserve(variables.size());
    for (const auto& [name, value] : variables) {
        environment.push_back(name + "=" + value);
    }
    return environment;
}

int Driver::launch(const std::string& path, const std::vector<std::string>& environment, std::string& capturedErr) {
    int errPipe[2] = {-1, -1};
    if (pipe2(errPipe, O_CLOEXEC) == -1) {
        throw HarnessError(std::string("pipe: ") + std::strerror(errno));
    }

    std::vector<std::string> args{path};
    std::vector<std::string> env = environment;
    std::vector<char*> argv = toArgv(args);
    std::vector<char*> envp = toArgv(env);

    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = fork();
    if (pid < 0) {
        close(errPipe[0]);
        close(errPipe[1]);
        throw HarnessError(std::string("fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // stdout goes straight to the live view; stderr is split by the tee below.
        if (options_.liveFd != STDOUT_FILENO) {
            dup2(options_.liveFd, STDOUT_FILENO);
        }
        dup2(errPipe[1], STDERR_FILENO);
        execve(path.c_str(), argv.data(), envp.data());
        writeAll(STDERR_FILENO, "ERROR: Cannot execute test script '" + path + "': " + std::strerror(errno) + "\n");
        _exit(127);
    }

    close(errPipe[1]);
    StreamTee tee(errPipe[0], options_.liveFd);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw HarnessError(std::string("waitpid: ") + std::strerror(errno));
        }
    }
    capturedErr = tee.finish();

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        say("# Test script terminated by signal " + std::to_string(WTERMSIG(status)) + ".");
    }
    return kExitAborted;
}

void Driver::printErrorDetails(const std::string& capturedErr) {
    std::istringstream in(capturedErr);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.starts_with(kDetailsPrefix)) {
            continue;
        }

        const std::string file = line.substr(kDetailsPrefix.size());
        std::ifstream detail(file, std::ios::binary);
        if (!detail) {
            logError("Error file not found or not readable: '" + file + "'");
            continue;
        }
        const std::string content((std::istreambuf_iterator<char>(detail)), std::istreambuf_iterator<char>());

        say("-----[" + file + "]");
        writeAll(options_.liveFd, content);
        say("");
        say("-----");
    }
}

void Driver::say(const std::string& line) {
    writeAll(options_.liveFd, line + "\n");
}

} // namespace cmdprove
