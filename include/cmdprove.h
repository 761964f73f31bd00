#ifndef CMDPROVE_H
#define CMDPROVE_H

#include <array>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace cmdprove {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitAborted = 3;

// Usage or internal error inside a test script. Aborts the script (exit code 3).
class TestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Error of the harness itself, raised by the driver (exit code 2).
class HarnessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Channel {
    Out,
    Err,
    Ret
};

enum class CompareMode {
    Exact,
    Pattern,
    Ignore
};

enum class ValueSource {
    Default,
    Literal,
    File
};

constexpr std::array<Channel, 3> kChannels{Channel::Out, Channel::Err, Channel::Ret};

std::string channelName(Channel channel);
std::string channelExtension(Channel channel);

struct Expectation {
    CompareMode mode{CompareMode::Exact};
    ValueSource source{ValueSource::Default};
    std::string value; // literal text, or a path for ValueSource::File
};

struct AssertionRequest {
    std::string description;
    std::array<Expectation, 3> expected{};
    bool preserveNewlines{false};
    bool failOnError{false};
    std::optional<std::string> input;
    std::vector<std::string> command;

    Expectation& expectation(Channel channel);
    [[nodiscard]] const Expectation& expectation(Channel channel) const;
};

// Parses `[-d] {description} [options] -- {command...}`. Throws TestError on misuse.
AssertionRequest parseAssertionArgs(const std::vector<std::string>& args);

// Returns nothing when `actual` satisfies `expected` under `mode`, otherwise a
// human readable explanation (a unified diff for exact mode).
std::optional<std::string> compare(CompareMode mode, const std::string& expected, const std::string& actual);

// Extended glob match of the whole `text` (`*`, `?`, `[...]`, `?()`, `*()`, `+()`, `@()`, `!()`).
// Text or pattern containing a NUL byte never matches.
bool matchesPattern(const std::string& pattern, const std::string& text);

struct CapturePaths {
    std::filesystem::path out;
    std::filesystem::path err;
    std::filesystem::path ret;

    [[nodiscard]] const std::filesystem::path& of(Channel channel) const;
};

class CaptureStore {
public:
    static constexpr int kMaxCandidates = 100;

    explicit CaptureStore(std::filesystem::path directory);

    CapturePaths allocate(const std::string& baseName = "test");
    [[nodiscard]] const std::filesystem::path& directory() const;

private:
    std::filesystem::path directory_;
};

class TestAccounting {
public:
    explicit TestAccounting(std::ostream& out);

    void enter(const std::string& name);
    void record(const std::string& name, bool passed);
    bool exit();

    void note(const std::string& text, int indentLevel = 0);
    void printIndented(const std::string& text);

    [[nodiscard]] std::size_t depth() const;
    [[nodiscard]] int passed() const;
    [[nodiscard]] int failed() const;

private:
    struct Level {
        std::string name;
        int ordinal{0};
        int passed{0};
        int failed{0};
    };

    std::ostream& out_;
    std::vector<Level> levels_;
};

// Keeps one accounting level open for the lifetime of the guard.
class LevelGuard {
public:
    LevelGuard(TestAccounting& accounting, const std::string& name);
    ~LevelGuard();

    LevelGuard(const LevelGuard&) = delete;
    LevelGuard& operator=(const LevelGuard&) = delete;

    bool close();

private:
    TestAccounting& accounting_;
    std::size_t depth_;
    bool open_{true};
};

class CommandRunner {
public:
    int run(const std::vector<std::string>& command, const CapturePaths& paths, bool preserveNewlines,
            const std::optional<std::string>& input = std::nullopt) const;

private:
    int waitForChild(pid_t pid) const;
};

struct HarnessConfig {
    bool debug{false};
    std::filesystem::path outputDir;
    std::string runName{"test"};
    std::string functionPattern{"test_*"};
    std::array<bool, 3> ignoreByDefault{};
    std::vector<std::string> includeSubtests;
    std::string sourcePath;

    static HarnessConfig fromEnvironment();
};

class TestSession;

using TestFunction = std::function<int(TestSession&)>;

class TestSession {
public:
    TestSession(HarnessConfig config, std::ostream& out);

    void note(const std::string& text, int indentLevel = 0);
    void describe(const std::string& text);

    int assertCommand(const std::vector<std::string>& args);
    int check(const AssertionRequest& request);
    bool subtest(const std::string& name, const TestFunction& body);

    TestAccounting& accounting();
    [[nodiscard]] const HarnessConfig& config() const;
    [[nodiscard]] const std::string& lastStderrFile() const;

private:
    std::string loadExpected(const Expectation& expectation, Channel channel, bool preserveNewlines) const;
    std::optional<std::string> checkExitStatus(CompareMode mode, const std::string& expected, int status) const;
    void reportFailure(Channel channel, CompareMode mode, const std::string& detail, const CapturePaths& paths);
    void invoke(const std::string& name, const TestFunction& body);

    HarnessConfig config_;
    TestAccounting accounting_;
    CaptureStore captures_;
    CommandRunner runner_;
    std::string lastStderrFile_;
};

struct TestEntry {
    std::string name;
    TestFunction func;
    std::string file;
    unsigned line{0};
};

class TestScript {
public:
    explicit TestScript(std::source_location origin = std::source_location::current());

    void add(std::string name, TestFunction func, std::source_location where = std::source_location::current());
    [[nodiscard]] std::vector<const TestEntry*> discover(const std::string& namePattern) const;
    [[nodiscard]] const std::string& sourceFile() const;

    int run(TestSession& session) const;
    int main(int argc, char** argv) const;

private:
    std::string sourceFile_;
    std::vector<TestEntry> entries_;
};

// Copies everything read from one descriptor to a live descriptor while keeping
// the most recent bytes for later inspection.
class StreamTee {
public:
    static constexpr std::size_t kDefaultCaptureLimit = 1 << 20;

    StreamTee(int sourceFd, int liveFd, std::size_t captureLimit = kDefaultCaptureLimit);
    ~StreamTee();

    StreamTee(const StreamTee&) = delete;
    StreamTee& operator=(const StreamTee&) = delete;

    std::string finish();

private:
    void pump();
    void trim();

    int sourceFd_;
    int liveFd_;
    std::size_t captureLimit_;
    std::string captured_;
    std::thread reader_;
};

struct DriverOptions {
    std::vector<std::string> scripts;
    std::map<std::string, std::string> inclusion; // function name -> script
    std::filesystem::path outputDir;
    std::string functionPattern{"test_*"};
    bool debug{false};
    bool showHelp{false};
    std::optional<std::string> helpTopic;
    int liveFd{STDOUT_FILENO};

    void applyEnvironment();
};

DriverOptions parseDriverArgs(int argc, char** argv);

class Driver {
public:
    explicit Driver(DriverOptions options);

    int runScript(const std::string& script);
    int runAll();

    [[nodiscard]] const DriverOptions& options() const;

private:
    std::vector<std::string> filterFor(const std::string& script) const;
    std::vector<std::string> buildEnvironment(const std::string& script, const std::string& path) const;
    int launch(const std::string& path, const std::vector<std::string>& environment, std::string& capturedErr);
    void printErrorDetails(const std::string& capturedErr);
    void say(const std::string& line);

    DriverOptions options_;
};

void printUsage(std::ostream& os);
bool printApiHelp(const std::string& topic, std::ostream& os);

} // namespace cmdprove

#endif //CMDPROVE_H
