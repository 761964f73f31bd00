#include "cmdprove.h"
#include "utils.h"

#include <cassert>
#include <fcntl.h>
#include <functional>
#include <sstream>
#include <string>
#include <unistd.h>

void addTest(std::string name, std::function<void()> func);

using namespace cmdprove;

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// Runs the driver with its live output redirected to a file.
class DriverFixture {
public:
    DriverFixture() : dir_(createTempDir("/tmp/cmdprove-tests.XXXXXX")), live_(dir_ / "live.log") {
        liveFd_ = open(live_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        assert(liveFd_ != -1);
        options.outputDir = dir_ / "captures";
        std::filesystem::create_directory(options.outputDir);
        options.liveFd = liveFd_;
    }

    ~DriverFixture() {
        close(liveFd_);
        std::filesystem::remove_all(dir_);
    }

    std::string liveOutput() const {
        return readFile(live_);
    }

    DriverOptions options;

private:
    std::filesystem::path dir_;
    std::filesystem::path live_;
    int liveFd_{-1};
};

void passing_script() {
    DriverFixture fixture;
    Driver driver(fixture.options);
    assert(driver.options().outputDir == fixture.options.outputDir);
    assert(driver.runScript(CMDPROVE_SAMPLE_PASS) == kExitPassed);

    const std::string live = fixture.liveOutput();
    assert(contains(live, std::string("# [RUNNING: ") + CMDPROVE_SAMPLE_PASS + "]\n"));
    assert(contains(live, "# Subtest 1 - test_echo\n"));
    assert(contains(live, "  # echo writes its arguments to stdout\n"));
    assert(contains(live, "  ok 1 - echo prints\n"));
    assert(contains(live, "    ok 1 - inner assertion\n"));
    assert(contains(live, "ok 4 - test_nested\n"));
    assert(!contains(live, "test_shared_helper"));
    assert(!contains(live, "helper_not_a_test"));
    assert(contains(live, std::string("All tests passed in: '") + CMDPROVE_SAMPLE_PASS + "'\n"));
}

void failing_script() {
    DriverFixture fixture;
    Driver driver(fixture.options);
    assert(driver.runScript(CMDPROVE_SAMPLE_FAIL) == kExitFailed);

    const std::string live = fixture.liveOutput();
    assert(contains(live, "ok 1 - test_passing\n"));
    assert(contains(live, "not ok 2 - test_wrong_output\n"));
    assert(contains(live, "-world"));
    assert(contains(live, "+hello"));
    assert(contains(live, "Got return code '4', expected '0'."));
    assert(contains(live, "For details, see: "));
    assert(contains(live, std::string("Some tests failed in: '") + CMDPROVE_SAMPLE_FAIL + "'\n"));
    assert(contains(live, "-----[" + (fixture.options.outputDir / "test02.err").string() + "]\noops\n-----\n"));
}

void inclusion_filter() {
    DriverFixture fixture;
    fixture.options.inclusion["test_status"] = CMDPROVE_SAMPLE_PASS;
    Driver driver(fixture.options);
    assert(driver.runScript(CMDPROVE_SAMPLE_PASS) == kExitPassed);

    const std::string live = fixture.liveOutput();
    assert(contains(live, "# Subtest 1 - test_status\n"));
    assert(!contains(live, "test_echo"));

    DriverFixture missing;
    missing.options.inclusion["test_absent"] = CMDPROVE_SAMPLE_PASS;
    Driver strict(missing.options);
    assert(strict.runScript(CMDPROVE_SAMPLE_PASS) == kExitAborted);
    assert(contains(missing.liveOutput(), "Subtest in inclusion list not found in script"));
}

void aborted_script() {
    DriverFixture fixture;
    Driver driver(fixture.options);
    assert(driver.runScript(CMDPROVE_SAMPLE_USAGE_ERROR) == kExitAborted);

    const std::string live = fixture.liveOutput();
    assert(contains(live, "TEST ERROR: Please specify a command to test.\n"));
    assert(contains(live, "ERROR: Test script execution failed.\n"));
    assert(contains(live, "Test script did not finish gracefully.\n"));
    assert(contains(live, "not ok 1 - test_missing_command\n"));
    assert(!contains(live, "after the abort"));
}

void unknown_exit_code() {
    DriverFixture fixture;
    Driver driver(fixture.options);
    assert(driver.runScript(CMDPROVE_SAMPLE_EXIT_CODE) == 5);

    const std::string live = fixture.liveOutput();
    assert(contains(live, "ok 1 - test_passing\n"));
    assert(contains(live, "Unknown error when executing test script (retcode: 5).\n"));
    assert(!contains(live, "All tests passed in:"));
}

void crashed_script() {
    DriverFixture fixture;
    Driver driver(fixture.options);
    assert(driver.runScript(CMDPROVE_SAMPLE_CRASH) == kExitAborted);

    const std::string live = fixture.liveOutput();
    assert(contains(live, "ok 1 - test_before_crash\n"));
    assert(contains(live, "# Test script terminated by signal 9.\n"));
    assert(contains(live, "Test script did not finish gracefully.\n"));
}

void tee_keeps_tail_and_forwards_everything() {
    DriverFixture fixture;
    const std::filesystem::path live = fixture.options.outputDir / "tee.log";
    const int liveFd = open(live.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    assert(liveFd != -1);

    int pipeFd[2] = {-1, -1};
    assert(pipe2(pipeFd, O_CLOEXEC) == 0);

    std::string sent;
    {
        StreamTee tee(pipeFd[0], liveFd, 8);
        for (int i = 0; i < 5; ++i) {
            const std::string chunk = "chunk" + std::to_string(i) + "\n";
            assert(writeAll(pipeFd[1], chunk));
            sent += chunk;
        }
        close(pipeFd[1]);

        const std::string kept = tee.finish();
        assert(kept.size() == 8);
        assert(kept == sent.substr(sent.size() - 8));
    }
    close(liveFd);
    assert(readFile(live) == sent);

    int shortPipe[2] = {-1, -1};
    assert(pipe2(shortPipe, O_CLOEXEC) == 0);
    const int devNull = open("/dev/null", O_WRONLY | O_CLOEXEC);
    assert(devNull != -1);
    StreamTee small(shortPipe[0], devNull, 64);
    assert(writeAll(shortPipe[1], "short"));
    close(shortPipe[1]);
    assert(small.finish() == "short");
    close(devNull);
}

void run_all_scripts() {
    DriverFixture fixture;
    fixture.options.scripts = {CMDPROVE_SAMPLE_PASS, CMDPROVE_SAMPLE_FAIL};
    Driver driver(fixture.options);
    assert(driver.runAll() == kExitFailed);

    const std::string live = fixture.liveOutput();
    assert(contains(live, "All tests passed in:"));
    assert(contains(live, "Some tests failed in:"));

    DriverFixture passing;
    passing.options.scripts = {CMDPROVE_SAMPLE_PASS};
    Driver clean(passing.options);
    assert(clean.runAll() == kExitPassed);
}

void missing_inputs() {
    DriverFixture fixture;
    Driver empty(fixture.options);
    bool usage = false;
    try {
        empty.runAll();
    } catch (const HarnessError&) {
        usage = true;
    }
    assert(usage);

    Driver driver(fixture.options);
    bool aborted = false;
    try {
        driver.runScript("/nonexistent/cmdprove-script");
    } catch (const TestError&) {
        aborted = true;
    }
    assert(aborted);
}

void parses_command_line() {
    const char* args[] = {"cmdprove", "-d", "-o", "/tmp/out", "-p", "check_*", "-t", "dir/a.test:test_one", "b.test",
                          "--", "-odd-name"};
    const DriverOptions options = parseDriverArgs(11, const_cast<char**>(args));
    assert(options.debug);
    assert(options.outputDir == "/tmp/out");
    assert(options.functionPattern == "check_*");
    assert((options.scripts == std::vector<std::string>{"dir/a.test", "b.test", "-odd-name"}));
    assert(options.inclusion.at("test_one") == "dir/a.test");

    const char* bad[] = {"cmdprove", "--frobnicate"};
    bool threw = false;
    try {
        parseDriverArgs(2, const_cast<char**>(bad));
    } catch (const HarnessError&) {
        threw = true;
    }
    assert(threw);

    std::ostringstream help;
    assert(printApiHelp("summary", help));
    assert(contains(help.str(), "assert"));
    assert(contains(help.str(), "subtest"));
    assert(!printApiHelp("no-such-topic", help));
}

} // namespace

void register_driver_tests() {
    addTest("driver passing script", passing_script);
    addTest("driver failing script", failing_script);
    addTest("driver inclusion filter", inclusion_filter);
    addTest("driver aborted script", aborted_script);
    addTest("driver unknown exit code", unknown_exit_code);
    addTest("driver crashed script", crashed_script);
    addTest("driver stream tee", tee_keeps_tail_and_forwards_everything);
    addTest("driver run all", run_all_scripts);
    addTest("driver missing inputs", missing_inputs);
    addTest("driver command line", parses_command_line);
}
