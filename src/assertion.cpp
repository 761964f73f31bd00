#include "cmdprove.h"
#include "utils.h"

#include <charconv>
#include <iostream>
#include <map>

namespace cmdprove {

namespace {

struct ValueOption {
    Channel channel;
    CompareMode mode;
    ValueSource source;
};

const std::map<std::string, ValueOption>& valueOptions() {
    static const std::map<std::string, ValueOption> options = {
        {"-o", {Channel::Out, CompareMode::Exact, ValueSource::Literal}},
        {"-e", {Channel::Err, CompareMode::Exact, ValueSource::Literal}},
        {"-r", {Channel::Ret, CompareMode::Exact, ValueSource::Literal}},
        {"-op", {Channel::Out, CompareMode::Pattern, ValueSource::Literal}},
        {"-ep", {Channel::Err, CompareMode::Pattern, ValueSource::Literal}},
        {"-rp", {Channel::Ret, CompareMode::Pattern, ValueSource::Literal}},
        {"-O", {Channel::Out, CompareMode::Exact, ValueSource::File}},
        {"-E", {Channel::Err, CompareMode::Exact, ValueSource::File}},
        {"-R", {Channel::Ret, CompareMode::Exact, ValueSource::File}},
    };
    return options;
}

const std::map<std::string, Channel>& ignoreFlags() {
    static const std::map<std::string, Channel> flags = {
        {"-oi", Channel::Out},
        {"-ei", Channel::Err},
        {"-ri", Channel::Ret},
    };
    return flags;
}

std::size_t indexOf(Channel channel) {
    return static_cast<std::size_t>(channel);
}

HarnessConfig prepareConfig(HarnessConfig config) {
    if (config.outputDir.empty()) {
        config.outputDir = createTempDir("/tmp/command-verify.XXXXXX");
    }
    if (config.runName.empty()) {
        config.runName = "test";
    }
    return config;
}

} // namespace

Expectation& AssertionRequest::expectation(Channel channel) {
    return expected[indexOf(channel)];
}

const Expectation& AssertionRequest::expectation(Channel channel) const {
    return expected[indexOf(channel)];
}

AssertionRequest parseAssertionArgs(const std::vector<std::string>& args) {
    debug("Assert: " + joinArgs(args));

    if (args.size() < 2) {
        throw TestError("At least two arguments must be provided (description, command).");
    }

    AssertionRequest request;
    std::size_t index = 0;
    if (args[0].empty() || args[0].front() != '-') {
        request.description = args[0];
        index = 1;
    }

    bool haveSeparator = false;
    for (; index < args.size(); ++index) {
        const std::string& arg = args[index];

        if (arg == "--") {
            request.command.assign(args.begin() + static_cast<std::ptrdiff_t>(index) + 1, args.end());
            haveSeparator = true;
            break;
        }
        if (arg == "-p") {
            request.preserveNewlines = true;
            continue;
        }
        if (arg == "-f") {
            request.failOnError = true;
            continue;
        }
        if (const auto it = ignoreFlags().find(arg); it != ignoreFlags().end()) {
            Expectation& expectation = request.expectation(it->second);
            expectation.mode = CompareMode::Ignore;
            expectation.source = ValueSource::Literal;
            expectation.value.clear();
            continue;
        }
        if (arg.empty() || arg.front() != '-') {
            throw TestError("Invalid command-line argument given to the assert function: '" + arg +
                            "' (arg index: " + std::to_string(index + 1) + "). Command-line was: " + joinArgs(args));
        }

        if (index + 1 >= args.size()) {
            throw TestError("Missing value for option: '" + arg + "'");
        }
        const std::string& value = args[++index];

        if (arg == "-d") {
            request.description = value;
            continue;
        }
        const auto it = valueOptions().find(arg);
        if (it == valueOptions().end()) {
            throw TestError("Invalid option for 'assert': '" + arg + "'");
        }
        Expectation& expectation = request.expectation(it->second.channel);
        expectation.mode = it->second.mode;
        expectation.source = it->second.source;
        expectation.value = value;
    }

    if (!haveSeparator || request.command.empty()) {
        throw TestError("Please specify a command to test.");
    }
    if (request.description.empty()) {
        throw TestError("Please specify a description for the test case.");
    }

    debug("Command to test: " + joinArgs(request.command));
    return request;
}

TestSession::TestSession(HarnessConfig config, std::ostream& out)
    : config_(prepareConfig(std::move(config))), accounting_(out), captures_(config_.outputDir) {
    if (config_.debug) {
        setDebugEnabled(true);
    }
}

void TestSession::note(const std::string& text, int indentLevel) {
    accounting_.note(text, indentLevel);
}

void TestSession::describe(const std::string& text) {
    note(text);
}

int TestSession::assertCommand(const std::vector<std::string>& args) {
    return check(parseAssertionArgs(args));
}

int TestSession::check(const AssertionRequest& request) {
    if (request.command.empty()) {
        throw TestError("Please specify a command to test.");
    }
    if (request.description.empty()) {
        throw TestError("Please specify a description for the test case.");
    }

    std::array<CompareMode, 3> modes{};
    std::array<std::string, 3> expected;
    for (const Channel channel : kChannels) {
        Expectation effective = request.expectation(channel);
        if (effective.source == ValueSource::Default) {
            effective.value = channel == Channel::Ret ? "0" : "";
            if (config_.ignoreByDefault[indexOf(channel)]) {
                effective.mode = CompareMode::Ignore;
            }
        }
        modes[indexOf(channel)] = effective.mode;
        expected[indexOf(channel)] = loadExpected(effective, channel, request.preserveNewlines);
    }

    const CapturePaths paths = captures_.allocate(config_.runName);
    debug("STDOUT will be saved to: '" + paths.out.string() + "'.");
    debug("STDERR will be saved to: '" + paths.err.string() + "'.");
    debug("RETCODE will be saved to: '" + paths.ret.string() + "'.");
    lastStderrFile_ = paths.err.string();

    debug("Running test command ...");
    const int status = runner_.run(request.command, paths, request.preserveNewlines, request.input);

    std::vector<std::pair<Channel, std::string>> failures;
    for (const Channel channel : kChannels) {
        const CompareMode mode = modes[indexOf(channel)];

        if (mode == CompareMode::Ignore) {
            const bool empty = channel == Channel::Ret ? status == 0 : readFile(paths.of(channel)).empty();
            if (!empty) {
                note("Ignored " + channelName(channel) + " was not empty. [See: '" + paths.of(channel).string() +
                     "']");
            }
            continue;
        }

        std::optional<std::string> detail;
        if (channel == Channel::Ret) {
            detail = checkExitStatus(mode, expected[indexOf(channel)], status);
        } else {
            detail = compare(mode, expected[indexOf(channel)], readFile(paths.of(channel)));
        }
        if (detail) {
            failures.emplace_back(channel, *detail);
        }
    }

    accounting_.record(request.description, failures.empty());
    for (const auto& [channel, detail] : failures) {
        reportFailure(channel, modes[indexOf(channel)], detail, paths);
    }

    if (!failures.empty() && std::filesystem::file_size(paths.err) > 0) {
        std::cout.flush();
        std::cerr << "For details, see: " << paths.err.string() << std::endl;
    }

    return request.failOnError ? static_cast<int>(failures.size()) : 0;
}

bool TestSession::subtest(const std::string& name, const TestFunction& body) {
    LevelGuard level(accounting_, name);
    invoke(name, body);
    return !level.close();
}

TestAccounting& TestSession::accounting() {
    return accounting_;
}

const HarnessConfig& TestSession::config() const {
    return config_;
}

const std::string& TestSession::lastStderrFile() const {
    return lastStderrFile_;
}

std::string TestSession::loadExpected(const Expectation& expectation, Channel channel, bool preserveNewlines) const {
    std::string value = expectation.value;
    if (expectation.source == ValueSource::File) {
        try {
            value = readFile(expectation.value);
        } catch (const TestError& ex) {
            throw TestError("Failed to read masterfile (type " + channelName(channel) + "): " + ex.what());
        }
    }
    return preserveNewlines ? value : chompNewlines(value);
}

std::optional<std::string> TestSession::checkExitStatus(CompareMode mode, const std::string& expected,
                                                        int status) const {
    if (mode == CompareMode::Pattern) {
        return compare(mode, expected, std::to_string(status));
    }

    const std::string wanted = trimWhitespace(expected);
    int value = 0;
    const auto [end, ec] = std::from_chars(wanted.data(), wanted.data() + wanted.size(), value);
    if (wanted.empty() || ec != std::errc() || end != wanted.data() + wanted.size()) {
        throw TestError("Invalid expected exit status: '" + expected + "'");
    }
    if (value == status) {
        return std::nullopt;
    }
    return "Got return code '" + std::to_string(status) + "', expected '" + wanted + "'.";
}

void TestSession::reportFailure(Channel channel, CompareMode mode, const std::string& detail,
                                const CapturePaths& paths) {
    if (channel == Channel::Ret && mode == CompareMode::Exact) {
        note(detail);
        return;
    }
    note("");
    note("Unexpected " + channelName(channel) + ":");
    note("----------", 1);
    note(detail, 1);
    note("----------", 1);
    note("[See: '" + paths.of(channel).string() + "']", 1);
    note("");
}

void TestSession::invoke(const std::string& name, const TestFunction& body) {
    int rc = 0;
    try {
        rc = body(*this);
    } catch (const TestError&) {
        accounting_.record("Test function aborted: '" + name + "'", false);
        throw;
    } catch (const std::exception& ex) {
        note("Exception: " + std::string(ex.what()));
        accounting_.record("Test function terminated abnormally: '" + name + "'", false);
        return;
    }
    if (rc != 0) {
        accounting_.record("Non-zero retcode from test function: '" + name + "'", false);
    }
}

} // namespace cmdprove
