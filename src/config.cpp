#include "cmdprove.h"
#include "utils.h"

#include <algorithm>

namespace cmdprove {

HarnessConfig HarnessConfig::fromEnvironment() {
    HarnessConfig config;
    config.debug = !getenvOr("TEST_DEBUG").empty();
    config.outputDir = getenvOr("TEST_OUT_DIR");
    config.runName = getenvOr("TEST_NAME", "test");
    if (config.runName.empty()) {
        config.runName = "test";
    }
    config.functionPattern = getenvOr("TEST_FUNC_PATTERN", "test_*");
    if (config.functionPattern.empty()) {
        config.functionPattern = "test_*";
    }
    config.ignoreByDefault = {!getenvOr("TEST_IGNORE_OUT").empty(), !getenvOr("TEST_IGNORE_ERR").empty(),
                              !getenvOr("TEST_IGNORE_RET").empty()};
    config.includeSubtests = splitWords(getenvOr("TEST_INCLUDE_SUBTESTS"));
    config.sourcePath = getenvOr("TEST_SOURCE_PATH");
    return config;
}

void DriverOptions::applyEnvironment() {
    debug = !getenvOr("TEST_DEBUG").empty();
    outputDir = getenvOr("TEST_OUT_DIR");
    const std::string pattern = getenvOr("TEST_FUNC_PATTERN");
    if (!pattern.empty()) {
        functionPattern = pattern;
    }
}

DriverOptions parseDriverArgs(int argc, char** argv) {
    DriverOptions options;
    options.applyEnvironment();

    const auto requireValue = [&](int& index, const std::string& flag) -> std::string {
        if (index + 1 >= argc) {
            throw HarnessError("Missing value for option: '" + flag + "'");
        }
        return argv[++index];
    };

    bool onlyScripts = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (onlyScripts || arg.empty() || arg.front() != '-') {
            options.scripts.push_back(arg);
            continue;
        }

        if (arg == "--") {
            onlyScripts = true;
        } else if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-H" || arg == "--help-api") {
            options.helpTopic = requireValue(i, arg);
        } else if (arg == "-o" || arg == "--output-dir") {
            options.outputDir = requireValue(i, arg);
        } else if (arg == "-p" || arg == "--pattern") {
            options.functionPattern = requireValue(i, arg);
        } else if (arg == "-d" || arg == "--debug") {
            options.debug = true;
        } else if (arg == "-t" || arg == "--test") {
            const std::string value = requireValue(i, arg);
            const auto colon = value.rfind(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
                throw HarnessError("Invalid test selector '" + value + "', expected SCRIPT:FUNCTION");
            }
            const std::string script = value.substr(0, colon);
            options.inclusion[value.substr(colon + 1)] = script;
            if (std::ranges::find(options.scripts, script) == options.scripts.end()) {
                options.scripts.push_back(script);
            }
        } else {
            throw HarnessError("Unknown option: '" + arg + "'. Pass '--help' to see usage.");
        }
    }

    return options;
}

} // namespace cmdprove
