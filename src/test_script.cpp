#include "cmdprove.h"
#include "utils.h"

#include <algorithm>
#include <iostream>
#include <map>

namespace cmdprove {

TestScript::TestScript(std::source_location origin) : sourceFile_(origin.file_name()) {}

void TestScript::add(std::string name, TestFunction func, std::source_location where) {
    const auto duplicate = std::ranges::find_if(entries_, [&](const TestEntry& entry) { return entry.name == name; });
    if (duplicate != entries_.end()) {
        throw TestError("Test function registered twice: '" + name + "' (" + duplicate->file + ":" +
                        std::to_string(duplicate->line) + " and " + where.file_name() + ":" +
                        std::to_string(where.line()) + ")");
    }
    entries_.push_back(TestEntry{std::move(name), std::move(func), where.file_name(), where.line()});
}

std::vector<const TestEntry*> TestScript::discover(const std::string& namePattern) const {
    std::vector<const TestEntry*> found;
    for (const auto& entry : entries_) {
        if (entry.file != sourceFile_) {
            continue;
        }
        if (!matchesPattern(namePattern, entry.name)) {
            continue;
        }
        found.push_back(&entry);
    }
    std::ranges::stable_sort(found, [](const TestEntry* lhs, const TestEntry* rhs) { return lhs->line < rhs->line; });
    return found;
}

const std::string& TestScript::sourceFile() const {
    return sourceFile_;
}

int TestScript::run(TestSession& session) const {
    const HarnessConfig& config = session.config();
    const std::vector<const TestEntry*> functions = discover(config.functionPattern);
    debug("Discovered " + std::to_string(functions.size()) + " test functions in '" + sourceFile_ + "'.");

    std::map<std::string, bool> executed;
    for (const auto& name : config.includeSubtests) {
        executed[name] = false;
    }
    const bool doFilter = !executed.empty();

    int failureCount = 0;
    for (const TestEntry* function : functions) {
        if (doFilter) {
            const auto it = executed.find(function->name);
            if (it == executed.end()) {
                continue;
            }
            it->second = true;
        }

        if (!session.subtest(function->name, function->func)) {
            ++failureCount;
        }
    }

    bool missing = false;
    for (const auto& [name, ran] : executed) {
        if (!ran) {
            std::cout.flush();
            std::cerr << "TEST ERROR: '" << name << "': Subtest in inclusion list not found in script: '"
                      << (config.sourcePath.empty() ? sourceFile_ : config.sourcePath) << "'" << std::endl;
            missing = true;
        }
    }
    if (missing) {
        return kExitAborted;
    }
    return failureCount == 0 ? kExitPassed : kExitFailed;
}

int TestScript::main(int argc, char** argv) const {
    std::optional<TestSession> session;
    try {
        HarnessConfig config = HarnessConfig::fromEnvironment();
        for (int i = 1; i < argc; ++i) {
            config.includeSubtests.emplace_back(argv[i]);
        }
        if (config.sourcePath.empty() && argc > 0) {
            config.sourcePath = argv[0];
        }

        session.emplace(std::move(config), std::cout);
        return run(*session);
    } catch (const std::exception& ex) {
        std::cout.flush();
        std::cerr << "TEST ERROR: " << ex.what() << '\n';
        std::cerr << "ERROR: Test script execution failed." << '\n';
        if (session && !session->lastStderrFile().empty()) {
            std::cerr << "For details, see: " << session->lastStderrFile() << '\n';
        }
        std::cerr.flush();
        return kExitAborted;
    }
}

} // namespace cmdprove
