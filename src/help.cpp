#include "cmdprove.h"

#include <map>

namespace cmdprove {

namespace {

struct HelpTopic {
    std::string summary;
    std::string content;
};

const std::map<std::string, HelpTopic>& helpTopics() {
    static const std::map<std::string, HelpTopic> topics = {
        {"assert",
         {"Checks a command's output against expected values",
          R"(assertCommand({"[-d] DESCRIPTION", OPTIONS..., "--", COMMAND...})

Runs COMMAND and compares its standard output, standard error and exit status
against the expected values. Exactly one "ok" or "not ok" line is reported.

Options:
  -d DESC        description (alternative to the first positional argument)
  -o TEXT        expected stdout                (default: empty)
  -e TEXT        expected stderr                (default: empty)
  -r CODE        expected exit status           (default: 0)
  -op GLOB       stdout must match the extended glob
  -ep GLOB       stderr must match the extended glob
  -rp GLOB       exit status must match the extended glob
  -O FILE        expected stdout is read from FILE
  -E FILE        expected stderr is read from FILE
  -R FILE        expected exit status is read from FILE
  -oi, -ei, -ri  ignore the channel (a note is written if it is not empty)
  -p             preserve trailing newlines in captured and expected values
  -f             return the number of failed channels instead of 0

Captured values are stored in TEST_OUT_DIR as TEST_NAME<NN>.out/.err/.ret.
)"}},
        {"describe",
         {"Provides a description for the test",
          R"(describe(DESC)

Uses DESC as a description for the current test.
The given value is used to format the test output.
)"}},
        {"note",
         {"Writes a comment in the test output",
          R"(note(MESSAGE, LEVEL = 0)

Writes MESSAGE as a comment in the test output, indented by LEVEL steps.
Use this function instead of writing to std::cout directly, so that the
output is correctly formatted.
)"}},
        {"subtest",
         {"Groups assertions into a nested test",
          R"(subtest(NAME, FUNCTION)

Runs FUNCTION as a nested test named NAME. The assertions made inside are
summarized and reported as one "ok" or "not ok" line in the enclosing test.
A non-zero return value or an exception counts as a failure.
)"}},
    };
    return topics;
}

} // namespace

void printUsage(std::ostream& os) {
    os << "Usage: cmdprove [options] TEST_SCRIPT...\n"
       << "\n"
       << "Runs each test script and reports whether all of its tests passed.\n"
       << "\n"
       << "Options:\n"
       << "  -h, --help                  show this help\n"
       << "  -H, --help-api TOPIC        show help on the test API (use 'summary' to list topics)\n"
       << "  -o, --output-dir DIR        directory for captured output (default: a fresh temp dir)\n"
       << "  -t, --test SCRIPT:FUNCTION  run only FUNCTION of SCRIPT (repeatable)\n"
       << "  -p, --pattern GLOB          names of test functions to run (default: test_*)\n"
       << "  -d, --debug                 print debug messages\n"
       << "\n"
       << "Exit status: 0 all scripts passed, 1 some tests failed, 2 usage error,\n"
       << "3 test script aborted.\n";
}

bool printApiHelp(const std::string& topic, std::ostream& os) {
    const auto& topics = helpTopics();

    if (topic == "summary") {
        os << "Test API topics:\n";
        for (const auto& [name, entry] : topics) {
            os << "  " << name;
            os << std::string(name.size() < 12 ? 12 - name.size() : 1, ' ');
            os << entry.summary << '\n';
        }
        return true;
    }

    const auto it = topics.find(topic);
    if (it == topics.end()) {
        return false;
    }
    os << it->second.content;
    return true;
}

} // namespace cmdprove
