#include "cmdprove.h"
#include "shared_tests.h"

using cmdprove::TestSession;

int main(int argc, char** argv) {
    cmdprove::TestScript script;
    registerSharedTests(script);

    script.add("test_echo", [](TestSession& t) {
        t.describe("echo writes its arguments to stdout");
        return t.assertCommand({"echo prints", "-o", "hello", "--", "echo", "hello"});
    });

    script.add("test_status", [](TestSession& t) {
        return t.assertCommand({"false fails", "-r", "1", "--", "false"});
    });

    script.add("test_pattern", [](TestSession& t) {
        return t.assertCommand({"-d", "date prints seconds", "-op", "+([0-9])", "--", "date", "+%s"});
    });

    script.add("test_nested", [](TestSession& t) {
        t.subtest("inner", [](TestSession& inner) {
            return inner.assertCommand({"inner assertion", "--", "true"});
        });
        return 0;
    });

    script.add("helper_not_a_test", [](TestSession& t) {
        return t.assertCommand({"not selected by the default pattern", "-f", "-o", "never", "--", "true"});
    });

    return script.main(argc, argv);
}
