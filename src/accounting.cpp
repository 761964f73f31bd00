#include "cmdprove.h"
#include "utils.h"

namespace cmdprove {

TestAccounting::TestAccounting(std::ostream& out) : out_(out), levels_(1) {}

void TestAccounting::enter(const std::string& name) {
    const int ordinal = levels_.back().ordinal + 1;
    note("Subtest " + std::to_string(ordinal) + (name.empty() ? "" : " - " + name));
    levels_.push_back(Level{name});
}

void TestAccounting::record(const std::string& name, bool passed) {
    Level& level = levels_.back();
    ++level.ordinal;
    if (passed) {
        ++level.passed;
    } else {
        ++level.failed;
    }
    const std::string label = name.empty() ? "" : " - " + name;
    printIndented((passed ? "ok " : "not ok ") + std::to_string(level.ordinal) + label);
}

bool TestAccounting::exit() {
    if (levels_.size() <= 1) {
        throw TestError("Subtest stack underflow");
    }

    const Level finished = levels_.back();
    note(std::to_string(finished.passed) + " PASSED, " + std::to_string(finished.failed) + " FAILED");
    levels_.pop_back();

    const bool hasFailures = finished.failed > 0;
    record(finished.name, !hasFailures);
    printIndented("");
    return hasFailures;
}

void TestAccounting::note(const std::string& text, int indentLevel) {
    const std::string prefix = "# " + repeatString("  ", static_cast<std::size_t>(indentLevel > 0 ? indentLevel : 0));
    printIndented(chompNewlines(prefixLines(prefix, text)));
}

void TestAccounting::printIndented(const std::string& text) {
    out_ << prefixLines(repeatString("  ", depth()), text);
    out_.flush();
}

std::size_t TestAccounting::depth() const {
    return levels_.size() - 1;
}

int TestAccounting::passed() const {
    return levels_.back().passed;
}

int TestAccounting::failed() const {
    return levels_.back().failed;
}

LevelGuard::LevelGuard(TestAccounting& accounting, const std::string& name) : accounting_(accounting) {
    accounting_.enter(name);
    depth_ = accounting_.depth();
}

LevelGuard::~LevelGuard() {
    if (open_ && accounting_.depth() == depth_) {
        accounting_.exit();
    }
}

bool LevelGuard::close() {
    if (!open_) {
        return false;
    }
    open_ = false;
    if (accounting_.depth() != depth_) {
        throw TestError("Subtest levels closed out of order (expected depth " + std::to_string(depth_) + ", found " +
                        std::to_string(accounting_.depth()) + ")");
    }
    return accounting_.exit();
}

} // namespace cmdprove
