#include "cmdprove.h"
#include "utils.h"

#include <fnmatch.h>

namespace cmdprove {

std::string channelName(Channel channel) {
    switch (channel) {
        case Channel::Out: return "stdout";
        case Channel::Err: return "stderr";
        case Channel::Ret: return "exit status";
    }
    return "unknown";
}

std::string channelExtension(Channel channel) {
    switch (channel) {
        case Channel::Out: return ".out";
        case Channel::Err: return ".err";
        case Channel::Ret: return ".ret";
    }
    return ".unknown";
}

bool matchesPattern(const std::string& pattern, const std::string& text) {
    // fnmatch stops at the first NUL, which would leave the rest of the output unchecked.
    if (pattern.find('\0') != std::string::npos || text.find('\0') != std::string::npos) {
        return false;
    }
    // No FNM_PATHNAME / FNM_PERIOD: '/', '.' and newlines are ordinary characters,
    // so the whole captured output is matched as one string.
    return fnmatch(pattern.c_str(), text.c_str(), FNM_EXTMATCH) == 0;
}

std::optional<std::string> compare(CompareMode mode, const std::string& expected, const std::string& actual) {
    switch (mode) {
        case CompareMode::Exact:
            if (expected == actual) {
                return std::nullopt;
            }
            return unifiedDiff(expected, actual);
        case CompareMode::Pattern:
            if (matchesPattern(expected, actual)) {
                return std::nullopt;
            }
            return "Pattern not matched: '" + expected + "'.\nOutput was: '" + actual + "'.";
        case CompareMode::Ignore:
            return std::nullopt;
    }
    return std::nullopt;
}

} // namespace cmdprove
