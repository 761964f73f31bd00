#include "cmdprove.h"
#include "utils.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace cmdprove {

namespace {

bool gDebugEnabled = false;

constexpr std::size_t kContextLines = 3;
constexpr std::size_t kMaxDiffCells = 4'000'000;

struct DiffOp {
    char tag;
    std::string line;
};

std::vector<std::string> splitKeepingNewlines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start + 1));
        start = end + 1;
    }
    return lines;
}

std::vector<DiffOp> diffLines(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<DiffOp> ops;
    const std::size_t n = a.size();
    const std::size_t m = b.size();

    if ((n + 1) * (m + 1) > kMaxDiffCells) {
        for (const auto& line : a) {
            ops.push_back(DiffOp{'-', line});
        }
        for (const auto& line : b) {
            ops.push_back(DiffOp{'+', line});
        }
        return ops;
    }

    // lcs[i][j] is the length of the longest common subsequence of a[i..] and b[j..].
    std::vector<std::vector<unsigned>> lcs(n + 1, std::vector<unsigned>(m + 1, 0));
    for (std::size_t i = n; i-- > 0;) {
        for (std::size_t j = m; j-- > 0;) {
            lcs[i][j] = a[i] == b[j] ? lcs[i + 1][j + 1] + 1 : std::max(lcs[i + 1][j], lcs[i][j + 1]);
        }
    }

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < n && j < m) {
        if (a[i] == b[j]) {
            ops.push_back(DiffOp{' ', a[i]});
            ++i;
            ++j;
        } else if (lcs[i + 1][j] >= lcs[i][j + 1]) {
            ops.push_back(DiffOp{'-', a[i++]});
        } else {
            ops.push_back(DiffOp{'+', b[j++]});
        }
    }
    while (i < n) {
        ops.push_back(DiffOp{'-', a[i++]});
    }
    while (j < m) {
        ops.push_back(DiffOp{'+', b[j++]});
    }
    return ops;
}

std::string hunkRange(std::size_t start, std::size_t length) {
    if (length == 0) {
        return std::to_string(start) + ",0";
    }
    if (length == 1) {
        return std::to_string(start + 1);
    }
    return std::to_string(start + 1) + "," + std::to_string(length);
}

void appendDiffLine(std::string& out, const DiffOp& op) {
    out.push_back(op.tag);
    if (!op.line.empty() && op.line.back() == '\n') {
        out += op.line;
    } else {
        out += op.line;
        out += "\n\\ No newline at end of file\n";
    }
}

} // namespace

void setDebugEnabled(bool enabled) {
    gDebugEnabled = enabled;
}

void debug(const std::string& message) {
    if (!gDebugEnabled) {
        return;
    }
    std::cerr << "# DBG: " << message << std::endl;
}

void logError(const std::string& message) {
    std::cerr << "ERROR: " << message << std::endl;
}

std::string repeatString(const std::string& text, std::size_t count) {
    std::string result;
    result.reserve(text.size() * count);
    for (std::size_t i = 0; i < count; ++i) {
        result += text;
    }
    return result;
}

std::string prefixLines(const std::string& prefix, const std::string& text) {
    std::string result;
    std::istringstream in(text);
    std::string line;
    bool any = false;
    while (std::getline(in, line)) {
        result += prefix + line + '\n';
        any = true;
    }
    if (!any) {
        result = prefix + '\n';
    }
    return result;
}

std::string chompNewlines(std::string text) {
    while (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

std::string trimWhitespace(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        if (arg.empty() || arg.find_first_of(" \t\n'\"") != std::string::npos) {
            joined += '\'' + arg + '\'';
        } else {
            joined += arg;
        }
    }
    return joined;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw TestError("Cannot read file '" + path.string() + "': " + std::strerror(errno));
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw TestError("Cannot write file '" + path.string() + "': " + std::strerror(errno));
    }
    out << content;
    out.flush();
    if (!out) {
        throw TestError("Cannot write file '" + path.string() + "': " + std::strerror(errno));
    }
}

bool writeAll(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

bool writeAll(int fd, const std::string& text) {
    return writeAll(fd, text.data(), text.size());
}

std::filesystem::path createTempDir(const std::string& templ) {
    std::string pattern = templ;
    if (char* dir = mkdtemp(pattern.data())) {
        return dir;
    }
    throw HarnessError("Failed to create temp dir from '" + templ + "': " + std::strerror(errno));
}

std::string getenvOr(const char* name, const std::string& fallback) {
    if (const char* value = getenv(name)) {
        return value;
    }
    return fallback;
}

std::string unifiedDiff(const std::string& expected, const std::string& actual,
                        const std::string& expectedLabel, const std::string& actualLabel) {
    const std::vector<DiffOp> ops = diffLines(splitKeepingNewlines(expected), splitKeepingNewlines(actual));

    // Line counts of each side consumed before ops[k].
    std::vector<std::size_t> aBefore(ops.size() + 1, 0);
    std::vector<std::size_t> bBefore(ops.size() + 1, 0);
    for (std::size_t k = 0; k < ops.size(); ++k) {
        aBefore[k + 1] = aBefore[k] + (ops[k].tag != '+' ? 1 : 0);
        bBefore[k + 1] = bBefore[k] + (ops[k].tag != '-' ? 1 : 0);
    }

    std::string out = "--- " + expectedLabel + "\n+++ " + actualLabel + "\n";
    std::size_t next = 0;
    while (next < ops.size()) {
        std::size_t change = next;
        while (change < ops.size() && ops[change].tag == ' ') {
            ++change;
        }
        if (change == ops.size()) {
            break;
        }

        std::size_t lastChange = change;
        for (std::size_t k = change; k < ops.size(); ++k) {
            if (ops[k].tag != ' ') {
                lastChange = k;
            } else if (k - lastChange > 2 * kContextLines) {
                break;
            }
        }

        const std::size_t begin = std::max(next, change >= kContextLines ? change - kContextLines : 0);
        const std::size_t end = std::min(ops.size(), lastChange + kContextLines + 1);

        out += "@@ -" + hunkRange(aBefore[begin], aBefore[end] - aBefore[begin]) + " +" +
               hunkRange(bBefore[begin], bBefore[end] - bBefore[begin]) + " @@\n";
        for (std::size_t k = begin; k < end; ++k) {
            appendDiffLine(out, ops[k]);
        }
        next = end;
    }

    if (!out.empty() && out.back() == '\n') {
        out.pop_back();
    }
    return out;
}

std::vector<char*> toArgv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return argv;
}

TrailingNewlineFilter::TrailingNewlineFilter(int fd) : fd_(fd) {}

void TrailingNewlineFilter::write(const char* data, std::size_t size) {
    std::size_t pos = 0;
    while (pos < size) {
        const std::size_t runStart = pos;
        while (pos < size && data[pos] == '\n') {
            ++pos;
        }
        pendingNewlines_ += pos - runStart;
        if (pos == size) {
            break;
        }

        std::size_t end = pos;
        while (end < size && data[end] != '\n') {
            ++end;
        }
        if (pendingNewlines_ > 0) {
            const std::string newlines(pendingNewlines_, '\n');
            emit(newlines.data(), newlines.size());
            pendingNewlines_ = 0;
        }
        emit(data + pos, end - pos);
        pos = end;
    }
}

void TrailingNewlineFilter::emit(const char* data, std::size_t size) {
    if (!writeAll(fd_, data, size)) {
        throw TestError(std::string("Cannot write captured output: ") + std::strerror(errno));
    }
}

void TrailingNewlineFilter::finish() {
    pendingNewlines_ = 0;
}

} // namespace cmdprove
