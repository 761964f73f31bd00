#ifndef CMDPROVE_UTILS_H
#define CMDPROVE_UTILS_H

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace cmdprove {

void setDebugEnabled(bool enabled);
void debug(const std::string& message);
void logError(const std::string& message);

std::string repeatString(const std::string& text, std::size_t count);
std::string prefixLines(const std::string& prefix, const std::string& text);
std::string chompNewlines(std::string text);
std::string trimWhitespace(const std::string& text);
std::vector<std::string> splitWords(const std::string& text);
std::string joinArgs(const std::vector<std::string>& args);

std::string readFile(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const std::string& content);
// Returns false when the descriptor stops accepting data (errno is left set).
bool writeAll(int fd, const char* data, std::size_t size);
bool writeAll(int fd, const std::string& text);
std::filesystem::path createTempDir(const std::string& templ);
std::string getenvOr(const char* name, const std::string& fallback = {});

std::string unifiedDiff(const std::string& expected, const std::string& actual,
                        const std::string& expectedLabel = "expected",
                        const std::string& actualLabel = "actual");

std::vector<char*> toArgv(std::vector<std::string>& args);

// Writes a byte stream to a descriptor, holding back newline characters so that
// the newlines at the very end of the stream are dropped while inner ones survive.
// Throws TestError when the descriptor cannot be written.
class TrailingNewlineFilter {
public:
    explicit TrailingNewlineFilter(int fd);

    void write(const char* data, std::size_t size);
    void finish();

private:
    void emit(const char* data, std::size_t size);

    int fd_;
    std::size_t pendingNewlines_{0};
};

} // namespace cmdprove

#endif //CMDPROVE_UTILS_H
