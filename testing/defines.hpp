#ifndef _TESTING_DEFINES_H_
#define _TESTING_DEFINES_H_

// Define ENABLE_UNIT_TESTS to 0 before including this header to filter the
// tests of a file out of the default run.
#if ENABLE_UNIT_TESTS
#define MY_TEST(x, y)   TEST(x, y)
#else
#define MY_TEST(x, y)   TEST(FILTERED_##x, y)
#endif

#include <algorithm>
#include <string>
#include <vector>

namespace jinglesdp {
namespace test {

// Splits a CRLF terminated SDP blob into lines, the trailing terminator
// does not produce an empty line.
inline std::vector<std::string> SplitLines(const std::string& sdp, const std::string& eol = "\r\n") {
    std::vector<std::string> lines;
    size_t begin = 0;
    while (begin < sdp.size()) {
        size_t end = sdp.find(eol, begin);
        if (end == std::string::npos) {
            lines.emplace_back(sdp.substr(begin));
            break;
        }
        lines.emplace_back(sdp.substr(begin, end - begin));
        begin = end + eol.size();
    }
    return lines;
}

inline bool HasLine(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

inline size_t CountLinesWithPrefix(const std::vector<std::string>& lines, const std::string& prefix) {
    return std::count_if(lines.begin(), lines.end(), [&prefix](const std::string& line) {
        return line.compare(0, prefix.size(), prefix) == 0;
    });
}

inline long IndexOf(const std::vector<std::string>& lines, const std::string& line) {
    auto it = std::find(lines.begin(), lines.end(), line);
    return it == lines.end() ? -1 : static_cast<long>(std::distance(lines.begin(), it));
}

} // namespace test
} // namespace jinglesdp

#endif
