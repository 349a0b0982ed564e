#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

using namespace std;

namespace semchunk {

static constexpr unsigned char UTF8_CONTINUATION_MASK = 0xC0;
static constexpr unsigned char UTF8_CONTINUATION_BYTE = 0x80;

string utf8_substr(const string& str, size_t max_bytes);
string trim(const string& str);
string toLower(string_view str);
bool isBlank(const string& str);

// Number of lines the way an editor shows them: a trailing newline does
// not open an extra line. Never less than 1.
size_t countLines(string_view content);

// Splits on '\n' keeping empty pieces, like strings.Split.
vector<string> splitLines(const string& content);
string firstLine(const string& content);

// Lower-cased extension of the last path component including its dot,
// or "" when there is none.
string fileExtension(const string& path);
string readFile(const string& path);

} // namespace semchunk

#endif // UTILS_HPP
