#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include "errors.hpp"

namespace semchunk {

string utf8_substr(const string& str, size_t max_bytes) {
  if (str.size() <= max_bytes) {
    return str;
  }
  size_t pos = max_bytes;
  while (pos > 0 && (static_cast<unsigned char>(str[pos]) & UTF8_CONTINUATION_MASK) == UTF8_CONTINUATION_BYTE) {
    pos--;
  }
  return str.substr(0, pos);
}

string trim(const string& str) {
  size_t start = str.find_first_not_of(" \t\n\r\f\v");
  if (start == string::npos) return "";
  size_t end = str.find_last_not_of(" \t\n\r\f\v");
  return str.substr(start, end - start + 1);
}

string toLower(string_view str) {
  string out(str);
  transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(tolower(c)); });
  return out;
}

bool isBlank(const string& str) {
  return str.find_first_not_of(" \t\n\r\f\v") == string::npos;
}

size_t countLines(string_view content) {
  if (content.empty()) return 1;
  size_t newlines = static_cast<size_t>(count(content.begin(), content.end(), '\n'));
  if (content.back() != '\n') newlines++;
  return newlines == 0 ? 1 : newlines;
}

vector<string> splitLines(const string& content) {
  vector<string> lines;
  size_t start = 0;
  while (true) {
    size_t pos = content.find('\n', start);
    if (pos == string::npos) {
      lines.push_back(content.substr(start));
      break;
    }
    lines.push_back(content.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

string firstLine(const string& content) {
  size_t pos = content.find('\n');
  return trim(pos == string::npos ? content : content.substr(0, pos));
}

string fileExtension(const string& path) {
  size_t slash = path.find_last_of("/\\");
  size_t lastDot = path.find_last_of('.');
  if (lastDot == string::npos || (slash != string::npos && lastDot < slash)) {
    return "";
  }
  if (lastDot == 0 || (slash != string::npos && lastDot == slash + 1)) {
    // dotfile such as ".bashrc"
    return "";
  }
  return toLower(string_view(path).substr(lastDot));
}

string readFile(const string& path) {
  ifstream in(path, ios::binary);
  if (!in) {
    throw ChunkerError("cannot open file: " + path);
  }
  return string(istreambuf_iterator<char>(in), istreambuf_iterator<char>());
}

} // namespace semchunk
