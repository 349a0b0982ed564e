#ifndef MINIFIED_HPP
#define MINIFIED_HPP

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

using namespace std;

namespace semchunk {

struct MinifiedThresholds {
  size_t max_avg_line_length = 500;
  size_t max_single_line_size = 10 * 1024;
  double min_whitespace_ratio = 0.05;
  // Below this size the whitespace ratio is not consulted.
  size_t min_size_for_whitespace_check = 1024;
};

// Marker suffixes checked against the end of the file name.
extern const vector<string> MINIFIED_SUFFIXES;

// Heuristic test for generated or minified content that is not worth
// semantic chunking. Signals, first positive wins:
//   1. a ".min." component anywhere in the path;
//   2. a known minified/bundle suffix on the file name;
//   3. average line length, longest line, or (for large enough content)
//      whitespace ratio beyond the thresholds.
// Empty or null content and an empty path are never minified. Works on
// arbitrary bytes.
bool isMinified(string_view content, string_view path);
bool isMinified(string_view content, string_view path, const MinifiedThresholds& thresholds);
bool isMinified(const char* content, size_t length, string_view path, const MinifiedThresholds& thresholds);

bool hasMinifiedPathToken(string_view path);
bool hasMinifiedSuffix(string_view path);

void from_json(const nlohmann::json& j, MinifiedThresholds& thresholds);
void to_json(nlohmann::json& j, const MinifiedThresholds& thresholds);

} // namespace semchunk

#endif // MINIFIED_HPP
