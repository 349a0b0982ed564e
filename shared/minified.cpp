#include "minified.hpp"

#include "utils.hpp"

using json = nlohmann::json;

namespace semchunk {

const vector<string> MINIFIED_SUFFIXES = {
  ".min.js", ".min.mjs", ".min.cjs", ".min.css",
  ".bundle.js", ".bundle.mjs", ".bundle.cjs", ".bundle.css",
};

bool hasMinifiedPathToken(string_view path) {
  return toLower(path).find(".min.") != string::npos;
}

bool hasMinifiedSuffix(string_view path) {
  string lowered = toLower(path);
  for (const string& suffix : MINIFIED_SUFFIXES) {
    if (lowered.size() >= suffix.size() &&
        lowered.compare(lowered.size() - suffix.size(), suffix.size(), suffix) == 0) {
      return true;
    }
  }
  return false;
}

bool isMinified(string_view content, string_view path) {
  return isMinified(content, path, MinifiedThresholds{});
}

bool isMinified(string_view content, string_view path, const MinifiedThresholds& thresholds) {
  return isMinified(content.data(), content.size(), path, thresholds);
}

bool isMinified(const char* content, size_t length, string_view path, const MinifiedThresholds& thresholds) {
  if (content == nullptr || length == 0 || path.empty()) {
    return false;
  }

  if (hasMinifiedPathToken(path) || hasMinifiedSuffix(path)) {
    return true;
  }

  size_t lines = 0;
  size_t longest = 0;
  size_t current = 0;
  size_t whitespace = 0;
  for (size_t i = 0; i < length; i++) {
    char c = content[i];
    if (c == '\n') {
      lines++;
      if (current > longest) longest = current;
      current = 0;
      whitespace++;
      continue;
    }
    current++;
    if (c == ' ' || c == '\t' || c == '\r') {
      whitespace++;
    }
  }
  if (current > 0) {
    lines++;
    if (current > longest) longest = current;
  }
  if (lines == 0) lines = 1;

  if (length / lines > thresholds.max_avg_line_length) {
    return true;
  }
  if (longest > thresholds.max_single_line_size) {
    return true;
  }
  if (length >= thresholds.min_size_for_whitespace_check) {
    double ratio = static_cast<double>(whitespace) / static_cast<double>(length);
    if (ratio < thresholds.min_whitespace_ratio) {
      return true;
    }
  }
  return false;
}

void from_json(const json& j, MinifiedThresholds& thresholds) {
  MinifiedThresholds defaults;
  thresholds.max_avg_line_length = j.value("max_avg_line_length", defaults.max_avg_line_length);
  thresholds.max_single_line_size = j.value("max_single_line_size", defaults.max_single_line_size);
  thresholds.min_whitespace_ratio = j.value("min_whitespace_ratio", defaults.min_whitespace_ratio);
  thresholds.min_size_for_whitespace_check =
      j.value("min_size_for_whitespace_check", defaults.min_size_for_whitespace_check);
}

void to_json(json& j, const MinifiedThresholds& thresholds) {
  j = json{
    {"max_avg_line_length", thresholds.max_avg_line_length},
    {"max_single_line_size", thresholds.max_single_line_size},
    {"min_whitespace_ratio", thresholds.min_whitespace_ratio},
    {"min_size_for_whitespace_check", thresholds.min_size_for_whitespace_check}
  };
}

} // namespace semchunk
