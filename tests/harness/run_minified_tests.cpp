#include "minified.hpp"
#include "test_support.hpp"

#include <string>

using namespace semchunk;
using test_support::require_;

namespace {

const std::string PLAIN_JS =
    "function add(a, b) {\n"
    "  return a + b;\n"
    "}\n";

bool test_path_markers() {
  bool ok = true;
  ok &= require_(isMinified(PLAIN_JS, "dist/app.min.js"), ".min.js suffix");
  ok &= require_(isMinified(PLAIN_JS, "dist/App.Min.JS"), "markers are case-insensitive");
  ok &= require_(isMinified(PLAIN_JS, "vendor/jquery.min.1.js"), ".min. anywhere in the path");
  ok &= require_(isMinified(PLAIN_JS, "out/main.bundle.mjs"), "bundle suffix");
  ok &= require_(!isMinified(PLAIN_JS, "src/minimum.js"), "min inside a word is not a marker");
  ok &= require_(!isMinified(PLAIN_JS, "src/admin.js"), "admin.js is ordinary");
  ok &= require_(hasMinifiedSuffix("style.min.css"), "css suffix");
  ok &= require_(!hasMinifiedSuffix("app.min.js.map"), "suffix must end the name");
  ok &= require_(hasMinifiedPathToken("app.min.js.map"), "but the path token still matches");
  return ok;
}

bool test_content_heuristics() {
  bool ok = true;

  std::string long_lines = std::string(600, 'x') + "\n" + std::string(600, 'y') + "\n";
  ok &= require_(isMinified(long_lines, "a.js"), "average line length above 500");

  std::string huge_line = std::string(200, 'a') + "\n" + std::string(11 * 1024, 'b');
  huge_line += std::string(40, '\n');
  ok &= require_(isMinified(huge_line, "b.js"), "single line over 10 KiB");

  std::string dense;
  for (int i = 0; i < 40; i++) dense += std::string(50, 'z') + "\n";
  ok &= require_(isMinified(dense, "c.js"), "whitespace ratio below 5% on large content");

  std::string small_dense(400, 'q');
  ok &= require_(!isMinified(small_dense, "d.js"), "small content skips the whitespace check");

  ok &= require_(!isMinified(PLAIN_JS, "e.js"), "ordinary source");
  return ok;
}

bool test_degenerate_inputs() {
  bool ok = true;
  ok &= require_(!isMinified("", "app.min.js"), "empty content");
  ok &= require_(!isMinified(nullptr, 10, "app.min.js", MinifiedThresholds{}), "null content");
  ok &= require_(!isMinified(PLAIN_JS, ""), "empty path");

  std::string binary("\x00\xff\xfe\x01", 4);
  ok &= require_(!isMinified(binary, "blob.bin"), "arbitrary bytes are handled");
  return ok;
}

bool test_custom_thresholds() {
  MinifiedThresholds strict;
  strict.max_avg_line_length = 10;
  bool ok = require_(isMinified(PLAIN_JS, "e.js", strict), "tighter average threshold");

  nlohmann::json j = nlohmann::json::parse(R"({"max_avg_line_length": 42})");
  MinifiedThresholds loaded = j.get<MinifiedThresholds>();
  ok &= require_(loaded.max_avg_line_length == 42, "configured value read");
  ok &= require_(loaded.max_single_line_size == 10 * 1024, "missing keys keep defaults");

  nlohmann::json back = loaded;
  ok &= require_(back["min_whitespace_ratio"] == 0.05, "defaults written back");
  return ok;
}

} // namespace

int main() {
  const test_support::Case cases[] = {
    {"path_markers", test_path_markers},
    {"content_heuristics", test_content_heuristics},
    {"degenerate_inputs", test_degenerate_inputs},
    {"custom_thresholds", test_custom_thresholds},
  };
  return test_support::run_cases(cases, "MINIFIED");
}
