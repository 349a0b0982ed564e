#include "splitter.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

using namespace semchunk;
using test_support::require_;

namespace {

std::string numbered_lines(int count) {
  std::string out;
  for (int i = 1; i <= count; i++) {
    char line[32];
    std::snprintf(line, sizeof(line), "    statement_%04d();", i);
    if (i > 1) out += "\n";
    out += line;
  }
  return out;
}

Chunk make_chunk(ChunkLevel level, const std::string& content, int start_line) {
  Chunk chunk;
  chunk.file_path = "big.go";
  chunk.level = level;
  chunk.language = "go";
  chunk.name = "Big";
  chunk.content = content;
  chunk.start_line = start_line;
  chunk.end_line = start_line + static_cast<int>(std::count(content.begin(), content.end(), '\n'));
  if (level != ChunkLevel::File) chunk.parent_id = std::string(32, 'f');
  chunk.setHashes();
  return chunk;
}

bool test_small_method_passes_through() {
  Splitter splitter(6000);
  Chunk method = make_chunk(ChunkLevel::Method, numbered_lines(5), 10);
  std::vector<SplitChunk> pieces = splitter.splitMethod(method);

  bool ok = require_(pieces.size() == 1, "one piece");
  if (!ok) return false;
  ok &= require_(!pieces[0].is_partial, "whole method is not partial");
  ok &= require_(pieces[0].content == method.content, "content unchanged");
  ok &= require_(pieces[0].start_line == 10 && pieces[0].end_line == 14, "lines unchanged");
  return ok;
}

bool test_large_method_overlapping_windows() {
  Splitter splitter(400, 100);
  Chunk method = make_chunk(ChunkLevel::Method, numbered_lines(60), 20);
  std::vector<SplitChunk> pieces = splitter.splitMethod(method);

  bool ok = require_(pieces.size() > 2, "method split into several windows");
  if (!ok) return false;
  ok &= require_(pieces.front().start_line == 20, "first window starts at the method");
  ok &= require_(pieces.back().end_line == method.end_line, "last window reaches the end");
  for (size_t i = 0; i < pieces.size(); i++) {
    ok &= require_(pieces[i].content.size() <= 400, "window fits max chars");
    ok &= require_(pieces[i].index == static_cast<int>(i), "indexes are sequential");
    ok &= require_(pieces[i].is_partial, "windows are partial");
    ok &= require_(pieces[i].parent_chunk_id == method.id, "windows point at their method");
    if (i > 0) {
      ok &= require_(pieces[i].start_line <= pieces[i - 1].end_line, "consecutive windows overlap");
      ok &= require_(pieces[i].start_line > pieces[i - 1].start_line, "windows make progress");
    }
  }
  return ok;
}

bool test_overlap_is_clamped() {
  // Overlap of half the window or more would stall; it is cut to a quarter.
  Splitter splitter(400, 300);
  Chunk method = make_chunk(ChunkLevel::Method, numbered_lines(60), 1);
  std::vector<SplitChunk> pieces = splitter.splitMethod(method);

  bool ok = require_(pieces.size() > 1, "still split");
  ok &= require_(pieces.size() < 60, "clamped overlap keeps windows large");
  ok &= require_(!pieces.empty() && pieces.back().end_line == method.end_line, "covers the method");
  return ok;
}

bool test_class_is_truncated() {
  Splitter splitter(500);
  Chunk cls = make_chunk(ChunkLevel::Class, "type Big struct {\n" + numbered_lines(80) + "\n}", 3);
  SplitChunk piece = splitter.handleClassChunk(cls);

  bool ok = require_(piece.is_partial, "oversized class marked partial");
  ok &= require_(piece.content.size() <= 500, "fits the window");
  ok &= require_(piece.content.rfind("type Big struct {", 0) == 0, "header survives");
  ok &= require_(piece.content.size() >= TRUNCATION_MARKER.size() &&
                 piece.content.compare(piece.content.size() - TRUNCATION_MARKER.size(),
                                       TRUNCATION_MARKER.size(), TRUNCATION_MARKER) == 0,
                 "ends with the truncation marker");
  ok &= require_(piece.start_line == 3 && piece.end_line == cls.end_line, "keeps the class line range");
  return ok;
}

bool test_file_chunk_size_limit() {
  Splitter splitter(6000);
  Chunk file = make_chunk(ChunkLevel::File, numbered_lines(10), 1);

  bool ok = require_(splitter.handleFileChunk(file, file.content.size()).has_value(), "small file kept");
  ok &= require_(!splitter.handleFileChunk(file, MAX_FILE_SIZE_FOR_FILE_CHUNK + 1).has_value(),
                 "file above the limit dropped");
  ok &= require_(splitter.split(file, MAX_FILE_SIZE_FOR_FILE_CHUNK + 1).empty(), "split drops it too");
  ok &= require_(splitter.split(file, 10).size() == 1, "split keeps small files");
  return ok;
}

bool test_minimum_window() {
  Splitter splitter(10, 0);
  Chunk method = make_chunk(ChunkLevel::Method, std::string(300, 'x'), 1);
  std::vector<SplitChunk> pieces = splitter.split(method, 300);
  return require_(pieces.size() == 1 && !pieces[0].is_partial, "tiny limits are raised to the minimum window");
}

bool test_single_long_line_is_cut() {
  Splitter splitter(400, 50);
  Chunk method = make_chunk(ChunkLevel::Method, "f := `" + std::string(2000, 'k') + "`", 5);
  std::vector<SplitChunk> pieces = splitter.splitMethod(method);

  bool ok = require_(pieces.size() == 1, "one line gives one window");
  ok &= require_(!pieces.empty() && pieces[0].content.size() <= 400, "overlong line cut to the window");
  return ok;
}

} // namespace

int main() {
  const test_support::Case cases[] = {
    {"small_method_passes_through", test_small_method_passes_through},
    {"large_method_overlapping_windows", test_large_method_overlapping_windows},
    {"overlap_is_clamped", test_overlap_is_clamped},
    {"class_is_truncated", test_class_is_truncated},
    {"file_chunk_size_limit", test_file_chunk_size_limit},
    {"minimum_window", test_minimum_window},
    {"single_long_line_is_cut", test_single_long_line_is_cut},
  };
  return test_support::run_cases(cases, "SPLITTER");
}
