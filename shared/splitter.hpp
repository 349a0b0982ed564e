#ifndef SPLITTER_HPP
#define SPLITTER_HPP

#include <optional>
#include <string>
#include <vector>
#include "chunk.hpp"

using namespace std;

namespace semchunk {

static constexpr size_t MAX_FILE_SIZE_FOR_FILE_CHUNK = 100 * 1024;
static constexpr size_t MIN_SPLIT_CHARS = 350;
static const string TRUNCATION_MARKER = "\n// ... [truncated]";

struct SplitChunk {
  string content;
  int start_line = 0;
  int end_line = 0;
  int index = 0;
  bool is_partial = false;
  // Id of the chunk this piece was cut from; empty when not split.
  string parent_chunk_id;
};

// Fits chunks into an embedding window. Methods are cut into overlapping
// line windows; file and class chunks are truncated so their header
// survives.
class Splitter {
  private:
    size_t max_chars;
    size_t overlap_chars;

    size_t findSplitEnd(const vector<string>& lines, size_t start, size_t target) const;
    size_t overlapLines(const vector<string>& lines, size_t from_end) const;
    SplitChunk truncate(const Chunk& chunk) const;
  public:
    Splitter(size_t max_chars, size_t overlap_chars = 900);

    // nullopt for files above MAX_FILE_SIZE_FOR_FILE_CHUNK.
    optional<SplitChunk> handleFileChunk(const Chunk& chunk, size_t file_size) const;
    SplitChunk handleClassChunk(const Chunk& chunk) const;
    vector<SplitChunk> splitMethod(const Chunk& chunk) const;

    // Dispatches on chunk level.
    vector<SplitChunk> split(const Chunk& chunk, size_t file_size) const;
};

} // namespace semchunk

#endif // SPLITTER_HPP
