#include "splitter.hpp"

#include "utils.hpp"

namespace semchunk {

Splitter::Splitter(size_t max_chars, size_t overlap_chars)
    : max_chars(max_chars < MIN_SPLIT_CHARS ? MIN_SPLIT_CHARS : max_chars),
      overlap_chars(overlap_chars) {
  if (this->overlap_chars >= this->max_chars / 2) {
    this->overlap_chars = this->max_chars / 4;
  }
}

SplitChunk Splitter::truncate(const Chunk& chunk) const {
  SplitChunk piece;
  piece.start_line = chunk.start_line;
  piece.end_line = chunk.end_line;

  if (chunk.content.size() <= this->max_chars) {
    piece.content = chunk.content;
    return piece;
  }

  string truncated = utf8_substr(chunk.content, this->max_chars - TRUNCATION_MARKER.size());
  size_t last_newline = truncated.find_last_of('\n');
  if (last_newline != string::npos && last_newline > 0) {
    truncated = truncated.substr(0, last_newline);
  }
  piece.content = truncated + TRUNCATION_MARKER;
  piece.is_partial = true;
  return piece;
}

optional<SplitChunk> Splitter::handleFileChunk(const Chunk& chunk, size_t file_size) const {
  if (file_size > MAX_FILE_SIZE_FOR_FILE_CHUNK) {
    return nullopt;
  }
  return this->truncate(chunk);
}

SplitChunk Splitter::handleClassChunk(const Chunk& chunk) const {
  return this->truncate(chunk);
}

size_t Splitter::findSplitEnd(const vector<string>& lines, size_t start, size_t target) const {
  size_t size = 0;
  size_t end = start;
  for (size_t i = start; i < lines.size(); i++) {
    size_t line_size = lines[i].size() + 1;
    if (size + line_size > target && i > start) {
      break;
    }
    size += line_size;
    end = i + 1;
  }
  if (end <= start && start < lines.size()) {
    end = start + 1;
  }
  return end;
}

size_t Splitter::overlapLines(const vector<string>& lines, size_t from_end) const {
  size_t size = 0;
  size_t count = 0;
  for (size_t i = from_end; i > 0 && size < this->overlap_chars; i--) {
    size += lines[i - 1].size() + 1;
    count++;
  }
  return count;
}

vector<SplitChunk> Splitter::splitMethod(const Chunk& chunk) const {
  vector<SplitChunk> pieces;

  if (chunk.content.size() <= this->max_chars) {
    SplitChunk piece;
    piece.content = chunk.content;
    piece.start_line = chunk.start_line;
    piece.end_line = chunk.end_line;
    pieces.push_back(piece);
    return pieces;
  }

  vector<string> lines = splitLines(chunk.content);
  size_t target = this->max_chars - this->overlap_chars;
  size_t start = 0;
  int index = 0;

  while (start < lines.size()) {
    size_t end = this->findSplitEnd(lines, start, target);

    SplitChunk piece;
    for (size_t i = start; i < end; i++) {
      if (i > start) piece.content += "\n";
      piece.content += lines[i];
    }
    // A single line longer than the window is cut rather than sent whole.
    piece.content = utf8_substr(piece.content, this->max_chars);
    piece.start_line = chunk.start_line + static_cast<int>(start);
    piece.end_line = chunk.start_line + static_cast<int>(end) - 1;
    if (piece.end_line < piece.start_line) piece.end_line = piece.start_line;
    piece.index = index;
    piece.is_partial = true;
    piece.parent_chunk_id = chunk.id;
    pieces.push_back(piece);

    if (end >= lines.size()) {
      break;
    }
    size_t next = end - this->overlapLines(lines, end);
    if (next <= start) {
      next = end;
    }
    start = next;
    index++;
  }

  return pieces;
}

vector<SplitChunk> Splitter::split(const Chunk& chunk, size_t file_size) const {
  switch (chunk.level) {
  case ChunkLevel::File: {
    optional<SplitChunk> piece = this->handleFileChunk(chunk, file_size);
    if (piece) return {*piece};
    return {};
  }
  case ChunkLevel::Class:
    return {this->handleClassChunk(chunk)};
  case ChunkLevel::Method:
    return this->splitMethod(chunk);
  }
  return {};
}

} // namespace semchunk
