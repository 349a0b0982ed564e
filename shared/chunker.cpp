#include "chunker.hpp"

#include "utils.hpp"

namespace semchunk {

Chunk makeFileChunk(const SourceFile& file, const string& language) {
  Chunk chunk;
  chunk.file_path = file.path;
  chunk.start_line = 1;
  chunk.end_line = static_cast<int>(countLines(file.content));
  chunk.level = ChunkLevel::File;
  chunk.language = language;
  chunk.content = file.content;
  chunk.name = file.path;
  chunk.signature = firstLine(file.content);
  chunk.last_modified = file.last_modified;
  chunk.setHashes();
  return chunk;
}

optional<Chunk> makeNodeChunk(const SyntaxNode& node, const SourceFile& file, const string& language,
                              ChunkLevel level, const string& name, const string& parent_id) {
  Point start = node.startPoint();
  Point end = node.endPoint();
  if (end.row < start.row) {
    return nullopt;
  }

  string content = node.content(file.content);
  if (isBlank(content)) {
    return nullopt;
  }

  // A node that swallowed its trailing newline ends at column 0 of the next row.
  uint32_t last_row = end.row;
  if (end.column == 0 && end.row > start.row) {
    last_row--;
  }

  Chunk chunk;
  chunk.file_path = file.path;
  chunk.start_line = static_cast<int>(start.row) + 1;
  chunk.end_line = static_cast<int>(last_row) + 1;
  chunk.level = level;
  chunk.language = language;
  chunk.content = content;
  chunk.parent_id = parent_id;
  chunk.name = name;
  chunk.signature = firstLine(content);
  chunk.last_modified = file.last_modified;
  chunk.setHashes();
  return chunk;
}

string fieldText(const SyntaxNode& node, const string& field, const string& source) {
  unique_ptr<SyntaxNode> child = node.childByField(field);
  if (!child) return "";
  return child->content(source);
}

} // namespace semchunk
