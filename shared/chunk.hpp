#ifndef CHUNK_HPP
#define CHUNK_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace std;

namespace semchunk {

enum class ChunkLevel {
  File,
  Class,
  Method
};

string levelName(ChunkLevel level);

struct SourceFile {
  string path;
  string content;
  string language;
  chrono::system_clock::time_point last_modified;
};

struct Chunk {
  string id;
  string file_path;
  int start_line = 0;
  int end_line = 0;
  ChunkLevel level = ChunkLevel::File;
  string language;
  string content;
  optional<string> parent_id;
  string name;
  string signature;
  string content_hash;
  chrono::system_clock::time_point last_modified;

  // 32 hex chars over path, lines, level, language and name. Body edits
  // that keep the header in place keep the id.
  string generateId() const;
  // 32 hex chars over content only.
  string generateContentHash() const;
  void setHashes();

  // Empty when every invariant holds, otherwise the first one broken.
  string validationError() const;
  bool isValid() const { return this->validationError().empty(); }
  int lineCount() const { return this->end_line - this->start_line + 1; }
};

struct ChunkResult {
  SourceFile file;
  vector<Chunk> chunks;
  vector<string> errors;

  const Chunk* findById(const string& id) const;
  size_t countLevel(ChunkLevel level) const;
};

void to_json(nlohmann::json& j, const Chunk& chunk);
void to_json(nlohmann::json& j, const ChunkResult& result);

} // namespace semchunk

#endif // CHUNK_HPP
