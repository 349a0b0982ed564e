#include "chunk.hpp"

#include <algorithm>
#include "sha256.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace semchunk {

static constexpr size_t DIGEST_BYTES = 16;

string levelName(ChunkLevel level) {
  switch (level) {
  case ChunkLevel::File:
    return "file";
  case ChunkLevel::Class:
    return "class";
  case ChunkLevel::Method:
    return "method";
  }
  return "unknown";
}

string Chunk::generateId() const {
  string key = this->file_path + ":" + to_string(this->start_line) + ":" + to_string(this->end_line) + ":" +
               levelName(this->level) + ":" + this->language + ":" + this->name;
  return sha256Hex(key, DIGEST_BYTES);
}

string Chunk::generateContentHash() const {
  return sha256Hex(this->content, DIGEST_BYTES);
}

void Chunk::setHashes() {
  this->id = this->generateId();
  this->content_hash = this->generateContentHash();
}

string Chunk::validationError() const {
  if (this->file_path.empty()) {
    return "file path is required";
  }
  if (this->start_line < 1) {
    return "start line must be >= 1";
  }
  if (this->end_line < this->start_line) {
    return "end line must be >= start line";
  }
  if (isBlank(this->content)) {
    return "content is required";
  }
  if (this->level != ChunkLevel::File && !this->parent_id) {
    return "parent id is required below file level";
  }
  return "";
}

const Chunk* ChunkResult::findById(const string& id) const {
  for (const Chunk& chunk : this->chunks) {
    if (chunk.id == id) return &chunk;
  }
  return nullptr;
}

size_t ChunkResult::countLevel(ChunkLevel level) const {
  return static_cast<size_t>(count_if(this->chunks.begin(), this->chunks.end(),
                                      [level](const Chunk& c) { return c.level == level; }));
}

void to_json(json& j, const Chunk& chunk) {
  j = json{
    {"id", chunk.id},
    {"file_path", chunk.file_path},
    {"start_line", chunk.start_line},
    {"end_line", chunk.end_line},
    {"level", levelName(chunk.level)},
    {"language", chunk.language},
    {"name", chunk.name},
    {"signature", chunk.signature},
    {"content_hash", chunk.content_hash},
    {"content", chunk.content}
  };
  if (chunk.parent_id) {
    j["parent_id"] = *chunk.parent_id;
  } else {
    j["parent_id"] = nullptr;
  }
}

void to_json(json& j, const ChunkResult& result) {
  j = json{
    {"path", result.file.path},
    {"language", result.file.language},
    {"chunks", result.chunks},
    {"errors", result.errors}
  };
}

} // namespace semchunk
