#include "legacy_chunkers.hpp"

#include "errors.hpp"
#include "utils.hpp"

namespace semchunk {

namespace {
void addChunk(const SyntaxNode& node, const SourceFile& file, const string& language, ChunkLevel level,
              const string& parent_id, ChunkResult& result) {
  string name = fieldText(node, "name", file.content);
  if (name.empty()) return;
  optional<Chunk> chunk = makeNodeChunk(node, file, language, level, name, parent_id);
  if (chunk) {
    result.chunks.push_back(std::move(*chunk));
  }
}
} // namespace

GoChunker::GoChunker(shared_ptr<const ParseEngine> engine) : engine(std::move(engine)) {
  if (!this->engine) {
    throw ConfigurationError("parse engine is required");
  }
}

ChunkResult GoChunker::chunk(const SourceFile& file, const CancelToken& cancel) const {
  cancel.throwIfDone();

  ChunkResult result;
  result.file = file;
  if (isBlank(file.content)) {
    return result;
  }

  unique_ptr<SyntaxTree> tree = this->engine->parse("go", file.content);
  result.chunks.push_back(makeFileChunk(file, this->language()));
  string file_id = result.chunks.front().id;

  // Go methods live beside their receiver type, so everything hangs off the file.
  this->walkNode(*tree->root(), file, file_id, result);
  return result;
}

void GoChunker::walkNode(const SyntaxNode& node, const SourceFile& file, const string& file_id,
                         ChunkResult& result) const {
  string type = node.type();

  if (type == "function_declaration" || type == "method_declaration") {
    addChunk(node, file, this->language(), ChunkLevel::Method, file_id, result);
    return;
  }
  if (type == "type_declaration") {
    this->extractTypeDeclarations(node, file, file_id, result);
    return;
  }

  for (size_t i = 0; i < node.childCount(); i++) {
    unique_ptr<SyntaxNode> child = node.childAt(i);
    if (child) this->walkNode(*child, file, file_id, result);
  }
}

void GoChunker::extractTypeDeclarations(const SyntaxNode& node, const SourceFile& file, const string& file_id,
                                        ChunkResult& result) const {
  for (size_t i = 0; i < node.childCount(); i++) {
    unique_ptr<SyntaxNode> child = node.childAt(i);
    if (!child || child->type() != "type_spec") continue;

    unique_ptr<SyntaxNode> type_node = child->childByField("type");
    if (!type_node) continue;
    string kind = type_node->type();
    if (kind != "struct_type" && kind != "interface_type") continue;

    addChunk(*child, file, this->language(), ChunkLevel::Class, file_id, result);
  }
}

PythonChunker::PythonChunker(shared_ptr<const ParseEngine> engine) : engine(std::move(engine)) {
  if (!this->engine) {
    throw ConfigurationError("parse engine is required");
  }
}

ChunkResult PythonChunker::chunk(const SourceFile& file, const CancelToken& cancel) const {
  cancel.throwIfDone();

  ChunkResult result;
  result.file = file;
  if (isBlank(file.content)) {
    return result;
  }

  unique_ptr<SyntaxTree> tree = this->engine->parse("python", file.content);
  result.chunks.push_back(makeFileChunk(file, this->language()));
  string file_id = result.chunks.front().id;

  this->walkNode(*tree->root(), file, file_id, result);
  return result;
}

void PythonChunker::walkNode(const SyntaxNode& node, const SourceFile& file, const string& file_id,
                             ChunkResult& result) const {
  string type = node.type();

  if (type == "class_definition") {
    this->extractClass(node, file, file_id, result);
    return;
  }
  if (type == "function_definition") {
    addChunk(node, file, this->language(), ChunkLevel::Method, file_id, result);
    return;
  }

  // decorated_definition and compound statements fall through to here.
  for (size_t i = 0; i < node.childCount(); i++) {
    unique_ptr<SyntaxNode> child = node.childAt(i);
    if (child) this->walkNode(*child, file, file_id, result);
  }
}

void PythonChunker::extractClass(const SyntaxNode& node, const SourceFile& file, const string& file_id,
                                 ChunkResult& result) const {
  string name = fieldText(node, "name", file.content);
  optional<Chunk> chunk;
  if (!name.empty()) {
    chunk = makeNodeChunk(node, file, this->language(), ChunkLevel::Class, name, file_id);
  }

  unique_ptr<SyntaxNode> body = node.childByField("body");
  if (!chunk) {
    if (body) this->walkNode(*body, file, file_id, result);
    return;
  }

  string class_id = chunk->id;
  result.chunks.push_back(std::move(*chunk));
  if (body) {
    this->walkClassBody(*body, file, file_id, class_id, result);
  }
}

void PythonChunker::walkClassBody(const SyntaxNode& body, const SourceFile& file, const string& file_id,
                                  const string& class_id, ChunkResult& result) const {
  for (size_t i = 0; i < body.childCount(); i++) {
    unique_ptr<SyntaxNode> child = body.childAt(i);
    if (!child) continue;

    string type = child->type();
    if (type == "function_definition") {
      addChunk(*child, file, this->language(), ChunkLevel::Method, class_id, result);
    } else if (type == "class_definition") {
      // Nested classes hang off the file, like GenericChunker does it.
      this->extractClass(*child, file, file_id, result);
    } else if (type == "decorated_definition") {
      unique_ptr<SyntaxNode> inner = child->childByField("definition");
      if (!inner) continue;
      if (inner->type() == "function_definition") {
        addChunk(*inner, file, this->language(), ChunkLevel::Method, class_id, result);
      } else if (inner->type() == "class_definition") {
        this->extractClass(*inner, file, file_id, result);
      }
    } else {
      // Definitions under if/try/with still belong to the class.
      this->walkClassBody(*child, file, file_id, class_id, result);
    }
  }
}

} // namespace semchunk
