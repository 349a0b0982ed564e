#include "generic_chunker.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace semchunk {

namespace {
// How many nodes to visit between cancellation checks.
constexpr size_t CANCEL_CHECK_INTERVAL = 256;

struct WalkItem {
  unique_ptr<SyntaxNode> node;
  bool leave_scope = false;
};

void pushChildren(const SyntaxNode& node, vector<WalkItem>& work) {
  // Reversed so children come off the stack in source order.
  for (size_t i = node.childCount(); i > 0; i--) {
    unique_ptr<SyntaxNode> child = node.childAt(i - 1);
    if (child) {
      work.push_back(WalkItem{std::move(child), false});
    }
  }
}
} // namespace

GenericChunker::GenericChunker(shared_ptr<const ParseEngine> engine, shared_ptr<const LanguageConfig> config)
    : engine(std::move(engine)), config(std::move(config)) {
  if (!this->engine) {
    throw ConfigurationError("parse engine is required");
  }
  if (!this->config) {
    throw ConfigurationError("language table is required");
  }
}

string GenericChunker::language() const {
  return this->config->language;
}

bool GenericChunker::isClassNode(const string& node_type) const {
  return this->config->isClassNodeType(node_type);
}

bool GenericChunker::isMethodNode(const string& node_type) const {
  return this->config->isMethodNodeType(node_type);
}

ChunkResult GenericChunker::chunk(const SourceFile& file, const CancelToken& cancel) const {
  cancel.throwIfDone();

  ChunkResult result;
  result.file = file;

  if (isBlank(file.content)) {
    return result;
  }

  unique_ptr<SyntaxTree> tree = this->engine->parse(this->config->grammar, file.content);
  if (tree->hasError()) {
    logDebug("GenericChunker", file.path + ": syntax errors, chunking the recovered tree");
  }

  const string& lang = this->config->language;
  const string& name_field = this->config->name_field;

  result.chunks.push_back(makeFileChunk(file, lang));
  const string file_id = result.chunks.front().id;

  // Innermost enclosing chunk on top. The file chunk never leaves.
  vector<string> scope{file_id};

  vector<WalkItem> work;
  work.push_back(WalkItem{tree->root(), false});
  size_t visited = 0;

  while (!work.empty()) {
    WalkItem item = std::move(work.back());
    work.pop_back();

    if (item.leave_scope) {
      scope.pop_back();
      continue;
    }
    if (++visited % CANCEL_CHECK_INTERVAL == 0) {
      cancel.throwIfDone();
    }

    const SyntaxNode& node = *item.node;
    string type = node.type();

    if (this->isClassNode(type)) {
      string name = fieldText(node, name_field, file.content);
      optional<Chunk> chunk;
      if (!name.empty() && this->config->acceptsClassNode(node)) {
        chunk = makeNodeChunk(node, file, lang, ChunkLevel::Class, name, file_id);
      }
      if (chunk) {
        scope.push_back(chunk->id);
        result.chunks.push_back(std::move(*chunk));
        work.push_back(WalkItem{nullptr, true});
      } else {
        logDebug("GenericChunker", file.path + ": skipped " + type + " at line " +
                                       to_string(node.startPoint().row + 1));
      }
      pushChildren(node, work);
      continue;
    }

    if (this->isMethodNode(type)) {
      string name = fieldText(node, name_field, file.content);
      optional<Chunk> chunk;
      if (!name.empty()) {
        chunk = makeNodeChunk(node, file, lang, ChunkLevel::Method, name, scope.back());
      }
      if (chunk) {
        result.chunks.push_back(std::move(*chunk));
      } else {
        logDebug("GenericChunker", file.path + ": skipped unnamed " + type + " at line " +
                                       to_string(node.startPoint().row + 1));
      }
      continue;
    }

    pushChildren(node, work);
  }

  logDebug("GenericChunker", file.path + ": " + to_string(result.chunks.size()) + " chunks");
  return result;
}

} // namespace semchunk
