#include "ast.hpp"

#include "errors.hpp"
#include "utils.hpp"

extern "C" {
TSLanguage *tree_sitter_python();
TSLanguage *tree_sitter_cpp();
TSLanguage *tree_sitter_java();
TSLanguage *tree_sitter_javascript();
TSLanguage *tree_sitter_go();
}

namespace semchunk {

TreeSitterNode::TreeSitterNode(ts::Node node) : node(node) {}

string TreeSitterNode::type() const {
  return string(this->node.getType());
}

Point TreeSitterNode::startPoint() const {
  auto range = this->node.getPointRange();
  return Point{range.start.row, range.start.column};
}

Point TreeSitterNode::endPoint() const {
  auto range = this->node.getPointRange();
  return Point{range.end.row, range.end.column};
}

uint32_t TreeSitterNode::startByte() const {
  return this->node.getByteRange().start;
}

uint32_t TreeSitterNode::endByte() const {
  return this->node.getByteRange().end;
}

size_t TreeSitterNode::childCount() const {
  return this->node.getNumChildren();
}

unique_ptr<SyntaxNode> TreeSitterNode::childAt(size_t index) const {
  if (index >= this->childCount()) return nullptr;
  return make_unique<TreeSitterNode>(this->node.getChild(static_cast<uint32_t>(index)));
}

unique_ptr<SyntaxNode> TreeSitterNode::childByField(const string& field) const {
  TSNode child = ts_node_child_by_field_name(this->node.impl, field.c_str(), static_cast<uint32_t>(field.size()));
  if (ts_node_is_null(child)) return nullptr;
  return make_unique<TreeSitterNode>(ts::Node{child});
}

TreeSitterTree::TreeSitterTree(ts::Tree tree) : tree(std::move(tree)) {}

unique_ptr<SyntaxNode> TreeSitterTree::root() const {
  return make_unique<TreeSitterNode>(this->tree.getRootNode());
}

bool TreeSitterTree::hasError() const {
  return ts_node_has_error(this->tree.getRootNode().impl);
}

TreeSitterEngine::TreeSitterEngine() {
  this->grammars["python"] = tree_sitter_python;
  this->grammars["cpp"] = tree_sitter_cpp;
  this->grammars["java"] = tree_sitter_java;
  this->grammars["javascript"] = tree_sitter_javascript;
  this->grammars["go"] = tree_sitter_go;
}

unique_ptr<SyntaxTree> TreeSitterEngine::parse(const string& language, const string& source) const {
  auto it = this->grammars.find(language);
  if (it == this->grammars.end()) {
    throw ParseFatalError("unsupported language: " + language, true);
  }

  TSLanguage *lang = it->second();
  uint32_t version = ts_language_version(lang);
  if (version < TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION || version > TREE_SITTER_LANGUAGE_VERSION) {
    throw ParseFatalError("grammar " + language + " has incompatible ABI version " + to_string(version), false);
  }

  ts::Parser parser{lang};
  return make_unique<TreeSitterTree>(parser.parseString(source));
}

bool TreeSitterEngine::supports(const string& language) const {
  return this->grammars.count(language) > 0;
}

vector<string> TreeSitterEngine::grammarNames() const {
  vector<string> names;
  for (const auto& entry : this->grammars) {
    names.push_back(entry.first);
  }
  return names;
}

string detectLanguageFromPath(const string& filepath) {
  string extension = fileExtension(filepath);

  if (extension == ".py" || extension == ".pyi") {
    return "python";
  } else if (extension == ".cpp" || extension == ".cc" || extension == ".cxx" || extension == ".c" ||
             extension == ".h" || extension == ".hpp" || extension == ".hh") {
    return "cpp";
  } else if (extension == ".java") {
    return "java";
  } else if (extension == ".js" || extension == ".jsx" || extension == ".mjs" || extension == ".cjs") {
    return "javascript";
  } else if (extension == ".go") {
    return "go";
  } else {
    return "text";
  }
}

} // namespace semchunk
