#include "langconfig.hpp"

#include <algorithm>
#include <filesystem>
#include "errors.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace semchunk {

string LanguageConfig::validate() const {
  vector<string> missing;
  if (this->language.empty()) missing.push_back("language");
  if (this->extensions.empty()) missing.push_back("extensions");
  if (this->grammar.empty()) missing.push_back("tree_sitter.grammar");
  if (this->name_field.empty()) missing.push_back("extraction.name_field");

  string out;
  for (size_t i = 0; i < missing.size(); i++) {
    if (i > 0) out += ", ";
    out += missing[i];
  }
  return out.empty() ? "" : "missing required fields: " + out;
}

bool LanguageConfig::isClassNodeType(const string& node_type) const {
  return this->class_types.count(node_type) > 0;
}

bool LanguageConfig::isMethodNodeType(const string& node_type) const {
  return this->method_types.count(node_type) > 0;
}

bool LanguageConfig::isBlockNodeType(const string& node_type) const {
  return this->block_types.count(node_type) > 0;
}

bool ClassFilter::accepts(const SyntaxNode& node) const {
  for (const string& field : this->required_fields) {
    if (!node.childByField(field)) return false;
  }
  if (this->kind_field.empty()) {
    return true;
  }
  unique_ptr<SyntaxNode> kind = node.childByField(this->kind_field);
  return kind && this->kinds.count(kind->type()) > 0;
}

bool LanguageConfig::acceptsClassNode(const SyntaxNode& node) const {
  string type = node.type();
  if (!this->isClassNodeType(type)) {
    return false;
  }
  auto filter = this->class_filters.find(type);
  return filter == this->class_filters.end() || filter->second.accepts(node);
}

bool LanguageConfig::matchesExtension(const string& ext) const {
  string lowered = toLower(ext);
  return find(this->extensions.begin(), this->extensions.end(), lowered) != this->extensions.end();
}

void from_json(const json& j, ClassFilter& filter) {
  filter.kind_field = j.value("kind_field", "");
  filter.kinds = j.value("kinds", set<string>{});
  filter.required_fields = j.value("required_fields", vector<string>{});
}

void to_json(json& j, const ClassFilter& filter) {
  j = json{
    {"kind_field", filter.kind_field},
    {"kinds", filter.kinds},
    {"required_fields", filter.required_fields}
  };
}

void from_json(const json& j, LanguageConfig& config) {
  config.language = j.value("language", "");
  config.display_name = j.value("display_name", config.language);
  config.extensions.clear();
  if (j.contains("extensions")) {
    for (const auto& ext : j.at("extensions")) {
      config.extensions.push_back(toLower(ext.get<string>()));
    }
  }
  if (j.contains("tree_sitter")) {
    config.grammar = j.at("tree_sitter").value("grammar", "");
  }
  if (j.contains("chunk_mappings")) {
    const json& mappings = j.at("chunk_mappings");
    config.class_types = mappings.value("class", set<string>{});
    config.method_types = mappings.value("method", set<string>{});
    config.block_types = mappings.value("block", set<string>{});
    config.class_filters = mappings.value("class_filters", map<string, ClassFilter>{});
  }
  config.name_field = "name";
  if (j.contains("extraction")) {
    config.name_field = j.at("extraction").value("name_field", "name");
  }
}

void to_json(json& j, const LanguageConfig& config) {
  j = json{
    {"language", config.language},
    {"display_name", config.display_name},
    {"extensions", config.extensions},
    {"tree_sitter", {{"grammar", config.grammar}}},
    {"chunk_mappings", {
      {"class", config.class_types},
      {"method", config.method_types},
      {"block", config.block_types},
      {"class_filters", config.class_filters}
    }},
    {"extraction", {{"name_field", config.name_field}}}
  };
}

LanguageConfig parseLanguageConfig(const string& text) {
  LanguageConfig config;
  try {
    config = json::parse(text).get<LanguageConfig>();
  } catch (const json::exception& e) {
    throw ConfigurationError(string("invalid language table: ") + e.what());
  }

  string problem = config.validate();
  if (!problem.empty()) {
    throw ConfigurationError(problem);
  }
  return config;
}

LanguageConfig loadLanguageConfig(const string& path) {
  string text;
  try {
    text = readFile(path);
  } catch (const ChunkerError& e) {
    throw ConfigurationError(e.what());
  }
  try {
    return parseLanguageConfig(text);
  } catch (const ConfigurationError& e) {
    throw ConfigurationError(path + ": " + e.what());
  }
}

pair<vector<LanguageConfig>, vector<string>> loadAllLanguageConfigs(const string& dir) {
  namespace fs = std::filesystem;
  vector<LanguageConfig> configs;
  vector<string> errors;

  error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    errors.push_back("failed to read directory " + dir + ": " + ec.message());
    return {configs, errors};
  }

  // Sorted so registration order does not depend on the filesystem.
  vector<fs::path> files;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    if (!it->is_regular_file(ec)) continue;
    if (toLower(it->path().extension().string()) == ".json") {
      files.push_back(it->path());
    }
  }
  sort(files.begin(), files.end());

  for (const fs::path& file : files) {
    try {
      configs.push_back(loadLanguageConfig(file.string()));
    } catch (const ConfigurationError& e) {
      errors.push_back("skipping " + file.filename().string() + ": " + e.what());
    }
  }
  return {configs, errors};
}

vector<LanguageConfig> builtinLanguageConfigs() {
  vector<LanguageConfig> configs;

  LanguageConfig go;
  go.language = "go";
  go.display_name = "Go";
  go.extensions = {".go"};
  go.grammar = "go";
  go.class_types = {"type_spec"};
  // Only struct and interface types are class-like; named func types,
  // aliases of builtins and the like are not.
  go.class_filters["type_spec"] = ClassFilter{"type", {"struct_type", "interface_type"}, {}};
  go.method_types = {"function_declaration", "method_declaration"};
  go.block_types = {"if_statement", "for_statement", "switch_statement"};
  configs.push_back(go);

  LanguageConfig python;
  python.language = "python";
  python.display_name = "Python";
  python.extensions = {".py", ".pyi"};
  python.grammar = "python";
  python.class_types = {"class_definition"};
  python.method_types = {"function_definition"};
  python.block_types = {"if_statement", "for_statement", "while_statement"};
  configs.push_back(python);

  LanguageConfig java;
  java.language = "java";
  java.display_name = "Java";
  java.extensions = {".java"};
  java.grammar = "java";
  java.class_types = {"class_declaration", "interface_declaration", "enum_declaration",
                      "record_declaration", "annotation_type_declaration"};
  java.method_types = {"method_declaration", "constructor_declaration"};
  configs.push_back(java);

  LanguageConfig javascript;
  javascript.language = "javascript";
  javascript.display_name = "JavaScript";
  javascript.extensions = {".js", ".jsx", ".mjs", ".cjs"};
  javascript.grammar = "javascript";
  javascript.class_types = {"class_declaration"};
  javascript.method_types = {"function_declaration", "generator_function_declaration", "method_definition"};
  configs.push_back(javascript);

  // Function names sit behind nested declarators in this grammar, so only
  // the type-level constructs are classified. Specifiers without a body are
  // references (`struct stat *st`, `enum Color c;`) or forward declarations.
  LanguageConfig cpp;
  cpp.language = "cpp";
  cpp.display_name = "C++";
  cpp.extensions = {".cpp", ".cc", ".cxx", ".hpp", ".hh", ".h"};
  cpp.grammar = "cpp";
  cpp.class_types = {"class_specifier", "struct_specifier", "union_specifier", "enum_specifier"};
  for (const string& type : cpp.class_types) {
    cpp.class_filters[type] = ClassFilter{"", {}, {"body"}};
  }
  configs.push_back(cpp);

  return configs;
}

} // namespace semchunk
