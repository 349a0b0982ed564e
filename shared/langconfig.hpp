#ifndef LANGCONFIG_HPP
#define LANGCONFIG_HPP

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "syntax.hpp"

using namespace std;

namespace semchunk {

// Extra conditions on one class-like node type. A node that fails them is
// treated like an unnamed class: no chunk, subtree still searched.
struct ClassFilter {
  // When set, the node type of this field's child must be one of `kinds`.
  string kind_field;
  set<string> kinds;
  // Fields that must be present, e.g. "body" to skip bare type references.
  vector<string> required_fields;

  bool accepts(const SyntaxNode& node) const;
};

// Classification table for one language: which grammar node types are
// class-like, which are method-like, and which field carries the name.
// Read-only once built.
struct LanguageConfig {
  string language;
  string display_name;
  vector<string> extensions;
  string grammar;
  set<string> class_types;
  set<string> method_types;
  set<string> block_types;
  map<string, ClassFilter> class_filters;
  string name_field = "name";

  // Empty when the table is usable, otherwise the missing fields.
  string validate() const;

  bool isClassNodeType(const string& node_type) const;
  bool isMethodNodeType(const string& node_type) const;
  bool isBlockNodeType(const string& node_type) const;
  // Class-like by type and passing that type's filter, if any.
  bool acceptsClassNode(const SyntaxNode& node) const;
  bool matchesExtension(const string& ext) const;

  bool hasClassMappings() const { return !this->class_types.empty(); }
  bool hasMethodMappings() const { return !this->method_types.empty(); }
};

// Throws ConfigurationError on a malformed or incomplete table.
LanguageConfig parseLanguageConfig(const string& text);
LanguageConfig loadLanguageConfig(const string& path);

// Every *.json table in `dir`. Tables that fail to load are reported in
// the second element and skipped.
pair<vector<LanguageConfig>, vector<string>> loadAllLanguageConfigs(const string& dir);

vector<LanguageConfig> builtinLanguageConfigs();

void from_json(const nlohmann::json& j, ClassFilter& filter);
void to_json(nlohmann::json& j, const ClassFilter& filter);
void from_json(const nlohmann::json& j, LanguageConfig& config);
void to_json(nlohmann::json& j, const LanguageConfig& config);

} // namespace semchunk

#endif // LANGCONFIG_HPP
