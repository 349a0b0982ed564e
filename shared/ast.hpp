#ifndef AST_HPP
#define AST_HPP

#include <map>
#include <string>
#include <vector>
#include <cpp-tree-sitter.h>
#include "syntax.hpp"

using namespace std;

namespace semchunk {

class TreeSitterNode : public SyntaxNode {
  private:
    ts::Node node;
  public:
    explicit TreeSitterNode(ts::Node node);
    string type() const override;
    Point startPoint() const override;
    Point endPoint() const override;
    uint32_t startByte() const override;
    uint32_t endByte() const override;
    size_t childCount() const override;
    unique_ptr<SyntaxNode> childAt(size_t index) const override;
    unique_ptr<SyntaxNode> childByField(const string& field) const override;
};

class TreeSitterTree : public SyntaxTree {
  private:
    ts::Tree tree;
  public:
    explicit TreeSitterTree(ts::Tree tree);
    unique_ptr<SyntaxNode> root() const override;
    bool hasError() const override;
};

// ParseEngine over the linked tree-sitter grammars. Every parse() builds
// its own ts::Parser, so one engine can serve many threads.
class TreeSitterEngine : public ParseEngine {
  private:
    using LanguageFn = TSLanguage* (*)();
    map<string, LanguageFn> grammars;
  public:
    TreeSitterEngine();
    unique_ptr<SyntaxTree> parse(const string& language, const string& source) const override;
    bool supports(const string& language) const override;
    vector<string> grammarNames() const;
};

string detectLanguageFromPath(const string& filepath);

} // namespace semchunk

#endif // AST_HPP
