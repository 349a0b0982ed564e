#ifndef SYNTAX_HPP
#define SYNTAX_HPP

#include <cstdint>
#include <memory>
#include <string>

using namespace std;

namespace semchunk {

struct Point {
  uint32_t row = 0;
  uint32_t column = 0;
};

// Read-only view of one node of a concrete syntax tree. Nodes borrow from
// the SyntaxTree that produced them and must not outlive it.
class SyntaxNode {
  public:
    virtual ~SyntaxNode() = default;

    virtual string type() const = 0;
    virtual Point startPoint() const = 0;
    virtual Point endPoint() const = 0;
    virtual uint32_t startByte() const = 0;
    virtual uint32_t endByte() const = 0;

    virtual size_t childCount() const = 0;
    virtual unique_ptr<SyntaxNode> childAt(size_t index) const = 0;
    // nullptr when the grammar put nothing in that field.
    virtual unique_ptr<SyntaxNode> childByField(const string& field) const = 0;

    // The node's text, or "" when its byte range falls outside `source`.
    string content(const string& source) const {
      uint32_t start = this->startByte();
      uint32_t end = this->endByte();
      if (end < start || end > source.size()) return "";
      return source.substr(start, end - start);
    }
};

class SyntaxTree {
  public:
    virtual ~SyntaxTree() = default;
    virtual unique_ptr<SyntaxNode> root() const = 0;
    virtual bool hasError() const = 0;
};

// Error-tolerant parser front. parse() must return a best-effort tree for
// malformed input and throw ParseFatalError only when no tree can be built
// (unknown grammar, engine failure). Implementations are shared between
// threads, so parse() must not keep per-call state on the engine.
class ParseEngine {
  public:
    virtual ~ParseEngine() = default;
    virtual unique_ptr<SyntaxTree> parse(const string& language, const string& source) const = 0;
    virtual bool supports(const string& language) const = 0;
};

} // namespace semchunk

#endif // SYNTAX_HPP
