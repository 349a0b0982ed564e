#ifndef FAKE_SYNTAX_HPP
#define FAKE_SYNTAX_HPP

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "errors.hpp"
#include "syntax.hpp"

// In-memory syntax trees so traversal can be tested without grammars.
namespace fake_syntax {

using semchunk::Point;
using semchunk::SyntaxNode;
using semchunk::SyntaxTree;

struct NodeData {
  std::string type;
  std::string field;
  Point start;
  Point end;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;
  std::vector<std::shared_ptr<NodeData>> children;
};
using NodeRef = std::shared_ptr<NodeData>;

class FakeNode : public SyntaxNode {
  private:
    std::shared_ptr<const NodeData> data;
  public:
    explicit FakeNode(std::shared_ptr<const NodeData> data) : data(std::move(data)) {}
    std::string type() const override { return data->type; }
    Point startPoint() const override { return data->start; }
    Point endPoint() const override { return data->end; }
    uint32_t startByte() const override { return data->start_byte; }
    uint32_t endByte() const override { return data->end_byte; }
    size_t childCount() const override { return data->children.size(); }
    std::unique_ptr<SyntaxNode> childAt(size_t index) const override {
      if (index >= data->children.size()) return nullptr;
      return std::make_unique<FakeNode>(data->children[index]);
    }
    std::unique_ptr<SyntaxNode> childByField(const std::string& field) const override {
      for (const auto& child : data->children) {
        if (child->field == field) return std::make_unique<FakeNode>(child);
      }
      return nullptr;
    }
};

class FakeTree : public SyntaxTree {
  private:
    NodeRef root_data;
    bool error;
  public:
    FakeTree(NodeRef root, bool error) : root_data(std::move(root)), error(error) {}
    std::unique_ptr<SyntaxNode> root() const override { return std::make_unique<FakeNode>(root_data); }
    bool hasError() const override { return error; }
};

// Builds nodes from 1-based line ranges of `source`. A node covers its
// lines from the first to the last byte, excluding the final newline.
class Builder {
  private:
    std::string source;
    std::vector<size_t> line_starts;

    size_t lineEnd(int line) const {
      size_t next = static_cast<size_t>(line) < line_starts.size() ? line_starts[line] - 1 : source.size();
      return next;
    }
  public:
    explicit Builder(std::string src) : source(std::move(src)) {
      line_starts.push_back(0);
      for (size_t i = 0; i < source.size(); i++) {
        if (source[i] == '\n') line_starts.push_back(i + 1);
      }
    }

    NodeRef node(const std::string& type, int first, int last, std::vector<NodeRef> children = {}) const {
      auto n = std::make_shared<NodeData>();
      n->type = type;
      n->start_byte = static_cast<uint32_t>(line_starts[first - 1]);
      n->end_byte = static_cast<uint32_t>(lineEnd(last));
      n->start = Point{static_cast<uint32_t>(first - 1), 0};
      n->end = Point{static_cast<uint32_t>(last - 1), static_cast<uint32_t>(n->end_byte - line_starts[last - 1])};
      n->children = std::move(children);
      return n;
    }

    // Like node(), plus an identifier child in field `field` pointing at the
    // first occurrence of `name` on the first line.
    NodeRef named(const std::string& type, int first, int last, const std::string& name,
                  std::vector<NodeRef> children = {}, const std::string& field = "name") const {
      NodeRef n = node(type, first, last, std::move(children));
      size_t at = source.find(name, line_starts[first - 1]);
      auto id = std::make_shared<NodeData>();
      id->type = "identifier";
      id->field = field;
      id->start_byte = static_cast<uint32_t>(at);
      id->end_byte = static_cast<uint32_t>(at + name.size());
      id->start = Point{static_cast<uint32_t>(first - 1), static_cast<uint32_t>(at - line_starts[first - 1])};
      id->end = Point{id->start.row, id->start.column + static_cast<uint32_t>(name.size())};
      n->children.insert(n->children.begin(), id);
      return n;
    }

    NodeRef field(NodeRef n, const std::string& field_name) const {
      n->field = field_name;
      return n;
    }

    NodeRef root(const std::string& type, std::vector<NodeRef> children) const {
      auto n = std::make_shared<NodeData>();
      n->type = type;
      n->start_byte = 0;
      n->end_byte = static_cast<uint32_t>(source.size());
      n->start = Point{0, 0};
      n->end = Point{static_cast<uint32_t>(line_starts.size() - 1),
                     static_cast<uint32_t>(source.size() - line_starts.back())};
      n->children = std::move(children);
      return n;
    }
};

// ParseEngine that hands out a prepared tree per grammar and counts parse
// calls. Unknown grammars fail the way a real engine does.
class FakeEngine : public semchunk::ParseEngine {
  private:
    std::map<std::string, std::function<NodeRef(const std::string&)>> grammars;
    bool report_errors = false;
  public:
    mutable std::atomic<int> parse_calls{0};

    void add(const std::string& grammar, std::function<NodeRef(const std::string&)> build) {
      grammars[grammar] = std::move(build);
    }
    void setReportErrors(bool value) { report_errors = value; }

    std::unique_ptr<SyntaxTree> parse(const std::string& language, const std::string& source) const override {
      parse_calls++;
      auto it = grammars.find(language);
      if (it == grammars.end()) {
        throw semchunk::ParseFatalError("unsupported language: " + language, true);
      }
      return std::make_unique<FakeTree>(it->second(source), report_errors);
    }

    bool supports(const std::string& language) const override {
      return grammars.count(language) > 0;
    }
};

} // namespace fake_syntax

#endif // FAKE_SYNTAX_HPP
