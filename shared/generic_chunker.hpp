#ifndef GENERIC_CHUNKER_HPP
#define GENERIC_CHUNKER_HPP

#include <memory>
#include "chunker.hpp"
#include "langconfig.hpp"

using namespace std;

namespace semchunk {

// Table-driven extractor: one traversal for every language, parameterized
// by a LanguageConfig.
//
// A method-like node is parented to the innermost class chunk whose subtree
// contains it, or to the file chunk at top scope. Every class-like node is
// parented to the file chunk, nested classes included. Method bodies are
// not searched further. A class-like node without a name, or rejected by
// its ClassFilter, emits nothing but its subtree is still searched under
// the enclosing scope.
class GenericChunker : public Chunker {
  private:
    shared_ptr<const ParseEngine> engine;
    shared_ptr<const LanguageConfig> config;
  public:
    // Throws ConfigurationError when either collaborator is missing.
    GenericChunker(shared_ptr<const ParseEngine> engine, shared_ptr<const LanguageConfig> config);

    ChunkResult chunk(const SourceFile& file, const CancelToken& cancel) const override;
    string language() const override;

    bool isClassNode(const string& node_type) const;
    bool isMethodNode(const string& node_type) const;
};

} // namespace semchunk

#endif // GENERIC_CHUNKER_HPP
