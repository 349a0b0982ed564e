#ifndef CHUNKER_HPP
#define CHUNKER_HPP

#include <optional>
#include <string>
#include "cancel.hpp"
#include "chunk.hpp"
#include "syntax.hpp"

using namespace std;

namespace semchunk {

// One extraction strategy. Implementations hold no per-file state, so a
// single instance may be called from several threads at once.
class Chunker {
  public:
    virtual ~Chunker() = default;

    // Splits `file` into a File chunk plus any Class/Method chunks.
    // Throws CancellationError when `cancel` is already done and
    // ParseFatalError when the engine cannot produce a tree.
    virtual ChunkResult chunk(const SourceFile& file, const CancelToken& cancel) const = 0;
    virtual string language() const = 0;
};

// Shared building blocks for tree-based strategies.

// Whole-file chunk, named by the path, with no parent.
Chunk makeFileChunk(const SourceFile& file, const string& language);

// Chunk for `node`, or nullopt when its position is malformed or its text
// is blank. The caller supplies the name and parent.
optional<Chunk> makeNodeChunk(const SyntaxNode& node, const SourceFile& file, const string& language,
                              ChunkLevel level, const string& name, const string& parent_id);

// Text of the node's `field` child, or "" when absent.
string fieldText(const SyntaxNode& node, const string& field, const string& source);

} // namespace semchunk

#endif // CHUNKER_HPP
