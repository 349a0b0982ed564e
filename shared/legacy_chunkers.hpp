#ifndef LEGACY_CHUNKERS_HPP
#define LEGACY_CHUNKERS_HPP

#include <memory>
#include "chunker.hpp"

using namespace std;

namespace semchunk {

// Hand-written Go extractor, kept only to cross-check GenericChunker.
class GoChunker : public Chunker {
  private:
    shared_ptr<const ParseEngine> engine;

    void walkNode(const SyntaxNode& node, const SourceFile& file, const string& file_id, ChunkResult& result) const;
    void extractTypeDeclarations(const SyntaxNode& node, const SourceFile& file, const string& file_id,
                                 ChunkResult& result) const;
  public:
    explicit GoChunker(shared_ptr<const ParseEngine> engine);
    ChunkResult chunk(const SourceFile& file, const CancelToken& cancel) const override;
    string language() const override { return "go"; }
};

// Hand-written Python extractor, kept only to cross-check GenericChunker.
class PythonChunker : public Chunker {
  private:
    shared_ptr<const ParseEngine> engine;

    void walkNode(const SyntaxNode& node, const SourceFile& file, const string& file_id, ChunkResult& result) const;
    void walkClassBody(const SyntaxNode& body, const SourceFile& file, const string& file_id,
                       const string& class_id, ChunkResult& result) const;
    void extractClass(const SyntaxNode& node, const SourceFile& file, const string& file_id,
                      ChunkResult& result) const;
  public:
    explicit PythonChunker(shared_ptr<const ParseEngine> engine);
    ChunkResult chunk(const SourceFile& file, const CancelToken& cancel) const override;
    string language() const override { return "python"; }
};

} // namespace semchunk

#endif // LEGACY_CHUNKERS_HPP
