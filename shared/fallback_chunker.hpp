#ifndef FALLBACK_CHUNKER_HPP
#define FALLBACK_CHUNKER_HPP

#include "chunker.hpp"

namespace semchunk {

// One File chunk for whatever it is given, so every file stays indexable.
class FallbackChunker : public Chunker {
  public:
    ChunkResult chunk(const SourceFile& file, const CancelToken& cancel) const override;
    string language() const override { return "unknown"; }
};

} // namespace semchunk

#endif // FALLBACK_CHUNKER_HPP
