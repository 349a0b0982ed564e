#include "fallback_chunker.hpp"

#include "utils.hpp"

namespace semchunk {

ChunkResult FallbackChunker::chunk(const SourceFile& file, const CancelToken& cancel) const {
  cancel.throwIfDone();

  ChunkResult result;
  result.file = file;
  if (isBlank(file.content)) {
    return result;
  }

  result.chunks.push_back(makeFileChunk(file, file.language.empty() ? this->language() : file.language));
  return result;
}

} // namespace semchunk
