#ifndef REGISTRY_HPP
#define REGISTRY_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "chunker.hpp"
#include "fallback_chunker.hpp"
#include "langconfig.hpp"

using namespace std;

namespace semchunk {

// Routes files to an extraction strategy by extension. Built once, then
// read-only: lookups and chunk() may run concurrently without locking.
class ChunkerRegistry {
  private:
    shared_ptr<const ParseEngine> engine;
    map<string, unique_ptr<Chunker>> chunkers;
    map<string, unique_ptr<Chunker>> legacy_chunkers;
    map<string, string> extension_to_language;
    FallbackChunker fallback;

    void registerConfig(const LanguageConfig& config);
  public:
    // Registers a GenericChunker per table the engine can parse, plus the
    // Go and Python reference extractors. Tables with an unknown grammar are
    // skipped with a warning. Throws ConfigurationError when the engine is
    // missing or nothing could be registered.
    ChunkerRegistry(shared_ptr<const ParseEngine> engine, const vector<LanguageConfig>& configs);

    // Builtin tables, then any tables found in `languages_dir` (which win
    // on a language name clash).
    static unique_ptr<ChunkerRegistry> create(shared_ptr<const ParseEngine> engine,
                                              const string& languages_dir = "");

    // Never null: unknown extensions get the fallback.
    const Chunker& pick(const string& extension) const;
    const Chunker* legacyFor(const string& language) const;
    const Chunker& fallbackChunker() const { return this->fallback; }

    optional<string> languageForExtension(const string& extension) const;
    vector<string> supportedLanguages() const;
    bool isSupported(const string& language) const;

    // pick() by the extension of file.path, then chunk.
    ChunkResult chunk(const SourceFile& file, const CancelToken& cancel) const;
};

// Every way two results for the same file disagree on chunk counts, names
// per level, or parent names. Empty when they agree.
vector<string> compareResults(const ChunkResult& expected, const ChunkResult& actual);

} // namespace semchunk

#endif // REGISTRY_HPP
