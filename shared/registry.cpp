#include "registry.hpp"

#include <algorithm>
#include <iterator>
#include "errors.hpp"
#include "generic_chunker.hpp"
#include "legacy_chunkers.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace semchunk {

namespace {
string normalizeExtension(const string& extension) {
  string ext = toLower(extension);
  if (!ext.empty() && ext[0] != '.') {
    ext = "." + ext;
  }
  return ext;
}
} // namespace

ChunkerRegistry::ChunkerRegistry(shared_ptr<const ParseEngine> engine, const vector<LanguageConfig>& configs)
    : engine(std::move(engine)) {
  if (!this->engine) {
    throw ConfigurationError("parse engine is required");
  }

  for (const LanguageConfig& config : configs) {
    this->registerConfig(config);
  }
  if (this->chunkers.empty()) {
    throw ConfigurationError("no language tables could be registered");
  }

  if (this->engine->supports("go")) {
    this->legacy_chunkers["go"] = make_unique<GoChunker>(this->engine);
  }
  if (this->engine->supports("python")) {
    this->legacy_chunkers["python"] = make_unique<PythonChunker>(this->engine);
  }
}

void ChunkerRegistry::registerConfig(const LanguageConfig& config) {
  string problem = config.validate();
  if (!problem.empty()) {
    logWarning("Registry", "skipping language table: " + problem);
    return;
  }
  if (!this->engine->supports(config.grammar)) {
    logWarning("Registry", "skipping " + config.language + ": unsupported grammar " + config.grammar);
    return;
  }

  this->chunkers[config.language] =
      make_unique<GenericChunker>(this->engine, make_shared<const LanguageConfig>(config));
  for (const string& ext : config.extensions) {
    this->extension_to_language[normalizeExtension(ext)] = config.language;
  }
  logDebug("Registry", "registered " + config.language + " (" + to_string(config.extensions.size()) +
                           " extensions)");
}

unique_ptr<ChunkerRegistry> ChunkerRegistry::create(shared_ptr<const ParseEngine> engine,
                                                    const string& languages_dir) {
  vector<LanguageConfig> configs = builtinLanguageConfigs();

  if (!languages_dir.empty()) {
    auto loaded = loadAllLanguageConfigs(languages_dir);
    for (const string& error : loaded.second) {
      logWarning("Registry", error);
    }
    for (LanguageConfig& config : loaded.first) {
      auto same = find_if(configs.begin(), configs.end(),
                          [&config](const LanguageConfig& c) { return c.language == config.language; });
      if (same != configs.end()) {
        *same = std::move(config);
      } else {
        configs.push_back(std::move(config));
      }
    }
  }

  return make_unique<ChunkerRegistry>(std::move(engine), configs);
}

const Chunker& ChunkerRegistry::pick(const string& extension) const {
  auto lang = this->extension_to_language.find(normalizeExtension(extension));
  if (lang == this->extension_to_language.end()) {
    return this->fallback;
  }
  auto chunker = this->chunkers.find(lang->second);
  if (chunker == this->chunkers.end()) {
    return this->fallback;
  }
  return *chunker->second;
}

const Chunker* ChunkerRegistry::legacyFor(const string& language) const {
  auto it = this->legacy_chunkers.find(language);
  return it == this->legacy_chunkers.end() ? nullptr : it->second.get();
}

optional<string> ChunkerRegistry::languageForExtension(const string& extension) const {
  auto it = this->extension_to_language.find(normalizeExtension(extension));
  if (it == this->extension_to_language.end()) return nullopt;
  return it->second;
}

vector<string> ChunkerRegistry::supportedLanguages() const {
  vector<string> languages;
  for (const auto& entry : this->chunkers) {
    languages.push_back(entry.first);
  }
  return languages;
}

bool ChunkerRegistry::isSupported(const string& language) const {
  return this->chunkers.count(language) > 0;
}

ChunkResult ChunkerRegistry::chunk(const SourceFile& file, const CancelToken& cancel) const {
  string ext = fileExtension(file.path);
  const Chunker& chunker = ext.empty() ? this->fallback : this->pick(ext);

  SourceFile routed = file;
  if (&chunker != &this->fallback) {
    routed.language = chunker.language();
  }
  return chunker.chunk(routed, cancel);
}

namespace {
struct ChunkKey {
  string level;
  string name;
  string parent_name;

  bool operator<(const ChunkKey& other) const {
    if (this->level != other.level) return this->level < other.level;
    if (this->name != other.name) return this->name < other.name;
    return this->parent_name < other.parent_name;
  }
  bool operator==(const ChunkKey& other) const {
    return this->level == other.level && this->name == other.name && this->parent_name == other.parent_name;
  }
};

vector<ChunkKey> shapeOf(const ChunkResult& result) {
  vector<ChunkKey> keys;
  for (const Chunk& chunk : result.chunks) {
    ChunkKey key{levelName(chunk.level), chunk.name, ""};
    if (chunk.parent_id) {
      const Chunk* parent = result.findById(*chunk.parent_id);
      key.parent_name = parent ? levelName(parent->level) + ":" + parent->name : "<dangling>";
    }
    keys.push_back(key);
  }
  sort(keys.begin(), keys.end());
  return keys;
}

string describe(const ChunkKey& key) {
  string out = key.level + " " + key.name;
  if (!key.parent_name.empty()) out += " (parent " + key.parent_name + ")";
  return out;
}
} // namespace

vector<string> compareResults(const ChunkResult& expected, const ChunkResult& actual) {
  vector<string> problems;

  for (ChunkLevel level : {ChunkLevel::File, ChunkLevel::Class, ChunkLevel::Method}) {
    size_t want = expected.countLevel(level);
    size_t got = actual.countLevel(level);
    if (want != got) {
      problems.push_back(levelName(level) + " count: expected " + to_string(want) + ", got " + to_string(got));
    }
  }

  vector<ChunkKey> want = shapeOf(expected);
  vector<ChunkKey> got = shapeOf(actual);
  vector<ChunkKey> missing;
  vector<ChunkKey> extra;
  set_difference(want.begin(), want.end(), got.begin(), got.end(), back_inserter(missing));
  set_difference(got.begin(), got.end(), want.begin(), want.end(), back_inserter(extra));

  for (const ChunkKey& key : missing) {
    problems.push_back("missing " + describe(key));
  }
  for (const ChunkKey& key : extra) {
    problems.push_back("unexpected " + describe(key));
  }
  return problems;
}

} // namespace semchunk
