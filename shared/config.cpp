#include "config.hpp"

#include <filesystem>
#include <fstream>
#include "errors.hpp"

using json = nlohmann::json;

namespace semchunk {

void from_json(const json& j, ChunkerConfig& config) {
  ChunkerConfig defaults;
  config.languages_dir = j.value("languages_dir", defaults.languages_dir);
  config.verbosity = j.value("verbosity", defaults.verbosity);
  config.max_split_chars = j.value("max_split_chars", defaults.max_split_chars);
  config.overlap_chars = j.value("overlap_chars", defaults.overlap_chars);
  config.minified = j.contains("minified") ? j.at("minified").get<MinifiedThresholds>() : defaults.minified;
}

void to_json(json& j, const ChunkerConfig& config) {
  j = json{
    {"languages_dir", config.languages_dir},
    {"verbosity", config.verbosity},
    {"max_split_chars", config.max_split_chars},
    {"overlap_chars", config.overlap_chars},
    {"minified", config.minified}
  };
}

ChunkerConfig ChunkerConfig::load(const string& path) {
  if (!std::filesystem::exists(path)) {
    return ChunkerConfig{};
  }

  ifstream f(path);
  if (!f) {
    throw ConfigurationError("cannot read " + path);
  }
  try {
    return json::parse(f).get<ChunkerConfig>();
  } catch (const json::exception& e) {
    throw ConfigurationError(path + ": " + e.what());
  }
}

void ChunkerConfig::save(const string& path) const {
  ofstream f(path);
  if (!f) {
    throw ConfigurationError("cannot write " + path);
  }
  f << json(*this).dump(4) << endl;
}

} // namespace semchunk
