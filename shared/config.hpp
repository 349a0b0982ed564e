#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "minified.hpp"

using namespace std;

namespace semchunk {

struct ChunkerConfig {
  string languages_dir;
  int verbosity = 0;
  size_t max_split_chars = 6000;
  size_t overlap_chars = 900;
  MinifiedThresholds minified;

  // Defaults when `path` does not exist; ConfigurationError when it
  // exists but is not a valid config.
  static ChunkerConfig load(const string& path);
  void save(const string& path) const;
};

void from_json(const nlohmann::json& j, ChunkerConfig& config);
void to_json(nlohmann::json& j, const ChunkerConfig& config);

} // namespace semchunk

#endif // CONFIG_HPP
