#include "ast.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "minified.hpp"
#include "registry.hpp"
#include "splitter.hpp"
#include "utils.hpp"
#include <filesystem>
#include <iostream>
#include <vector>

using namespace std;
using namespace semchunk;
using json = nlohmann::json;

struct Options {
  int verbose = 0;
  string config_path = "semchunk.json";
  string languages_dir;
  bool legacy = false;
  bool compare = false;
  bool skip_minified = false;
  bool split = false;
  vector<string> files;
};

void print_usage(const char* prog) {
  cerr << "Usage: " << prog << " [-v|-vv] [-c config.json] [-l languages_dir] [--legacy] [--compare]" << endl;
  cerr << "       [--skip-minified] [--split] <file>..." << endl;
}

SourceFile read_source(const string& path) {
  SourceFile file;
  file.path = path;
  file.content = readFile(path);
  file.language = detectLanguageFromPath(path);

  error_code ec;
  auto mtime = std::filesystem::last_write_time(path, ec);
  if (!ec) {
    file.last_modified = chrono::time_point_cast<chrono::system_clock::duration>(
        mtime - std::filesystem::file_time_type::clock::now() + chrono::system_clock::now());
  }
  return file;
}

json split_json(const ChunkResult& result, const Splitter& splitter) {
  json pieces = json::array();
  for (const Chunk& chunk : result.chunks) {
    for (const SplitChunk& piece : splitter.split(chunk, result.file.content.size())) {
      pieces.push_back({
        {"chunk_id", chunk.id},
        {"index", piece.index},
        {"start_line", piece.start_line},
        {"end_line", piece.end_line},
        {"is_partial", piece.is_partial},
        {"content", piece.content}
      });
    }
  }
  return pieces;
}

int main(int argc, char *argv[]) {
  Options opts;

  for (int i = 1; i < argc; i++) {
    string arg = argv[i];
    if (arg == "-vv") {
      opts.verbose = 2;
    } else if (arg == "-v") {
      opts.verbose = 1;
    } else if (arg == "-c" || arg == "-l") {
      if (i + 1 >= argc) {
        cerr << "Error: " << arg << " requires a path" << endl;
        return 1;
      }
      (arg == "-c" ? opts.config_path : opts.languages_dir) = argv[++i];
    } else if (arg == "--legacy") {
      opts.legacy = true;
    } else if (arg == "--compare") {
      opts.compare = true;
    } else if (arg == "--skip-minified") {
      opts.skip_minified = true;
    } else if (arg == "--split") {
      opts.split = true;
    } else if (!arg.empty() && arg[0] == '-') {
      print_usage(argv[0]);
      return 1;
    } else {
      opts.files.push_back(arg);
    }
  }

  if (opts.files.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  ChunkerConfig config;
  unique_ptr<ChunkerRegistry> registry;
  try {
    config = ChunkerConfig::load(opts.config_path);
    setLogVerbosity(opts.verbose > 0 ? opts.verbose : config.verbosity);
    string languages_dir = opts.languages_dir.empty() ? config.languages_dir : opts.languages_dir;
    registry = ChunkerRegistry::create(make_shared<TreeSitterEngine>(), languages_dir);
  } catch (const ConfigurationError& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }

  Splitter splitter(config.max_split_chars, config.overlap_chars);
  CancelToken cancel;
  json output = json::array();
  bool failed = false;

  for (const string& path : opts.files) {
    try {
      SourceFile file = read_source(path);

      if (opts.skip_minified && isMinified(file.content, file.path, config.minified)) {
        logInfo("semchunk", "skipping minified " + path);
        output.push_back({{"path", path}, {"skipped", "minified"}});
        continue;
      }

      const Chunker& chosen = registry->pick(fileExtension(path));
      const Chunker* legacy = registry->legacyFor(chosen.language());

      if (opts.compare) {
        if (!legacy) {
          output.push_back({{"path", path}, {"skipped", "no reference extractor"}});
          continue;
        }
        ChunkResult generic = registry->chunk(file, cancel);
        ChunkResult reference = legacy->chunk(file, cancel);
        output.push_back({{"path", path}, {"differences", compareResults(reference, generic)}});
        continue;
      }

      ChunkResult result = (opts.legacy && legacy) ? legacy->chunk(file, cancel) : registry->chunk(file, cancel);
      logInfo("semchunk", path + ": " + to_string(result.chunks.size()) + " chunks via " + chosen.language());

      json entry = result;
      if (opts.split) {
        entry["pieces"] = split_json(result, splitter);
      }
      output.push_back(entry);
    } catch (const ParseFatalError& e) {
      failed = true;
      output.push_back({{"path", path}, {"error", e.what()}, {"unsupported", e.unsupported()}});
    } catch (const ChunkerError& e) {
      failed = true;
      output.push_back({{"path", path}, {"error", e.what()}});
    }
  }

  cout << output.dump(2) << endl;
  return failed ? 1 : 0;
}
