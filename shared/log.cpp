#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace semchunk {

namespace {
atomic<int> verbosity{0};
mutex output_mutex;

void emit(const char* level, const string& tag, const string& message) {
  lock_guard<mutex> lock(output_mutex);
  cerr << level << " [" << tag << "] " << message << endl;
}
} // namespace

void setLogVerbosity(int verbose) {
  verbosity.store(verbose < 0 ? 0 : verbose);
}

int logVerbosity() {
  return verbosity.load();
}

void logWarning(const string& tag, const string& message) {
  emit("WARNING", tag, message);
}

void logInfo(const string& tag, const string& message) {
  if (verbosity.load() >= 1) emit("INFO", tag, message);
}

void logDebug(const string& tag, const string& message) {
  if (verbosity.load() >= 2) emit("DEBUG", tag, message);
}

} // namespace semchunk
