#ifndef LOG_HPP
#define LOG_HPP

#include <string>

using namespace std;

namespace semchunk {

// 0 = warnings only, 1 = -v, 2 = -vv
void setLogVerbosity(int verbose);
int logVerbosity();

void logWarning(const string& tag, const string& message);
void logInfo(const string& tag, const string& message);
void logDebug(const string& tag, const string& message);

} // namespace semchunk

#endif // LOG_HPP
