#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

using namespace std;

namespace semchunk {

class ChunkerError : public runtime_error {
  public:
    explicit ChunkerError(const string& message) : runtime_error(message) {}
};

// Missing parse engine or classification table, bad config file.
class ConfigurationError : public ChunkerError {
  public:
    explicit ConfigurationError(const string& message) : ChunkerError("configuration error: " + message) {}
};

enum class CancelReason {
  Cancelled,
  DeadlineExceeded
};

class CancellationError : public ChunkerError {
  private:
    CancelReason cancel_reason;
  public:
    explicit CancellationError(CancelReason reason)
        : ChunkerError(reason == CancelReason::Cancelled ? "operation cancelled" : "deadline exceeded"),
          cancel_reason(reason) {}
    CancelReason reason() const { return this->cancel_reason; }
};

// The engine produced no tree at all.
class ParseFatalError : public ChunkerError {
  private:
    bool is_unsupported;
  public:
    ParseFatalError(const string& message, bool unsupported)
        : ChunkerError(message), is_unsupported(unsupported) {}
    bool unsupported() const { return this->is_unsupported; }
};

} // namespace semchunk

#endif // ERRORS_HPP
