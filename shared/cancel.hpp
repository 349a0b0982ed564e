#ifndef CANCEL_HPP
#define CANCEL_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include "errors.hpp"

using namespace std;

namespace semchunk {

enum class CancelState {
  Active,
  Cancelled,
  DeadlineExceeded
};

// Cooperative cancellation signal handed to every chunking call.
// Copies share the same flag, so cancelling one cancels all of them.
class CancelToken {
  private:
    shared_ptr<atomic<bool>> flag;
    optional<chrono::steady_clock::time_point> deadline;
  public:
    CancelToken();
    static CancelToken withTimeout(chrono::milliseconds timeout);
    static CancelToken withDeadline(chrono::steady_clock::time_point deadline);

    void cancel() const;
    CancelState state() const;
    bool done() const { return this->state() != CancelState::Active; }

    // Throws CancellationError when cancelled or past the deadline.
    void throwIfDone() const;
};

} // namespace semchunk

#endif // CANCEL_HPP
