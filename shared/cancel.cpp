#include "cancel.hpp"

namespace semchunk {

CancelToken::CancelToken() : flag(make_shared<atomic<bool>>(false)) {}

CancelToken CancelToken::withTimeout(chrono::milliseconds timeout) {
  return CancelToken::withDeadline(chrono::steady_clock::now() + timeout);
}

CancelToken CancelToken::withDeadline(chrono::steady_clock::time_point deadline) {
  CancelToken token;
  token.deadline = deadline;
  return token;
}

void CancelToken::cancel() const {
  this->flag->store(true);
}

CancelState CancelToken::state() const {
  if (this->flag->load()) {
    return CancelState::Cancelled;
  }
  if (this->deadline && chrono::steady_clock::now() >= *this->deadline) {
    return CancelState::DeadlineExceeded;
  }
  return CancelState::Active;
}

void CancelToken::throwIfDone() const {
  switch (this->state()) {
  case CancelState::Cancelled:
    throw CancellationError(CancelReason::Cancelled);
  case CancelState::DeadlineExceeded:
    throw CancellationError(CancelReason::DeadlineExceeded);
  case CancelState::Active:
    break;
  }
}

} // namespace semchunk
