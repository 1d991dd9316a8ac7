#include "input.hpp"

static constexpr int kMaxCount = 99999;

bool Input::consumeGg(int ch) {
  if (ch != 'g') { pending_g_ = false; return false; }
  if (pending_g_) { pending_g_ = false; return true; }
  pending_g_ = true;
  return false;
}

bool Input::consumeDigit(int ch) {
  if (ch == '0' && pending_count_ == 0) return false;
  if (ch < '0' || ch > '9') return false;
  pending_count_ = pending_count_ * 10 + (ch - '0');
  if (pending_count_ > kMaxCount) pending_count_ = kMaxCount;
  return true;
}

bool Input::hasCount() const {
  return pending_count_ > 0;
}

int Input::takeCount() {
  int c = pending_count_;
  pending_count_ = 0;
  return c > 0 ? c : 1;
}

void Input::reset() {
  pending_g_ = false;
  pending_count_ = 0;
}
