#pragma once
/*
 * Backoff
 *
 * Purpose: exponential reconnect delay, doubled per failure and capped.
 * reset() after a successful join starts again from the minimum.
 */
#include <chrono>

class Backoff {
public:
  using ms = std::chrono::milliseconds;
  Backoff(ms min_delay, ms max_delay);

  ms next();
  ms peek() const { return current_; }
  void reset();
  int attempts() const { return attempts_; }

private:
  ms min_;
  ms max_;
  ms current_;
  int attempts_ = 0;
};
