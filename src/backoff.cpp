#include "backoff.hpp"
#include <algorithm>

Backoff::Backoff(ms min_delay, ms max_delay)
  : min_(std::max(ms(1), min_delay)), max_(std::max(min_, max_delay)), current_(min_) {}

Backoff::ms Backoff::next() {
  ms d = current_;
  attempts_++;
  current_ = std::min(max_, current_ * 2);
  return d;
}

void Backoff::reset() {
  current_ = min_;
  attempts_ = 0;
}
