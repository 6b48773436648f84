#pragma once
/*
 * Input
 *
 * Purpose: parse Normal mode double key prefixes (yy/dd) with one key of lookback.
 * A non-matching key cancels the prefix; the caller then reprocesses that key
 * as a fresh Normal mode key.
 */

enum class PendingPrefix { None, Y, D };

class Input {
public:
  enum class Chord { None, Pending, Yy, Dd, Cancelled };
  // ch < 0 stands for a non-character key (Enter, ESC, arrows...).
  Chord consume(int ch);
  PendingPrefix pending() const { return pending_; }
  void reset() { pending_ = PendingPrefix::None; }
private:
  PendingPrefix pending_ = PendingPrefix::None;
};
