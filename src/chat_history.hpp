#pragma once
/*
 * ChatHistory
 *
 * Purpose: bounded, insertion-ordered log of received chat messages.
 * Threading: one writer (network thread), any number of readers (renderer).
 *            A single mutex guards append/snapshot; snapshot copies out.
 */
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>
#include "chat_message.hpp"

class ChatHistory {
public:
  explicit ChatHistory(size_t cap);

  void append(ChatMessage msg);
  std::vector<ChatMessage> snapshot() const;
  // copies into out only when appends happened since *seen; updates *seen
  bool snapshot_if_newer(uint64_t& seen, std::vector<ChatMessage>& out) const;

  size_t size() const;
  size_t capacity() const { return cap_; }
  // bumped on every append
  uint64_t version() const;

private:
  mutable std::mutex mu_;
  std::deque<ChatMessage> items_;
  size_t cap_;
  uint64_t version_ = 0;
};
