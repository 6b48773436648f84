#pragma once
#include <cstdint>
#include <string>

// Produced by IrcSession on receipt (or after our own message was written);
// never mutated afterwards.
struct ChatMessage {
  std::string sender;
  std::string body;
  uint64_t seq = 0;
  std::string color; // "#RRGGBB" from the color tag, may be empty
  bool self = false;
};
