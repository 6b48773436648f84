#pragma once
/*
 * ChatError
 *
 * Purpose: status codes returned by editor and session operations.
 * None means success; RateLimited means accepted but delayed.
 */

enum class ChatError {
  None,
  InputRejected,
  NotJoined,
  AlreadyConnected,
  TransportFailure,
  RateLimited,
  AuthRejected,
  InvalidMessage
};

inline const char* to_string(ChatError e) {
  switch (e) {
    case ChatError::None: return "ok";
    case ChatError::InputRejected: return "input rejected";
    case ChatError::NotJoined: return "not joined";
    case ChatError::AlreadyConnected: return "already connected";
    case ChatError::TransportFailure: return "transport failure";
    case ChatError::RateLimited: return "rate limited";
    case ChatError::AuthRejected: return "authentication rejected";
    case ChatError::InvalidMessage: return "invalid message";
  }
  return "?";
}
