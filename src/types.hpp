#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight enums (Mode/SessionState).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class Mode { Normal, Insert };

enum class SessionState { Disconnected, Connecting, Authenticating, Joining, Joined, AuthFailed };

inline const char* to_string(Mode m) {
  switch (m) {
    case Mode::Normal: return "NORMAL";
    case Mode::Insert: return "INSERT";
  }
  return "?";
}

inline const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::Disconnected: return "disconnected";
    case SessionState::Connecting: return "connecting";
    case SessionState::Authenticating: return "authenticating";
    case SessionState::Joining: return "joining";
    case SessionState::Joined: return "joined";
    case SessionState::AuthFailed: return "auth failed";
  }
  return "?";
}
