#pragma once

#include <cstdint>
#include <string_view>

namespace macrelay::model {

/*
  Direct-delivery session lifecycle:

    Requested -> CredentialsScored -> Probing -> Found -> Occupied -> Streaming -> Unoccupied -> Closed
                                              \-> Exhausted -> Closed
*/
enum class SessionState : std::uint8_t {
  kRequested         = 0,
  kCredentialsScored = 1,
  kProbing           = 2,
  kFound             = 3,
  kOccupied          = 4,
  kStreaming         = 5,
  kUnoccupied        = 6,
  kExhausted         = 7,
  kClosed            = 8,
};

constexpr bool IsTerminal(SessionState state) {
  return state == SessionState::kClosed;
}

constexpr bool CanTransition(SessionState from, SessionState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case SessionState::kRequested:
      return to == SessionState::kCredentialsScored || to == SessionState::kClosed;
    case SessionState::kCredentialsScored:
      return to == SessionState::kProbing || to == SessionState::kExhausted;
    case SessionState::kProbing:
      return to == SessionState::kFound || to == SessionState::kExhausted;
    case SessionState::kFound:
      // a lost capacity race after the probe ends the session as exhausted
      return to == SessionState::kOccupied || to == SessionState::kExhausted || to == SessionState::kClosed;
    case SessionState::kOccupied:
      return to == SessionState::kStreaming || to == SessionState::kUnoccupied;
    case SessionState::kStreaming:
      return to == SessionState::kUnoccupied;
    case SessionState::kUnoccupied:
    case SessionState::kExhausted:
      return to == SessionState::kClosed;
    case SessionState::kClosed:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kRequested:
      return "requested";
    case SessionState::kCredentialsScored:
      return "credentials_scored";
    case SessionState::kProbing:
      return "probing";
    case SessionState::kFound:
      return "found";
    case SessionState::kOccupied:
      return "occupied";
    case SessionState::kStreaming:
      return "streaming";
    case SessionState::kUnoccupied:
      return "unoccupied";
    case SessionState::kExhausted:
      return "exhausted";
    case SessionState::kClosed:
      return "closed";
  }
  return "unknown";
}

} // namespace macrelay::model
