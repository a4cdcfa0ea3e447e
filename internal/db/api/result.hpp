#pragma once

#include <string>
#include <utility>

namespace macrelay::db {

// Why a channel cache write did not apply.
enum class StoreError {
  kNone = 0,
  kNotFound,   // no such (portal_id, channel_id)
  kBusy,       // another writer holds the cache
  kConstraint,
  kStorage,    // disk or file damage
  kInternal,
};

constexpr const char* ToString(StoreError error) {
  switch (error) {
    case StoreError::kNone: return "ok";
    case StoreError::kNotFound: return "not_found";
    case StoreError::kBusy: return "busy";
    case StoreError::kConstraint: return "constraint";
    case StoreError::kStorage: return "storage";
    case StoreError::kInternal: return "internal";
  }
  return "internal";
}

/*
  Outcome of a ChannelStore mutation. Converts to true on success, so
  call sites read `if (auto r = store.X(...); !r)`.
*/
struct Result {
  StoreError  error = StoreError::kNone;
  std::string detail;

  static Result Ok() {
    return {};
  }

  static Result Fail(StoreError error, std::string detail) {
    return {error, std::move(detail)};
  }

  explicit operator bool() const {
    return error == StoreError::kNone;
  }

  // "busy: database is locked"
  std::string Describe() const {
    return detail.empty() ? ToString(error) : std::string(ToString(error)) + ": " + detail;
  }
};

} // namespace macrelay::db
