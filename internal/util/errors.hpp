#pragma once

#include <stdexcept>
#include <string>

namespace macrelay::util {

/*
  Exceptions thrown by the core and mapped onto gRPC codes in
  internal/grpc/grpc_error.cpp. Anything else becomes INTERNAL.
*/

// Unknown portal, channel, HLS stream or segment.       NOT_FOUND
struct NotFound : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed id, file name or request field.              INVALID_ARGUMENT
struct InvalidArgument : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// HLS registry already holds max_streams entries.        RESOURCE_EXHAUSTED
struct AdmissionRejected : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Playlist or segment not written within the poll window. NOT_FOUND
struct FileNotReady : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// fork/exec or pipe setup failed.                        INTERNAL
struct ProcessError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

enum class UnavailableReason {
  kNoFreeCredential,  // every MAC is at its streams_per_mac limit
  kNoWorkingStream,   // free MACs existed but none produced a playable link
};

/*
  No credential could serve the channel. Clients get one status for both
  reasons; the reason only reaches logs and metrics.
*/
class StreamUnavailable : public std::runtime_error {
 public:
  StreamUnavailable(UnavailableReason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  UnavailableReason Reason() const {
    return reason_;
  }

 private:
  UnavailableReason reason_;
};

} // namespace macrelay::util
