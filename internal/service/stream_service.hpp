#pragma once

#include <functional>

#include "internal/streaming/stream_session.hpp"
#include "macrelay/v1/stream_service.pb.h"
#include "service_context.hpp"

namespace macrelay::service {

// Returns false when the client is gone.
using PlayWriter = std::function<bool(const macrelay::v1::PlayChunk&)>;

class StreamService {
 public:
  explicit StreamService(ServiceContext ctx);

  // Throws before the first write when no stream can be acquired.
  streaming::StreamOutcome Play(const macrelay::v1::PlayRequest& req, const PlayWriter& write);

  macrelay::v1::GetHlsFileResponse GetHlsFile(const macrelay::v1::GetHlsFileRequest& req);

 private:
  std::string ResolveHlsSource(const std::string& portal_id, const std::string& channel_id, std::string* proxy);

  ServiceContext ctx_;
};

} // namespace macrelay::service
