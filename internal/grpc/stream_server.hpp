#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/stream_service.hpp"
#include "macrelay/v1/stream_service.grpc.pb.h"

namespace macrelay::grpc {

class StreamServer final : public macrelay::v1::GatewayStreamService::Service {
 public:
  explicit StreamServer(std::shared_ptr<macrelay::service::StreamService> svc);

  ::grpc::Status Play(::grpc::ServerContext* context, const macrelay::v1::PlayRequest* req,
                      ::grpc::ServerWriter<macrelay::v1::PlayChunk>* writer) override;

  ::grpc::Status GetHlsFile(::grpc::ServerContext*, const macrelay::v1::GetHlsFileRequest*,
                            macrelay::v1::GetHlsFileResponse*) override;

 private:
  std::shared_ptr<macrelay::service::StreamService> service_;
};

} // namespace macrelay::grpc
