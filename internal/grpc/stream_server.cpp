#include "stream_server.hpp"

#include "grpc_error.hpp"
#include "macrelay/v1.hpp"

namespace macrelay::grpc {

StreamServer::StreamServer(std::shared_ptr<macrelay::service::StreamService> svc) : service_(std::move(svc)) {
}

::grpc::Status StreamServer::Play(::grpc::ServerContext* context, const macrelay::v1::PlayRequest* req,
                                  ::grpc::ServerWriter<macrelay::v1::PlayChunk>* writer) {
  try {
    const auto outcome = service_->Play(*req, [&](const macrelay::v1::PlayChunk& chunk) {
      if (context->IsCancelled()) return false;
      return writer->Write(chunk);
    });

    // the client has to re-request; the failed MAC is already deprioritized
    if (outcome == macrelay::streaming::StreamOutcome::kProcessCrashed) {
      return {::grpc::StatusCode::UNAVAILABLE, "stream process exited"};
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamServer::GetHlsFile(::grpc::ServerContext*, const macrelay::v1::GetHlsFileRequest* req,
                                        macrelay::v1::GetHlsFileResponse* resp) {
  try {
    *resp = service_->GetHlsFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace macrelay::grpc
