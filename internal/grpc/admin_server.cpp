#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "macrelay/v1.hpp"

namespace macrelay::grpc {

namespace {

// Runs one admin call and folds any exception into the reply status.
template <typename Response, typename Call>
::grpc::Status Unary(Response* resp, Call&& call) {
  try {
    *resp = call();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<macrelay::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::EnqueueRefreshPortal(::grpc::ServerContext*, const macrelay::v1::EnqueueRefreshPortalRequest* req,
                                                 macrelay::v1::EnqueueResponse* resp) {
  return Unary(resp, [&] { return service_->EnqueueRefreshPortal(*req); });
}

::grpc::Status AdminServer::EnqueueRefreshAll(::grpc::ServerContext*, const macrelay::v1::EnqueueRefreshAllRequest* req,
                                              macrelay::v1::EnqueueRefreshAllResponse* resp) {
  return Unary(resp, [&] { return service_->EnqueueRefreshAll(*req); });
}

::grpc::Status AdminServer::EnqueueEpgRefresh(::grpc::ServerContext*, const macrelay::v1::EnqueueEpgRefreshRequest* req,
                                              macrelay::v1::EnqueueResponse* resp) {
  return Unary(resp, [&] { return service_->EnqueueEpgRefresh(*req); });
}

::grpc::Status AdminServer::GetPortalStatus(::grpc::ServerContext*, const macrelay::v1::GetPortalStatusRequest* req,
                                            macrelay::v1::PortalStatus* resp) {
  return Unary(resp, [&] { return service_->GetPortalStatus(*req); });
}

::grpc::Status AdminServer::GetRefreshStatus(::grpc::ServerContext*, const macrelay::v1::GetRefreshStatusRequest* req,
                                             macrelay::v1::GetRefreshStatusResponse* resp) {
  return Unary(resp, [&] { return service_->GetRefreshStatus(*req); });
}

::grpc::Status AdminServer::ListOccupancy(::grpc::ServerContext*, const macrelay::v1::ListOccupancyRequest* req,
                                          macrelay::v1::ListOccupancyResponse* resp) {
  return Unary(resp, [&] { return service_->ListOccupancy(*req); });
}

::grpc::Status AdminServer::ListHlsSessions(::grpc::ServerContext*, const macrelay::v1::ListHlsSessionsRequest* req,
                                            macrelay::v1::ListHlsSessionsResponse* resp) {
  return Unary(resp, [&] { return service_->ListHlsSessions(*req); });
}

} // namespace macrelay::grpc
