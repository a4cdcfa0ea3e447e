#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "macrelay/v1/admin_service.grpc.pb.h"

namespace macrelay::grpc {

class AdminServer final : public macrelay::v1::GatewayAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<macrelay::service::AdminService> svc);

  ::grpc::Status EnqueueRefreshPortal(::grpc::ServerContext*, const macrelay::v1::EnqueueRefreshPortalRequest*,
                                      macrelay::v1::EnqueueResponse*) override;

  ::grpc::Status EnqueueRefreshAll(::grpc::ServerContext*, const macrelay::v1::EnqueueRefreshAllRequest*,
                                   macrelay::v1::EnqueueRefreshAllResponse*) override;

  ::grpc::Status EnqueueEpgRefresh(::grpc::ServerContext*, const macrelay::v1::EnqueueEpgRefreshRequest*,
                                   macrelay::v1::EnqueueResponse*) override;

  ::grpc::Status GetPortalStatus(::grpc::ServerContext*, const macrelay::v1::GetPortalStatusRequest*,
                                 macrelay::v1::PortalStatus*) override;

  ::grpc::Status GetRefreshStatus(::grpc::ServerContext*, const macrelay::v1::GetRefreshStatusRequest*,
                                  macrelay::v1::GetRefreshStatusResponse*) override;

  ::grpc::Status ListOccupancy(::grpc::ServerContext*, const macrelay::v1::ListOccupancyRequest*,
                               macrelay::v1::ListOccupancyResponse*) override;

  ::grpc::Status ListHlsSessions(::grpc::ServerContext*, const macrelay::v1::ListHlsSessionsRequest*,
                                 macrelay::v1::ListHlsSessionsResponse*) override;

 private:
  std::shared_ptr<macrelay::service::AdminService> service_;
};

} // namespace macrelay::grpc
