#pragma once

#include "macrelay/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace macrelay::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  macrelay::v1::EnqueueResponse EnqueueRefreshPortal(const macrelay::v1::EnqueueRefreshPortalRequest& req);

  macrelay::v1::EnqueueRefreshAllResponse EnqueueRefreshAll(const macrelay::v1::EnqueueRefreshAllRequest& req);

  macrelay::v1::EnqueueResponse EnqueueEpgRefresh(const macrelay::v1::EnqueueEpgRefreshRequest& req);

  macrelay::v1::PortalStatus GetPortalStatus(const macrelay::v1::GetPortalStatusRequest& req);

  macrelay::v1::GetRefreshStatusResponse GetRefreshStatus(const macrelay::v1::GetRefreshStatusRequest& req);

  macrelay::v1::ListOccupancyResponse ListOccupancy(const macrelay::v1::ListOccupancyRequest& req);

  macrelay::v1::ListHlsSessionsResponse ListHlsSessions(const macrelay::v1::ListHlsSessionsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace macrelay::service
