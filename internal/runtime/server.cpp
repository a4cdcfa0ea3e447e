#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace macrelay::runtime {

using observability::IntField;
using observability::StringField;

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &port_);
  for (const auto& service : services_) builder.RegisterService(service.get());

  // idle Play streams still get noticed when a client vanishes
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, 30000);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

  server_ = builder.BuildAndStart();
  if (!server_ || port_ == 0) {
    server_.reset();
    throw std::runtime_error("cannot listen on " + bind_address_);
  }

  MACRELAY_LOG_INFO("gRPC server listening",
                    {StringField("bind_address", bind_address_), IntField("port", port_),
                     IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Stop() {
  if (!server_) return;

  server_->Shutdown(std::chrono::system_clock::now() + kDrainTimeout);
  server_.reset();
  MACRELAY_LOG_INFO("gRPC server stopped", {StringField("bind_address", bind_address_)});
}

} // namespace macrelay::runtime
