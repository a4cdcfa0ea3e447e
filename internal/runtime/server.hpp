#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace macrelay::runtime {

/*
  Owns the gRPC listener for the admin and stream services.

  Play responses are open-ended streams, so Stop() gives in-flight
  calls a bounded drain window and then cancels them.
*/
class Server {
 public:
  static constexpr std::chrono::seconds kDrainTimeout{5};

  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  // Port actually bound; differs from bind_address when it asks for port 0.
  int Port() const {
    return port_;
  }

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               server_;
  int                                           port_ = 0;
};

} // namespace macrelay::runtime
