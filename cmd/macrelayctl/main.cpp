#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "macrelay/v1.hpp"

using namespace macrelay::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  macrelayctl <addr> refresh <portal_id> [reason]\n"
            << "  macrelayctl <addr> refresh-all [reason]\n"
            << "  macrelayctl <addr> refresh-epg [reason]\n"
            << "  macrelayctl <addr> status <portal_id>\n"
            << "  macrelayctl <addr> refresh-status\n"
            << "  macrelayctl <addr> occupancy [portal_id]\n"
            << "  macrelayctl <addr> hls-sessions\n"
            << "  macrelayctl <addr> play <portal_id> <channel_id> <out_file>\n"
            << "  macrelayctl <addr> hls <portal_id> <channel_id> <filename>\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << " (code " << status.error_code() << ")\n";
  return 2;
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(message, &json, options).ok()) {
    std::cout << message.DebugString();
    return;
  }
  std::cout << json;
}

static const char* EnqueueName(EnqueueState state) {
  return state == ENQUEUE_STATE_RUNNING ? "running" : "queued";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto admin_stub  = GatewayAdminService::NewStub(channel);
  auto stream_stub = GatewayStreamService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "refresh") {
    if (argc < 4) return 1;

    EnqueueRefreshPortalRequest req;
    req.set_portal_id(argv[3]);
    if (argc >= 5) req.set_reason(argv[4]);

    EnqueueResponse resp;
    auto            status = admin_stub->EnqueueRefreshPortal(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << EnqueueName(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "refresh-all") {
    EnqueueRefreshAllRequest req;
    if (argc >= 4) req.set_reason(argv[3]);

    EnqueueRefreshAllResponse resp;
    auto                      status = admin_stub->EnqueueRefreshAll(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "enqueued=" << resp.enqueued() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "refresh-epg") {
    EnqueueEpgRefreshRequest req;
    if (argc >= 4) req.set_reason(argv[3]);

    EnqueueResponse resp;
    auto            status = admin_stub->EnqueueEpgRefresh(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << EnqueueName(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetPortalStatusRequest req;
    req.set_portal_id(argv[3]);

    PortalStatus resp;
    auto         status = admin_stub->GetPortalStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  if (cmd == "refresh-status") {
    GetRefreshStatusRequest  req;
    GetRefreshStatusResponse resp;

    auto status = admin_stub->GetRefreshStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "occupancy") {
    ListOccupancyRequest req;
    if (argc >= 4) req.set_portal_id(argv[3]);

    ListOccupancyResponse resp;
    auto                  status = admin_stub->ListOccupancy(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& s : resp.sessions()) {
      std::cout << s.portal_id() << " " << s.mac() << " " << s.channel_id() << " " << s.client_addr() << "\n";
    }
    return 0;
  }

  if (cmd == "hls-sessions") {
    ListHlsSessionsRequest  req;
    ListHlsSessionsResponse resp;

    auto status = admin_stub->ListHlsSessions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& s : resp.sessions()) {
      std::cout << s.key() << " passthrough=" << s.passthrough() << " running=" << s.running() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "play") {
    if (argc < 6) return 1;

    PlayRequest req;
    req.set_portal_id(argv[3]);
    req.set_channel_id(argv[4]);
    req.set_client_addr("macrelayctl");

    std::ofstream out(argv[5], std::ios::binary);
    if (!out) {
      std::cerr << "cannot open " << argv[5] << "\n";
      return 1;
    }

    auto      reader = stream_stub->Play(&ctx, req);
    PlayChunk chunk;
    uint64_t  bytes = 0;
    while (reader->Read(&chunk)) {
      if (!chunk.redirect_url().empty()) {
        std::cout << "redirect=" << chunk.redirect_url() << "\n";
      }
      out.write(chunk.data().data(), static_cast<std::streamsize>(chunk.data().size()));
      bytes += chunk.data().size();
    }

    auto status = reader->Finish();
    std::cout << "bytes=" << bytes << "\n";
    if (!status.ok()) return Fail(status);
    return 0;
  }

  if (cmd == "hls") {
    if (argc < 6) return 1;

    GetHlsFileRequest req;
    req.set_portal_id(argv[3]);
    req.set_channel_id(argv[4]);
    req.set_filename(argv[5]);

    GetHlsFileResponse resp;
    auto               status = stream_stub->GetHlsFile(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cerr << "mime=" << resp.mime_type() << " passthrough=" << resp.passthrough() << "\n";
    std::cout << resp.content();
    return 0;
  }

  Usage();
  return 1;
}
