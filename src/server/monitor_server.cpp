#include "server/AlertMonitorService.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

int main() {
  std::string server_address("0.0.0.0:50051");
  if (const char* v = std::getenv("DG_MONITOR_LISTEN")) server_address = v;

  dg::server::AlertMonitorService service;
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "[AlertMonitor] Failed to listen on " << server_address << std::endl;
    return 1;
  }
  std::cout << "[AlertMonitor] gRPC server listening on " << server_address << std::endl;
  server->Wait();
  return 0;
}
