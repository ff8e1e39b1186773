#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "client/DetectionSession.h"
#include "driverguard.grpc.pb.h"

namespace dg::client {

// Streams detection results to a remote alert monitor and logs its replies.
class MonitorClient {
 public:
  MonitorClient(std::string address, std::string client_id,
                std::chrono::milliseconds connect_timeout = std::chrono::seconds(2));
  ~MonitorClient();

  // Returns false when the monitor is not reachable within the connect
  // timeout or the stream could not be opened.
  bool Connect();
  bool Send(const FrameResult& result);
  void Close();

  bool IsConnected() const { return connected_.load(); }
  std::int64_t AcksReceived() const { return acks_received_.load(); }

 private:
  void ReadLoop();

  const std::string address_;
  const std::string client_id_;
  const std::chrono::milliseconds connect_timeout_;
  std::unique_ptr<driverguard::AlertMonitor::Stub> stub_;
  std::unique_ptr<grpc::ClientContext> context_;
  std::unique_ptr<grpc::ClientReaderWriter<driverguard::DetectionUpdate,
                                           driverguard::MonitorSignal>>
      stream_;
  std::mutex stream_mutex_;
  std::thread signal_thread_;
  std::atomic<bool> connected_{false};
  std::atomic<std::int64_t> acks_received_{0};
};

}  // namespace dg::client
