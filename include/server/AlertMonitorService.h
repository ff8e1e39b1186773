#pragma once

#include <grpcpp/grpcpp.h>

#include "driverguard.grpc.pb.h"
#include "server/AlertTracker.h"

namespace dg::server {

// Answers each detection stream with ALERT_ACK when an alert starts and
// CLEARED when it ends.
class AlertMonitorService final : public driverguard::AlertMonitor::Service {
 public:
  grpc::Status StreamDetections(
      grpc::ServerContext* context,
      grpc::ServerReaderWriter<driverguard::MonitorSignal,
                               driverguard::DetectionUpdate>* stream) override;

  const AlertTracker& Tracker() const { return tracker_; }

 private:
  AlertTracker tracker_;
};

}  // namespace dg::server
