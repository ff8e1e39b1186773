#include "server/AlertMonitorService.h"

#include <iostream>
#include <string>

namespace dg::server {

grpc::Status AlertMonitorService::StreamDetections(
    grpc::ServerContext* context,
    grpc::ServerReaderWriter<driverguard::MonitorSignal,
                             driverguard::DetectionUpdate>* stream) {
  std::cout << "[AlertMonitor] Client connected from " << context->peer() << std::endl;

  std::string client_id;
  std::string stream_key;
  driverguard::DetectionUpdate update;
  while (stream->Read(&update)) {
    if (stream_key.empty()) {
      client_id = update.client_id();
      stream_key = tracker_.OpenStream(client_id);
    }
    const auto reply = tracker_.OnUpdate(stream_key, update.alert_active());
    if (reply == AlertTracker::Reply::kNone) {
      continue;
    }

    const auto stats = tracker_.GetStats(stream_key);
    driverguard::MonitorSignal signal;
    signal.set_client_id(client_id);
    signal.set_frame_index(update.frame_index());
    signal.set_alerts_total(stats.alerts_total);
    if (reply == AlertTracker::Reply::kAlertAck) {
      signal.set_type(driverguard::MonitorSignal::ALERT_ACK);
      signal.set_message("drowsiness alert #" + std::to_string(stats.alerts_total));
      std::cout << "[AlertMonitor] '" << stream_key << "' drowsy at frame "
                << update.frame_index() << " (" << update.consecutive_low_frames()
                << " low frames)" << std::endl;
    } else {
      signal.set_type(driverguard::MonitorSignal::CLEARED);
      signal.set_message("alert cleared");
      std::cout << "[AlertMonitor] '" << stream_key << "' cleared at frame "
                << update.frame_index() << std::endl;
    }
    if (!stream->Write(signal)) {
      break;
    }
  }

  if (!stream_key.empty()) {
    const auto stats = tracker_.GetStats(stream_key);
    std::cout << "[AlertMonitor] '" << stream_key << "' disconnected after "
              << stats.frames << " frames, " << stats.alerts_total << " alerts"
              << std::endl;
    tracker_.Forget(stream_key);
  }
  return grpc::Status::OK;
}

}  // namespace dg::server
