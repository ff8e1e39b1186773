#include "client/MonitorClient.h"

#include <iostream>
#include <utility>

namespace dg::client {

MonitorClient::MonitorClient(std::string address, std::string client_id,
                             std::chrono::milliseconds connect_timeout)
    : address_(std::move(address)),
      client_id_(std::move(client_id)),
      connect_timeout_(connect_timeout) {}

MonitorClient::~MonitorClient() {
  Close();
}

bool MonitorClient::Connect() {
  if (connected_.load()) {
    return true;
  }
  auto channel = grpc::CreateChannel(address_, grpc::InsecureChannelCredentials());
  // Opening a stream never fails locally, so reachability is checked up front.
  if (!channel->WaitForConnected(std::chrono::system_clock::now() + connect_timeout_)) {
    std::cerr << "[MonitorClient] No monitor reachable at " << address_ << " within "
              << connect_timeout_.count() << " ms" << std::endl;
    return false;
  }
  stub_ = driverguard::AlertMonitor::NewStub(channel);
  context_ = std::make_unique<grpc::ClientContext>();
  stream_ = stub_->StreamDetections(context_.get());
  connected_.store(true);
  signal_thread_ = std::thread(&MonitorClient::ReadLoop, this);
  std::cout << "[MonitorClient] Streaming detections to " << address_
            << " as '" << client_id_ << "'" << std::endl;
  return true;
}

bool MonitorClient::Send(const FrameResult& result) {
  if (!connected_.load()) {
    return false;
  }
  driverguard::DetectionUpdate update;
  update.set_client_id(client_id_);
  update.set_frame_index(result.frame_index);
  update.set_face_found(result.face_found);
  update.set_ear_present(result.reading.sample.IsPresent());
  if (result.reading.sample.IsPresent()) {
    update.set_ear(result.reading.sample.Value());
  }
  update.set_alert_active(result.state.alert_active);
  update.set_consecutive_low_frames(result.state.consecutive_low_frames);
  update.set_alert_raised(result.alert_raised);
  update.set_alert_cleared(result.alert_cleared);

  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (!stream_->Write(update)) {
    std::cerr << "[MonitorClient] Stream closed by monitor" << std::endl;
    connected_.store(false);
    return false;
  }
  return true;
}

void MonitorClient::Close() {
  if (stream_) {
    {
      std::lock_guard<std::mutex> lock(stream_mutex_);
      stream_->WritesDone();
    }
    if (signal_thread_.joinable()) {
      signal_thread_.join();
    }
    const grpc::Status status = stream_->Finish();
    if (!status.ok()) {
      std::cerr << "[MonitorClient] Stream finished with error: "
                << status.error_message() << std::endl;
    }
    stream_.reset();
  }
  connected_.store(false);
}

void MonitorClient::ReadLoop() {
  driverguard::MonitorSignal signal;
  while (stream_->Read(&signal)) {
    if (signal.type() == driverguard::MonitorSignal::ALERT_ACK) {
      acks_received_.fetch_add(1);
    }
    std::cout << "[MonitorClient] Monitor signal: " << signal.message()
              << " (frame " << signal.frame_index() << ")" << std::endl;
  }
  connected_.store(false);
}

}  // namespace dg::client
