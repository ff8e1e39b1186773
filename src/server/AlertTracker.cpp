#include "server/AlertTracker.h"

namespace dg::server {

std::string AlertTracker::OpenStream(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(lock_);
  std::string key = client_id + "#" + std::to_string(next_stream_++);
  streams_.emplace(key, ClientStats{});
  return key;
}

AlertTracker::Reply AlertTracker::OnUpdate(const std::string& stream_key,
                                           bool alert_active) {
  std::lock_guard<std::mutex> lock(lock_);
  ClientStats& stats = streams_[stream_key];
  stats.frames++;

  // Edges are derived from the tracked state, so a dropped update still
  // yields one ack per episode.
  Reply reply = Reply::kNone;
  if (alert_active && !stats.alert_active) {
    stats.alerts_total++;
    reply = Reply::kAlertAck;
  } else if (!alert_active && stats.alert_active) {
    reply = Reply::kCleared;
  }
  stats.alert_active = alert_active;
  return reply;
}

AlertTracker::ClientStats AlertTracker::GetStats(const std::string& stream_key) const {
  std::lock_guard<std::mutex> lock(lock_);
  auto it = streams_.find(stream_key);
  if (it == streams_.end()) {
    return ClientStats{};
  }
  return it->second;
}

void AlertTracker::Forget(const std::string& stream_key) {
  std::lock_guard<std::mutex> lock(lock_);
  streams_.erase(stream_key);
}

std::size_t AlertTracker::StreamCount() const {
  std::lock_guard<std::mutex> lock(lock_);
  return streams_.size();
}

}  // namespace dg::server
