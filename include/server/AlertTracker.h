#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dg::server {

// Counts alert episodes per client stream and decides which updates the
// monitor answers. State is keyed by stream, so two connections reporting
// the same client id never share or erase each other's counters.
class AlertTracker {
 public:
  enum class Reply {
    kNone,
    kAlertAck,
    kCleared,
  };

  struct ClientStats {
    std::int64_t frames = 0;
    std::int64_t alerts_total = 0;
    bool alert_active = false;
  };

  // Returns a key unique to one stream, e.g. "cabin-3#7".
  std::string OpenStream(const std::string& client_id);

  Reply OnUpdate(const std::string& stream_key, bool alert_active);
  ClientStats GetStats(const std::string& stream_key) const;
  void Forget(const std::string& stream_key);

  std::size_t StreamCount() const;

 private:
  mutable std::mutex lock_;
  std::unordered_map<std::string, ClientStats> streams_;
  std::uint64_t next_stream_ = 1;
};

}  // namespace dg::server
