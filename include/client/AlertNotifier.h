#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "client/DetectionSession.h"

namespace dg::client {

// Runs presentation work (overlay text, sound cue, monitor upload) on its own
// thread so the frame loop never waits on it.
class AlertNotifier {
 public:
  using ResultCallback = std::function<void(const FrameResult&)>;

  explicit AlertNotifier(std::size_t max_pending = 256);
  ~AlertNotifier();

  void Start();
  // Delivers everything already queued, then joins the worker.
  void Stop();
  bool IsRunning() const;
  void SetResultCallback(ResultCallback callback);

  // Returns false when the notifier is stopped. When the queue is full the
  // oldest non-edge result is dropped.
  bool Publish(const FrameResult& result);

  std::size_t DroppedCount() const;

 private:
  void DispatchLoop();

  const std::size_t max_pending_;
  std::atomic<bool> running_;
  std::thread worker_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<FrameResult> pending_;
  std::size_t dropped_ = 0;
  ResultCallback callback_;
};

}  // namespace dg::client
