#include "client/AlertNotifier.h"

#include <algorithm>
#include <iostream>

namespace dg::client {

AlertNotifier::AlertNotifier(std::size_t max_pending)
    : max_pending_(std::max<std::size_t>(max_pending, 1)), running_(false) {}

AlertNotifier::~AlertNotifier() {
  Stop();
}

void AlertNotifier::Start() {
  if (running_.exchange(true)) {
    return;
  }
  worker_ = std::thread(&AlertNotifier::DispatchLoop, this);
}

void AlertNotifier::Stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  queue_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  const std::size_t dropped = DroppedCount();
  if (dropped > 0) {
    std::cout << "[AlertNotifier] Dropped " << dropped
              << " results while presentation was behind" << std::endl;
  }
}

bool AlertNotifier::IsRunning() const {
  return running_.load();
}

void AlertNotifier::SetResultCallback(ResultCallback callback) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  callback_ = std::move(callback);
}

bool AlertNotifier::Publish(const FrameResult& result) {
  {
    // Every result accepted here is delivered before Stop returns.
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_.load()) {
      return false;
    }
    if (pending_.size() >= max_pending_) {
      auto victim = std::find_if(pending_.begin(), pending_.end(), [](const FrameResult& r) {
        return !r.alert_raised && !r.alert_cleared;
      });
      if (victim == pending_.end()) {
        victim = pending_.begin();
      }
      pending_.erase(victim);
      dropped_++;
    }
    pending_.push_back(result);
  }
  queue_cv_.notify_one();
  return true;
}

std::size_t AlertNotifier::DroppedCount() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return dropped_;
}

void AlertNotifier::DispatchLoop() {
  while (true) {
    ResultCallback callback_copy;
    std::deque<FrameResult> batch;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !pending_.empty() || !running_.load(); });
      if (pending_.empty() && !running_.load()) {
        return;
      }
      batch.swap(pending_);
      callback_copy = callback_;
    }
    if (!callback_copy) {
      continue;
    }
    for (const auto& result : batch) {
      callback_copy(result);
    }
  }
}

}  // namespace dg::client
