/**
 * @file execution_limiter.cpp
 * @brief Execution limiter implementation
 */

#include "ffmpeg_mcp/execution_limiter.hpp"

#include <algorithm>

namespace ffmpeg_mcp {

// **----- Permit -----**

ExecutionLimiter::Permit &
ExecutionLimiter::Permit::operator=(Permit &&other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    other.owner_ = nullptr;
  }
  return *this;
}

void ExecutionLimiter::Permit::release() {
  if (owner_) {
    owner_->release_slot();
    owner_ = nullptr;
  }
}

// **----- ExecutionLimiter -----**

ExecutionLimiter::ExecutionLimiter(int capacity)
    : capacity_(std::max(0, capacity)) {}

ExecutionLimiter::Permit ExecutionLimiter::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return unlimited() || in_flight_ < capacity_; });
  ++in_flight_;
  return Permit(this);
}

ExecutionLimiter::Permit ExecutionLimiter::try_acquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!unlimited() && in_flight_ >= capacity_)
    return Permit();
  ++in_flight_;
  return Permit(this);
}

int ExecutionLimiter::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}

void ExecutionLimiter::release_slot() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
  }
  cv_.notify_one();
}

} // namespace ffmpeg_mcp
