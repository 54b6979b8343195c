/**
 * @file execution_limiter.hpp
 * @brief Bounds how many FFmpeg processes run at the same time
 *
 * @details Every HTTP worker thread that is about to spawn a child takes a
 *          slot first and returns it when the child is gone:
 *
 *          - Requests beyond the limit block until a slot frees up
 *
 *          - Slots are returned by the Permit destructor, also on
 *            exceptions
 *
 *          - Capacity 0 disables the limit
 */

#ifndef FFMPEG_MCP_EXECUTION_LIMITER_HPP
#define FFMPEG_MCP_EXECUTION_LIMITER_HPP

#include <condition_variable>
#include <mutex>

namespace ffmpeg_mcp {

/**
 * @class ExecutionLimiter
 * @brief Counting semaphore with RAII permits.
 *
 * @attention USAGE:
 *
 *   - auto permit = limiter.acquire();
 *
 *   - run the process
 *
 *   - permit goes out of scope and the slot is released
 */
class ExecutionLimiter {
public:
  /**
   * @class Permit
   * @brief One held slot; move-only.
   */
  class Permit {
  public:
    Permit() = default;
    ~Permit() { release(); }

    Permit(const Permit &) = delete;
    Permit &operator=(const Permit &) = delete;

    Permit(Permit &&other) noexcept : owner_(other.owner_) {
      other.owner_ = nullptr;
    }
    Permit &operator=(Permit &&other) noexcept;

    /// Give the slot back early; safe to call twice
    void release();

    bool held() const { return owner_ != nullptr; }

  private:
    friend class ExecutionLimiter;
    explicit Permit(ExecutionLimiter *owner) : owner_(owner) {}
    ExecutionLimiter *owner_ = nullptr;
  };

  /**
   * @brief Construct a limiter.
   * @param capacity Maximum concurrent permits (0 = unlimited)
   */
  explicit ExecutionLimiter(int capacity);

  ExecutionLimiter(const ExecutionLimiter &) = delete;
  ExecutionLimiter &operator=(const ExecutionLimiter &) = delete;

  /**
   * @brief Take a slot, blocking while all slots are in use.
   */
  Permit acquire();

  /**
   * @brief Take a slot only if one is free right now.
   * @return A held permit, or an empty one if the limiter is full
   */
  Permit try_acquire();

  int capacity() const { return capacity_; }
  bool unlimited() const { return capacity_ == 0; }

  /// Number of permits currently held
  int in_flight() const;

private:
  void release_slot();

  const int capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int in_flight_ = 0;
};

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_EXECUTION_LIMITER_HPP
