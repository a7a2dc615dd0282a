#ifndef ACPBRIDGE_TIMER_HPP
#define ACPBRIDGE_TIMER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace acpbridge
{

/**
 * Re-armable one-shot timer.
 *
 * arm() replaces any pending callback and restarts the countdown, which makes
 * repeated arm() calls a trailing-edge debounce. Callbacks run on the timer's
 * own thread, outside its lock, so they may call arm() or cancel(). A timer
 * must not be destroyed from inside its own callback.
 */
class Timer
{
  public:
    using Callback = std::function<void()>;

    Timer();
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void arm(std::chrono::milliseconds delay, Callback callback);

    // Drop the pending callback. Returns true if one was pending.
    // A callback that already started keeps running.
    bool cancel();

    bool pending() const;

  private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    Callback callback_;
    uint64_t generation_ = 0;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace acpbridge

#endif // ACPBRIDGE_TIMER_HPP
