#ifndef ACPBRIDGE_INTERNAL_EXECUTOR_HPP
#define ACPBRIDGE_INTERNAL_EXECUTOR_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace acpbridge
{
namespace internal
{

// Runs posted tasks one at a time, in order, on a single background thread.
// Used for work that must not run on the thread that triggered it
// (teardown requested from a connection's own reader or watcher thread).
class SerialExecutor
{
  public:
    using Task = std::function<void()>;

    SerialExecutor();
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    // Returns false once shutdown() has started
    bool post(Task task);

    // Run the remaining tasks, then stop the worker
    void shutdown();

    bool on_worker_thread() const;

  private:
    void run();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace internal
} // namespace acpbridge

#endif // ACPBRIDGE_INTERNAL_EXECUTOR_HPP
