#ifndef ACPBRIDGE_INTERNAL_SUPERVISOR_HPP
#define ACPBRIDGE_INTERNAL_SUPERVISOR_HPP

#include "subprocess/process.hpp"

#include <acpbridge/types.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace acpbridge
{
namespace internal
{

/**
 * Owns one agent subprocess: its pipes, a stderr pump and an exit watcher.
 *
 * on_stderr receives raw stderr text as it arrives. on_exit fires once when
 * the process exits without terminate_gracefully() having been requested.
 * Both run on supervisor threads and must not destroy the supervisor.
 */
class ProcessSupervisor
{
  public:
    using StderrCallback = std::function<void(const std::string&)>;
    using ExitCallback = std::function<void(int exit_code)>;

    explicit ProcessSupervisor(std::string label);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Spawn and start the watcher threads. Throws ProcessSpawnError.
    void start(const std::string& executable, const std::vector<std::string>& args,
               const subprocess::ProcessOptions& options, StderrCallback on_stderr,
               ExitCallback on_exit);

    // Serialized write to stdin
    void write(const std::string& data);

    subprocess::ReadPipe& stdout_pipe();

    // False once the exit has been observed
    bool is_running() const;
    long pid() const;
    const std::string& label() const
    {
        return label_;
    }

    // SIGTERM, then SIGKILL after grace. Joins the supervisor threads.
    // Safe to call more than once; later calls report AlreadyExited.
    TerminationOutcome terminate_gracefully(std::chrono::milliseconds grace);

  private:
    void stderr_loop();
    void watch_loop();
    std::optional<int> poll_exit();
    void join_threads();

    std::string label_;
    std::unique_ptr<subprocess::Process> process_;
    long pid_ = 0;
    bool has_stdin_ = false;

    mutable std::mutex process_mutex_; // waitpid / kill
    std::mutex write_mutex_;

    StderrCallback on_stderr_;
    ExitCallback on_exit_;

    std::thread stderr_thread_;
    std::thread watcher_thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> exited_{false};
    std::atomic<bool> termination_requested_{false};

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace internal
} // namespace acpbridge

#endif // ACPBRIDGE_INTERNAL_SUPERVISOR_HPP
