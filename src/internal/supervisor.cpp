#include "supervisor.hpp"

#include <acpbridge/errors.hpp>
#include <acpbridge/logging.hpp>

namespace acpbridge
{
namespace internal
{

namespace
{
constexpr auto WATCH_INTERVAL = std::chrono::milliseconds(50);
constexpr int STDERR_POLL_MS = 100;
} // namespace

ProcessSupervisor::ProcessSupervisor(std::string label) : label_(std::move(label)) {}

ProcessSupervisor::~ProcessSupervisor()
{
    try
    {
        terminate_gracefully(std::chrono::milliseconds(0));
    }
    catch (const std::exception& e)
    {
        log::get()->warn("[{}] teardown failed: {}", label_, e.what());
    }
}

void ProcessSupervisor::start(const std::string& executable,
                              const std::vector<std::string>& args,
                              const subprocess::ProcessOptions& options, StderrCallback on_stderr,
                              ExitCallback on_exit)
{
    if (process_)
        throw BridgeError("Supervisor already started");

    on_stderr_ = std::move(on_stderr);
    on_exit_ = std::move(on_exit);

    auto process = std::make_unique<subprocess::Process>();
    process->spawn(executable, args, options);
    pid_ = process->pid();
    has_stdin_ = options.redirect_stdin;
    process_ = std::move(process);

    log::get()->debug("[{}] spawned pid={}", label_, pid_);

    if (options.redirect_stderr)
        stderr_thread_ = std::thread(&ProcessSupervisor::stderr_loop, this);
    watcher_thread_ = std::thread(&ProcessSupervisor::watch_loop, this);
}

void ProcessSupervisor::write(const std::string& data)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!process_ || exited_)
        throw ConnectionClosedError("Cannot write to terminated process");
    process_->stdin_pipe().write(data);
}

subprocess::ReadPipe& ProcessSupervisor::stdout_pipe()
{
    if (!process_)
        throw BridgeError("Supervisor not started");
    return process_->stdout_pipe();
}

bool ProcessSupervisor::is_running() const
{
    return process_ != nullptr && !exited_;
}

long ProcessSupervisor::pid() const
{
    return pid_;
}

std::optional<int> ProcessSupervisor::poll_exit()
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    auto code = process_->try_wait();
    if (code)
        exited_ = true;
    return code;
}

void ProcessSupervisor::stderr_loop()
{
    try
    {
        auto& pipe = process_->stderr_pipe();
        char buffer[4096];
        while (!stopping_)
        {
            if (!pipe.has_data(STDERR_POLL_MS))
                continue;

            size_t n = pipe.read(buffer, sizeof(buffer));
            if (n == 0)
                break; // EOF

            if (on_stderr_)
            {
                try
                {
                    on_stderr_(std::string(buffer, n));
                }
                catch (const std::exception& e)
                {
                    log::get()->warn("[{}] stderr callback threw: {}", label_, e.what());
                }
            }
        }
    }
    catch (const std::exception& e)
    {
        log::get()->debug("[{}] stderr reader stopped: {}", label_, e.what());
    }
}

void ProcessSupervisor::watch_loop()
{
    std::optional<int> code;
    try
    {
        while (!stopping_)
        {
            code = poll_exit();
            if (code)
                break;

            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, WATCH_INTERVAL, [this] { return stopping_.load(); });
        }
    }
    catch (const std::exception& e)
    {
        log::get()->error("[{}] exit watcher failed: {}", label_, e.what());
        code = -1;
        exited_ = true;
    }

    if (!code || termination_requested_)
        return;

    log::get()->debug("[{}] pid={} exited code={}", label_, pid_, *code);
    if (on_exit_)
    {
        try
        {
            on_exit_(*code);
        }
        catch (const std::exception& e)
        {
            log::get()->warn("[{}] exit callback threw: {}", label_, e.what());
        }
    }
}

TerminationOutcome ProcessSupervisor::terminate_gracefully(std::chrono::milliseconds grace)
{
    if (!process_)
        return TerminationOutcome::AlreadyExited;

    bool first_request = !termination_requested_.exchange(true);
    TerminationOutcome outcome = TerminationOutcome::AlreadyExited;

    if (first_request && !poll_exit())
    {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            process_->terminate();
        }

        auto deadline = std::chrono::steady_clock::now() + grace;
        while (!poll_exit() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));

        if (exited_)
        {
            outcome = TerminationOutcome::Exit;
        }
        else
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            process_->kill();
            process_->wait();
            exited_ = true;
            outcome = TerminationOutcome::SigKill;
        }
    }

    join_threads();

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (has_stdin_ && process_->stdin_pipe().is_open())
            process_->stdin_pipe().close();
    }
    return outcome;
}

void ProcessSupervisor::join_threads()
{
    stopping_ = true;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_cv_.notify_all();
    }

    for (auto* thread : {&stderr_thread_, &watcher_thread_})
    {
        if (!thread->joinable())
            continue;
        if (thread->get_id() == std::this_thread::get_id())
            thread->detach(); // Called from our own callback; the loop exits on stopping_
        else
            thread->join();
    }
}

} // namespace internal
} // namespace acpbridge
