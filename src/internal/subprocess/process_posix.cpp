// POSIX implementation of subprocess process management

#include "process.hpp"

#include <acpbridge/errors.hpp>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace acpbridge
{
namespace subprocess
{

// ============================================================================
// Handles
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    std::optional<int> exit_code;
};

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helpers
// ============================================================================

namespace
{

std::string errno_message(int err)
{
    return std::strerror(err);
}

// Both ends of a pipe, closed on scope exit unless released
struct FdPair
{
    int fds[2] = {-1, -1};

    ~FdPair()
    {
        for (int& fd : fds)
            if (fd >= 0)
                ::close(fd);
    }

    void open(const char* what)
    {
        if (::pipe2(fds, O_CLOEXEC) != 0)
            throw std::runtime_error(std::string("Failed to create ") + what +
                                     " pipe: " + errno_message(errno));
    }

    int release(int index)
    {
        int fd = fds[index];
        fds[index] = -1;
        return fd;
    }

    bool is_open() const
    {
        return fds[0] >= 0;
    }
};

// A child closing its stdin must surface as EPIPE, not kill the host
void ignore_sigpipe_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Environment block built in the parent so the child only calls exec
std::vector<std::string> build_environment(const ProcessOptions& options)
{
    std::map<std::string, std::string> merged;
    if (options.inherit_environment && environ != nullptr)
    {
        for (char** entry = environ; *entry != nullptr; ++entry)
        {
            std::string kv(*entry);
            auto eq = kv.find('=');
            if (eq != std::string::npos)
                merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        merged[key] = value;

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged)
        env.push_back(key + "=" + value);
    return env;
}

} // namespace

// ============================================================================
// ReadPipe
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    for (;;)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw std::runtime_error("Read failed: " + errno_message(errno));
    }
}

std::string ReadPipe::read_line(size_t max_size)
{
    std::string line;
    char ch;
    while (line.size() < max_size)
    {
        if (read(&ch, 1) == 0)
            break; // EOF

        line.push_back(ch);
        if (ch == '\n')
            break;
    }
    return line;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = ::select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("select failed: " + errno_message(errno));
    }
    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    size_t written = 0;
    while (written < size)
    {
        ssize_t n = ::write(handle_->fd, data + written, size - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw std::runtime_error("Broken pipe (process closed stdin)");
            throw std::runtime_error("Write failed: " + errno_message(errno));
        }
        written += static_cast<size_t>(n);
    }
    return written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->running)
        throw std::runtime_error("Process already spawned");

    ignore_sigpipe_once();

    FdPair stdin_fds, stdout_fds, stderr_fds, exec_status;
    if (options.redirect_stdin)
        stdin_fds.open("stdin");
    if (options.redirect_stdout)
        stdout_fds.open("stdout");
    if (options.redirect_stderr)
        stderr_fds.open("stderr");
    exec_status.open("exec status");

    // Everything the child needs is prepared before fork
    std::vector<std::string> env_strings = build_environment(options);
    std::vector<char*> envp;
    for (auto& entry : env_strings)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessSpawnError("Failed to fork process: " + errno_message(errno), executable);

    if (pid == 0)
    {
        // Child: dup2 clears O_CLOEXEC on the standard descriptors
        if (stdin_fds.is_open() && ::dup2(stdin_fds.fds[0], STDIN_FILENO) < 0)
            _exit(127);
        if (stdout_fds.is_open() && ::dup2(stdout_fds.fds[1], STDOUT_FILENO) < 0)
            _exit(127);
        if (stderr_fds.is_open() && ::dup2(stderr_fds.fds[1], STDERR_FILENO) < 0)
            _exit(127);

        int err = 0;
        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
        {
            err = errno;
        }
        else
        {
            ::execvpe(executable.c_str(), argv.data(), envp.data());
            err = errno;
        }

        ssize_t ignored = ::write(exec_status.fds[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent: the status pipe reads EOF once exec succeeded
    ::close(exec_status.release(1));
    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(exec_status.fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw ProcessSpawnError("Failed to start '" + executable + "': " +
                                    errno_message(child_errno),
                                executable);
    }

    if (options.redirect_stdin)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_fds.release(1);
    }
    if (options.redirect_stdout)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_fds.release(0);
    }
    if (options.redirect_stderr)
    {
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_fds.release(0);
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code.reset();
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // A zombie still answers kill(0); only try_wait() observes the exit
    if (::kill(handle_->pid, 0) == 0)
        return true;
    return errno != ESRCH;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return -1;
    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = ::waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    if (errno == ECHILD)
    {
        // Reaped elsewhere; nothing more to learn
        handle_->exit_code = -1;
        handle_->running = false;
        return handle_->exit_code;
    }
    throw std::runtime_error("waitpid failed: " + errno_message(errno));
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return -1;
    if (!handle_->running)
        return handle_->exit_code.value_or(-1);

    int status = 0;
    pid_t result;
    do
    {
        result = ::waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    handle_->running = false;
    handle_->exit_code = result == handle_->pid ? decode_status(status) : -1;
    return *handle_->exit_code;
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

std::optional<int> Process::exit_code() const
{
    if (!handle_)
        return std::nullopt;
    return handle_->exit_code;
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// find_executable
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable(candidate))
                return candidate.string();
        }
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace subprocess
} // namespace acpbridge
