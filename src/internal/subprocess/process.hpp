#ifndef ACPBRIDGE_SUBPROCESS_PROCESS_HPP
#define ACPBRIDGE_SUBPROCESS_PROCESS_HPP

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace acpbridge
{
namespace subprocess
{

struct ProcessHandle;
struct PipeHandle;

// Read end of a child's stdout/stderr
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Read up to size bytes. Returns 0 on EOF, throws on error.
    size_t read(char* buffer, size_t size);

    // Read a line (up to newline, EOF or max_size)
    std::string read_line(size_t max_size = 4096);

    // Wait up to timeout_ms for the pipe to become readable (data or EOF)
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Write end of a child's stdin
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Writes the whole buffer, retrying on short writes
    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment; // Applied on top of the inherited env
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = true;
};

class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. Throws ProcessSpawnError when the executable cannot be
    // started (the exec failure is reported back through a close-on-exec pipe).
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    bool is_running() const;
    std::optional<int> try_wait();                             // Non-blocking
    std::optional<int> wait_for(std::chrono::milliseconds timeout); // Polls try_wait
    int wait();                                                // Blocking
    void terminate();                                          // SIGTERM
    void kill();                                               // SIGKILL

    // 128 + signal for signalled children, -1 if unknown
    std::optional<int> exit_code() const;
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Search PATH for an executable; absolute and relative paths are checked directly
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace acpbridge

#endif // ACPBRIDGE_SUBPROCESS_PROCESS_HPP
