#ifndef ACPBRIDGE_RUNTIME_HPP
#define ACPBRIDGE_RUNTIME_HPP

#include <acpbridge/agent.hpp>
#include <acpbridge/connection.hpp>
#include <acpbridge/types.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace acpbridge
{

/// Collaborators supplied by the host application
struct RuntimeHooks
{
    // Decorate the user's text before it is sent (identity when unset).
    // fresh_session is true for the first prompt of each newly started session.
    std::function<std::string(const std::string& text, bool fresh_session)>
        build_prompt_with_memory;
    // Called at the start of every ensure_session()
    std::function<void()> ensure_memory_file;
};

/**
 * Owns one long-lived agent subprocess and its ACP session.
 *
 * Lazily spawns the agent and performs the initialize / session/new
 * handshake, serializes prompts (one in flight at a time), enforces the
 * overall and no-output timeouts, and tears the process down and prewarms a
 * fresh one after any unexpected exit.
 *
 * All methods are thread-safe. run_prompt() blocks until the prompt settles.
 *
 * Example:
 * @code
 * auto agent = create_cli_agent(AgentType::Gemini, {});
 * AcpRuntime runtime(std::move(agent), RuntimeOptions{});
 * runtime.schedule_prewarm("startup");
 * std::string reply = runtime.run_prompt("hello", [](const std::string& chunk) {
 *     std::cout << chunk << std::flush;
 * });
 * @endcode
 */
class AcpRuntime
{
  public:
    using ChunkCallback = std::function<void(const std::string&)>;

    /**
     * @param agent   Agent CLI to launch
     * @param options Timeouts, permission strategy, working directory, ...
     * @param hooks   Prompt decoration and memory-file hooks
     * @param factory Connection factory; defaults to create_stdio_connection
     */
    AcpRuntime(std::shared_ptr<CliAgent> agent, RuntimeOptions options, RuntimeHooks hooks = {},
               ConnectionFactory factory = nullptr);
    ~AcpRuntime();

    AcpRuntime(const AcpRuntime&) = delete;
    AcpRuntime& operator=(const AcpRuntime&) = delete;

    /**
     * Make sure a healthy session exists, starting the agent if needed.
     *
     * Concurrent callers during a handshake share its outcome.
     *
     * A failed handshake leaves the runtime in ERROR and schedules nothing:
     * the caller decides whether to retry. run_prompt() and the prewarm loop
     * reschedule a prewarm after their own failures, and the next
     * ensure_session() starts over from ERROR.
     * @throws ProcessSpawnError, HandshakeError, SessionStateError
     */
    void ensure_session();

    /**
     * Send one prompt and wait for it to settle.
     *
     * on_chunk receives each agent_message_chunk text as it arrives, on a
     * connection thread; exceptions it throws are logged and ignored.
     *
     * @return Accumulated response text, or "No response received."
     * @throws ConcurrentPromptError when a prompt is already in flight
     * @throws PromptError subclasses for timeouts, cancellation and failures
     */
    std::string run_prompt(const std::string& text, ChunkCallback on_chunk = nullptr);

    // Best-effort session/cancel for the current session
    void cancel_active_prompt();

    bool has_active_prompt() const;

    // Report the next cancellation as a user abort
    void request_manual_abort();

    RuntimeStateSnapshot runtime_state() const;

    /**
     * Inject background-task output into the idle session without waiting
     * for a reply.
     *
     * @return false when there is no healthy session or a prompt is running;
     *         the caller should keep the text for later (see ContextQueue)
     */
    bool append_context(const std::string& text);

    // Start a session in the background unless one exists or is starting
    void schedule_prewarm(const std::string& reason);

    // Terminate the agent and return to IDLE. A prompt in flight fails.
    void shutdown(const std::string& reason);

    std::vector<std::string> agent_args() const;
    const CliAgent& agent() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace acpbridge

#endif // ACPBRIDGE_RUNTIME_HPP
