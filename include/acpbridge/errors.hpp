#ifndef ACPBRIDGE_ERRORS_HPP
#define ACPBRIDGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace acpbridge
{

// Base exception
class BridgeError : public std::runtime_error
{
  public:
    explicit BridgeError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid option value or unsupported agent type
class ConfigError : public BridgeError
{
  public:
    explicit ConfigError(const std::string& message) : BridgeError(message) {}
};

// The agent executable could not be started
class ProcessSpawnError : public BridgeError
{
  public:
    ProcessSpawnError(const std::string& message, std::string command)
        : BridgeError(message), command_(std::move(command))
    {
    }

    const std::string& command() const
    {
        return command_;
    }

  private:
    std::string command_;
};

// initialize / session/new failed.
// Carries the agent's recent stderr output and an optional diagnostic hint.
class HandshakeError : public BridgeError
{
  public:
    HandshakeError(const std::string& message, std::string stderr_tail, std::string hint = {})
        : BridgeError(message), stderr_tail_(std::move(stderr_tail)), hint_(std::move(hint))
    {
    }

    const std::string& stderr_tail() const
    {
        return stderr_tail_;
    }

    const std::string& hint() const
    {
        return hint_;
    }

  private:
    std::string stderr_tail_;
    std::string hint_;
};

// Malformed framing on the agent's stdout
class ProtocolError : public BridgeError
{
  public:
    explicit ProtocolError(const std::string& message) : BridgeError(message) {}
};

// The connection went away while requests were pending
class ConnectionClosedError : public BridgeError
{
  public:
    explicit ConnectionClosedError(const std::string& message) : BridgeError(message) {}
};

// JSON-RPC error response from the agent
class RpcError : public BridgeError
{
  public:
    RpcError(const std::string& message, int code) : BridgeError(message), code_(code) {}

    int code() const
    {
        return code_;
    }

  private:
    int code_;
};

// Base of all prompt invocation failures
class PromptError : public BridgeError
{
  public:
    explicit PromptError(const std::string& message) : BridgeError(message) {}
};

class PromptTimeoutError : public PromptError
{
  public:
    explicit PromptTimeoutError(const std::string& message) : PromptError(message) {}
};

class PromptNoOutputTimeoutError : public PromptError
{
  public:
    explicit PromptNoOutputTimeoutError(const std::string& message) : PromptError(message) {}
};

// Agent reported stopReason "cancelled" without producing any text
class PromptCancelledError : public PromptError
{
  public:
    PromptCancelledError(const std::string& message, bool manual)
        : PromptError(message), manual_(manual)
    {
    }

    // True when the cancel followed AcpRuntime::request_manual_abort()
    bool is_manual() const
    {
        return manual_;
    }

  private:
    bool manual_;
};

// The session/prompt request itself failed
class PromptFailedError : public PromptError
{
  public:
    explicit PromptFailedError(const std::string& message) : PromptError(message) {}
};

// The agent process exited or faulted while a prompt was in flight
class AgentProcessError : public PromptError
{
  public:
    AgentProcessError(const std::string& message, int exit_code)
        : PromptError(message), exit_code_(exit_code)
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

// A prompt is already in flight. Raised before any state change.
class ConcurrentPromptError : public BridgeError
{
  public:
    explicit ConcurrentPromptError(const std::string& message) : BridgeError(message) {}
};

// Operation not allowed in the current runtime state
class SessionStateError : public BridgeError
{
  public:
    explicit SessionStateError(const std::string& message) : BridgeError(message) {}
};

// Queue item failed with something that is not a std::exception
class ItemProcessingError : public BridgeError
{
  public:
    ItemProcessingError(const std::string& message, long request_id)
        : BridgeError(message), request_id_(request_id)
    {
    }

    long request_id() const
    {
        return request_id_;
    }

  private:
    long request_id_;
};

} // namespace acpbridge

#endif // ACPBRIDGE_ERRORS_HPP
