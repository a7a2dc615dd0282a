#ifndef ACPBRIDGE_MESSAGE_CONTEXT_HPP
#define ACPBRIDGE_MESSAGE_CONTEXT_HPP

#include <acpbridge/errors.hpp>
#include <functional>
#include <string>

namespace acpbridge
{

// Identifies a message previously posted through start_live_message()
using LiveMessageHandle = std::string;

/**
 * One inbound chat message plus the ways to answer it.
 *
 * Implemented by the messaging front end. send_text() and the live-message
 * calls may block and may throw; callers log the failures.
 * Called from the queue's drain thread and from delivery timer threads,
 * never concurrently for the same context.
 */
class MessageContext
{
  public:
    virtual ~MessageContext() = default;

    virtual std::string text() const = 0;
    virtual std::string chat_id() const = 0;

    // Start a typing indicator; the returned function stops it
    virtual std::function<void()> start_typing() = 0;

    virtual void send_text(const std::string& text) = 0;

    // Editable messages. Contexts that support them override all five.
    virtual bool supports_live_messages() const
    {
        return false;
    }

    virtual LiveMessageHandle start_live_message(const std::string& /*text*/)
    {
        throw BridgeError("live messages are not supported by this context");
    }

    virtual void update_live_message(const LiveMessageHandle& /*handle*/, const std::string& /*text*/)
    {
        throw BridgeError("live messages are not supported by this context");
    }

    virtual void finalize_live_message(const LiveMessageHandle& /*handle*/, const std::string& /*text*/)
    {
        throw BridgeError("live messages are not supported by this context");
    }

    virtual void remove_message(const LiveMessageHandle& /*handle*/)
    {
        throw BridgeError("live messages are not supported by this context");
    }
};

} // namespace acpbridge

#endif // ACPBRIDGE_MESSAGE_CONTEXT_HPP
