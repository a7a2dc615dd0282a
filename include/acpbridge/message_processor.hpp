#ifndef ACPBRIDGE_MESSAGE_PROCESSOR_HPP
#define ACPBRIDGE_MESSAGE_PROCESSOR_HPP

#include <acpbridge/message_context.hpp>
#include <acpbridge/runtime.hpp>
#include <acpbridge/types.hpp>
#include <exception>
#include <functional>
#include <string>

namespace acpbridge
{

// Error text mentions capacity, rate limit, timeout, unavailable or overload
bool is_retriable_error(const std::string& message);

// "Error: <what>" as shown to the user when a message fails
std::string format_failure_message(const std::exception& error);

/**
 * Runs one queued message through the agent and delivers the answer.
 *
 * Streams into a live preview when the context supports editable messages
 * and as a series of plain messages otherwise. Retriable failures are
 * retried with exponential backoff; anything else propagates to the queue.
 */
class MessageProcessor
{
  public:
    using PromptFn =
        std::function<std::string(const std::string& text, AcpRuntime::ChunkCallback on_chunk)>;
    using CompletionHook = std::function<void(const std::string& user_text,
                                              const std::string& response,
                                              const std::string& chat_id)>;

    MessageProcessor(PromptFn run_prompt, ProcessorOptions options, bool debug_stream = false);
    MessageProcessor(AcpRuntime& runtime, ProcessorOptions options, bool debug_stream = false);

    // Called after every successful reply; exceptions are logged
    void set_on_conversation_complete(CompletionHook hook);

    void process(MessageContext& context, long request_id);

  private:
    PromptFn run_prompt_;
    ProcessorOptions options_;
    bool debug_stream_;
    CompletionHook on_complete_;
};

} // namespace acpbridge

#endif // ACPBRIDGE_MESSAGE_PROCESSOR_HPP
