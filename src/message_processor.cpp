#include <acpbridge/delivery/live_preview.hpp>
#include <acpbridge/delivery/streaming_sender.hpp>
#include <acpbridge/logging.hpp>
#include <acpbridge/message_processor.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include <thread>

namespace acpbridge
{

namespace
{
constexpr const char* NO_RESPONSE = "No response received.";

// Stops the typing indicator on every exit path
class TypingScope
{
  public:
    TypingScope(MessageContext& context, long request_id)
        : stop_(context.start_typing()), request_id_(request_id), chat_id_(context.chat_id())
    {
    }

    ~TypingScope()
    {
        if (stop_)
        {
            try
            {
                stop_();
            }
            catch (const std::exception& e)
            {
                log::get()->warn("Failed to stop typing indicator requestId={} error={}",
                                 request_id_, e.what());
            }
        }
        log::get()->info("Finished message processing requestId={} chatId={}", request_id_,
                         chat_id_);
    }

  private:
    std::function<void()> stop_;
    long request_id_;
    std::string chat_id_;
};
} // namespace

bool is_retriable_error(const std::string& message)
{
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* needle : {"capacity", "rate limit", "timeout", "unavailable", "overload"})
        if (lower.find(needle) != std::string::npos)
            return true;
    return false;
}

std::string format_failure_message(const std::exception& error)
{
    return std::string("Error: ") + error.what();
}

MessageProcessor::MessageProcessor(PromptFn run_prompt, ProcessorOptions options, bool debug_stream)
    : run_prompt_(std::move(run_prompt)), options_(std::move(options)), debug_stream_(debug_stream)
{
}

MessageProcessor::MessageProcessor(AcpRuntime& runtime, ProcessorOptions options, bool debug_stream)
    : MessageProcessor(
          [&runtime](const std::string& text, AcpRuntime::ChunkCallback on_chunk)
          { return runtime.run_prompt(text, std::move(on_chunk)); },
          std::move(options), debug_stream)
{
}

void MessageProcessor::set_on_conversation_complete(CompletionHook hook)
{
    on_complete_ = std::move(hook);
}

void MessageProcessor::process(MessageContext& context, long request_id)
{
    const std::string text = context.text();
    log::get()->info("Starting message processing requestId={} chatId={}", request_id,
                     context.chat_id());

    TypingScope typing(context, request_id);

    const size_t max_length = options_.delivery.max_response_length;
    std::optional<delivery::LivePreview> preview;
    std::optional<delivery::StreamingMessageSender> sender;
    if (context.supports_live_messages())
        preview.emplace(context, request_id, options_.delivery, debug_stream_);
    else
        sender.emplace(context, request_id, options_.delivery, debug_stream_);

    auto on_chunk = [&](const std::string& chunk)
    {
        if (preview)
            preview->append(chunk);
        else
            sender->append(chunk);
    };

    std::string response;
    for (int attempt = 0;; ++attempt)
    {
        if (attempt > 0)
        {
            if (preview)
                preview->reset();
            else
                sender->reset();
        }

        try
        {
            response = run_prompt_(text, on_chunk);
            break;
        }
        catch (const std::exception& e)
        {
            if (attempt >= options_.max_retries || !is_retriable_error(e.what()))
            {
                if (preview)
                    preview->abort();
                else
                    sender->cancel();
                throw;
            }

            const long delay_ms = static_cast<long>(options_.retry_delay_ms) << attempt;
            log::get()->warn("Agent request failed, retrying requestId={} attempt={} maxRetries={} "
                             "delayMs={} error={}",
                             request_id, attempt + 1, options_.max_retries, delay_ms, e.what());

            context.send_text("\xE2\x9A\xA0\xEF\xB8\x8F LLM rate limit issue, retrying (" +
                              std::to_string(attempt + 1) + "/" +
                              std::to_string(options_.max_retries) + ")...");
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }

    std::string delivered;
    if (preview)
    {
        if (!preview->complete(response))
        {
            if (debug_stream_)
                log::get()->debug("Sending final response requestId={} responseLength={}",
                                  request_id, response.size());
            delivery::send_in_chunks(context, response.empty() ? NO_RESPONSE : response,
                                     max_length);
        }
        delivered = response;
    }
    else
    {
        sender->finalize();
        std::string streamed = sender->buffer();
        if (!sender->has_sent_content())
        {
            std::string fallback = streamed.empty() ? response : streamed;
            delivery::send_in_chunks(context, fallback.empty() ? NO_RESPONSE : fallback,
                                     max_length);
        }
        sender->cancel();
        delivered = streamed.empty() ? response : streamed;
    }

    if (on_complete_ && !delivered.empty() && delivered != NO_RESPONSE)
    {
        try
        {
            on_complete_(text, delivered, context.chat_id());
        }
        catch (const std::exception& e)
        {
            log::get()->warn("Failed to track conversation history requestId={} error={}",
                             request_id, e.what());
        }
    }
}

} // namespace acpbridge
