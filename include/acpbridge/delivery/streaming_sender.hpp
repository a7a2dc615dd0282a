#ifndef ACPBRIDGE_DELIVERY_STREAMING_SENDER_HPP
#define ACPBRIDGE_DELIVERY_STREAMING_SENDER_HPP

#include <acpbridge/message_context.hpp>
#include <acpbridge/timer.hpp>
#include <acpbridge/types.hpp>
#include <mutex>
#include <optional>
#include <string>

namespace acpbridge
{
namespace delivery
{

/**
 * Streams a growing response as a series of plain messages.
 *
 * Every append() restarts a debounce of stream_update_interval_ms. When it
 * fires, the buffer is truncated to max_response_length and whatever lies past
 * the already-sent length is sent as a new message. Nothing is ever sent twice;
 * content past the truncation limit is never sent.
 *
 * append() may be called from the agent connection's reader thread while
 * finalize() runs on the caller's thread; sends never overlap.
 */
class StreamingMessageSender
{
  public:
    StreamingMessageSender(MessageContext& context, long request_id, DeliveryOptions options,
                           bool debug_stream = false);
    ~StreamingMessageSender();

    StreamingMessageSender(const StreamingMessageSender&) = delete;
    StreamingMessageSender& operator=(const StreamingMessageSender&) = delete;

    void append(const std::string& chunk);

    // Cancel the debounce, optionally replace the buffer, flush once.
    // Later calls do nothing until reset().
    void finalize(const std::optional<std::string>& text_override = std::nullopt);

    // Forget everything sent so far (used before a retry)
    void reset();

    // Stop the debounce without flushing
    void cancel();

    bool has_sent_content() const;
    std::string buffer() const;

  private:
    void flush();

    MessageContext& context_;
    long request_id_;
    DeliveryOptions options_;
    bool debug_stream_;

    mutable std::mutex mutex_;
    std::string buffer_;
    size_t sent_length_ = 0;
    bool finalized_ = false;

    std::mutex send_mutex_; // held across a whole flush
    Timer debounce_;
};

} // namespace delivery
} // namespace acpbridge

#endif // ACPBRIDGE_DELIVERY_STREAMING_SENDER_HPP
