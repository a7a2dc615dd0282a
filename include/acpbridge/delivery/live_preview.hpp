#ifndef ACPBRIDGE_DELIVERY_LIVE_PREVIEW_HPP
#define ACPBRIDGE_DELIVERY_LIVE_PREVIEW_HPP

#include <acpbridge/message_context.hpp>
#include <acpbridge/timer.hpp>
#include <acpbridge/types.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace acpbridge
{
namespace delivery
{

/**
 * Streams a response into one editable message for contexts that support
 * live messages.
 *
 * The message is started lazily on the first debounced flush and edited with
 * the preview (cut to max_response_length with a trailing "…"). A chunk that
 * arrives more than message_gap_threshold_ms after the previous one closes the
 * current message and the following text goes into a new one.
 */
class LivePreview
{
  public:
    LivePreview(MessageContext& context, long request_id, DeliveryOptions options,
                bool debug_stream = false);
    ~LivePreview();

    LivePreview(const LivePreview&) = delete;
    LivePreview& operator=(const LivePreview&) = delete;

    void append(const std::string& chunk);

    /**
     * Close the live message with the final text.
     *
     * @return false when no live message could be used, in which case the
     *         caller must deliver full_response itself
     */
    bool complete(const std::string& full_response);

    // Delete a live message that was never completed (prompt failed)
    void abort();

    // abort() and forget all state (used before a retry)
    void reset();

    void cancel();

    bool has_live_message() const;

  private:
    std::string preview_text() const;
    void flush(bool allow_start);
    void finalize_segment();
    void remove_current();

    MessageContext& context_;
    long request_id_;
    DeliveryOptions options_;
    bool debug_stream_;

    mutable std::mutex mutex_; // held across every context call
    std::optional<LiveMessageHandle> handle_;
    std::string preview_;
    std::optional<std::chrono::steady_clock::time_point> last_chunk_at_;
    int finished_segments_ = 0;
    bool completed_ = false;

    Timer debounce_;
};

/**
 * Send text as consecutive messages of at most max_length bytes each,
 * split with split_into_smart_chunks(). Send errors propagate.
 */
void send_in_chunks(MessageContext& context, const std::string& text, size_t max_length);

} // namespace delivery
} // namespace acpbridge

#endif // ACPBRIDGE_DELIVERY_LIVE_PREVIEW_HPP
