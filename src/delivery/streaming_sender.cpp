#include <acpbridge/delivery/markdown.hpp>
#include <acpbridge/delivery/streaming_sender.hpp>
#include <acpbridge/logging.hpp>

namespace acpbridge
{
namespace delivery
{

namespace
{
std::string trim(const std::string& text)
{
    constexpr const char* ws = " \t\n\r\f\v";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos)
        return {};
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}
} // namespace

StreamingMessageSender::StreamingMessageSender(MessageContext& context, long request_id,
                                               DeliveryOptions options, bool debug_stream)
    : context_(context), request_id_(request_id), options_(std::move(options)),
      debug_stream_(debug_stream)
{
}

StreamingMessageSender::~StreamingMessageSender()
{
    debounce_.cancel();
}

void StreamingMessageSender::append(const std::string& chunk)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_ += chunk;
    }
    debounce_.arm(std::chrono::milliseconds(options_.stream_update_interval_ms), [this] { flush(); });
}

void StreamingMessageSender::flush()
{
    std::lock_guard<std::mutex> send_lock(send_mutex_);

    std::string text;
    size_t already_sent;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finalized_)
            return;
        text = smart_truncate(buffer_, {options_.max_response_length, "..."});
        already_sent = sent_length_;
    }

    // The truncated view can shrink below what was sent when the ellipsis moves
    if (already_sent >= text.size())
        return;
    std::string fresh = trim(text.substr(already_sent));
    if (fresh.empty())
        return;

    try
    {
        context_.send_text(fresh);
    }
    catch (const std::exception& e)
    {
        log::get()->warn("Failed to send stream chunk requestId={} error={}", request_id_, e.what());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_length_ = text.size();
    }
    if (debug_stream_)
        log::get()->debug("Stream chunk sent requestId={} chunkLength={}", request_id_, fresh.size());
}

void StreamingMessageSender::finalize(const std::optional<std::string>& text_override)
{
    debounce_.cancel();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finalized_)
            return;
        if (text_override && !text_override->empty())
            buffer_ = *text_override;
    }

    flush();

    std::lock_guard<std::mutex> lock(mutex_);
    finalized_ = true;
}

void StreamingMessageSender::reset()
{
    debounce_.cancel();
    // Wait out a flush already in progress so its bookkeeping lands before the reset
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
    sent_length_ = 0;
    finalized_ = false;
}

void StreamingMessageSender::cancel()
{
    debounce_.cancel();
}

bool StreamingMessageSender::has_sent_content() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_length_ > 0;
}

std::string StreamingMessageSender::buffer() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

} // namespace delivery
} // namespace acpbridge
