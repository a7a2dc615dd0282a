#include <acpbridge/delivery/live_preview.hpp>
#include <acpbridge/delivery/markdown.hpp>
#include <acpbridge/logging.hpp>
#include <algorithm>
#include <cctype>

namespace acpbridge
{
namespace delivery
{

namespace
{
constexpr const char* PREVIEW_ELLIPSIS = "\xE2\x80\xA6"; // U+2026
constexpr size_t PREVIEW_ELLIPSIS_BYTES = 3;
constexpr const char* NO_RESPONSE = "No response received.";

bool is_blank(const std::string& text)
{
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

bool is_not_modified_error(const std::string& message)
{
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("message is not modified") != std::string::npos;
}
} // namespace

LivePreview::LivePreview(MessageContext& context, long request_id, DeliveryOptions options,
                         bool debug_stream)
    : context_(context), request_id_(request_id), options_(std::move(options)),
      debug_stream_(debug_stream)
{
}

LivePreview::~LivePreview()
{
    debounce_.cancel();
}

std::string LivePreview::preview_text() const
{
    if (preview_.size() <= options_.max_response_length)
        return preview_;

    size_t keep = options_.max_response_length > PREVIEW_ELLIPSIS_BYTES
                      ? options_.max_response_length - PREVIEW_ELLIPSIS_BYTES
                      : 0;
    while (keep > 0 && (static_cast<unsigned char>(preview_[keep]) & 0xC0) == 0x80)
        --keep;
    return preview_.substr(0, keep) + PREVIEW_ELLIPSIS;
}

void LivePreview::append(const std::string& chunk)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        if (last_chunk_at_ && handle_ && !is_blank(preview_))
        {
            auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(now - *last_chunk_at_);
            if (gap.count() > options_.message_gap_threshold_ms)
                finalize_segment();
        }
        last_chunk_at_ = now;
        preview_ += chunk;
    }

    debounce_.arm(std::chrono::milliseconds(options_.stream_update_interval_ms),
                  [this]
                  {
                      std::lock_guard<std::mutex> lock(mutex_);
                      flush(true);
                  });
}

void LivePreview::flush(bool allow_start)
{
    if (completed_)
        return;

    const std::string text = preview_text();
    if (text.empty())
        return;

    if (!handle_)
    {
        if (!allow_start)
            return;
        try
        {
            handle_ = context_.start_live_message(text);
        }
        catch (const std::exception& e)
        {
            log::get()->warn("Failed to start live message requestId={} error={}", request_id_,
                             e.what());
        }
        return;
    }

    try
    {
        context_.update_live_message(*handle_, text);
        if (debug_stream_)
            log::get()->debug("Live preview updated requestId={} previewLength={}", request_id_,
                              text.size());
    }
    catch (const std::exception& e)
    {
        if (!is_not_modified_error(e.what()))
            log::get()->warn("Live preview update skipped requestId={} error={}", request_id_,
                             e.what());
    }
}

void LivePreview::finalize_segment()
{
    debounce_.cancel();
    flush(false);

    const std::string text = preview_text();
    try
    {
        context_.finalize_live_message(*handle_, text);
        if (debug_stream_)
            log::get()->debug("Finalized message due to long gap requestId={} messageLength={}",
                              request_id_, text.size());
    }
    catch (const std::exception& e)
    {
        log::get()->warn("Failed to finalize message on gap requestId={} error={}", request_id_,
                         e.what());
    }

    handle_.reset();
    preview_.clear();
    ++finished_segments_;
}

bool LivePreview::complete(const std::string& full_response)
{
    std::lock_guard<std::mutex> lock(mutex_);
    debounce_.cancel();
    flush(true);

    if (!handle_)
        return false;

    // Earlier segments were closed on gaps; the last message carries only its own text
    std::string final_text = finished_segments_ == 0 ? full_response : preview_;
    if (final_text.empty())
        final_text = NO_RESPONSE;

    auto chunks = split_into_smart_chunks(final_text, options_.max_response_length);
    try
    {
        context_.finalize_live_message(*handle_, chunks.front());
    }
    catch (const std::exception& e)
    {
        log::get()->warn(
            "Live message finalize failed; keeping streamed message as final output requestId={} "
            "error={}",
            request_id_, e.what());
    }
    completed_ = true;

    for (size_t i = 1; i < chunks.size(); ++i)
        context_.send_text(chunks[i]);
    return true;
}

void LivePreview::remove_current()
{
    if (handle_ && !completed_)
    {
        try
        {
            context_.remove_message(*handle_);
        }
        catch (const std::exception& e)
        {
            log::get()->debug("Failed to remove live message requestId={} error={}", request_id_,
                              e.what());
        }
    }
    handle_.reset();
}

void LivePreview::abort()
{
    std::lock_guard<std::mutex> lock(mutex_);
    debounce_.cancel();
    remove_current();
}

void LivePreview::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    debounce_.cancel();
    remove_current();
    preview_.clear();
    last_chunk_at_.reset();
    finished_segments_ = 0;
    completed_ = false;
}

void LivePreview::cancel()
{
    debounce_.cancel();
}

bool LivePreview::has_live_message() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_.has_value();
}

void send_in_chunks(MessageContext& context, const std::string& text, size_t max_length)
{
    for (const auto& chunk : split_into_smart_chunks(text, max_length))
    {
        if (!chunk.empty())
            context.send_text(chunk);
    }
}

} // namespace delivery
} // namespace acpbridge
