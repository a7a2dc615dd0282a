#ifndef ACPBRIDGE_DELIVERY_MARKDOWN_HPP
#define ACPBRIDGE_DELIVERY_MARKDOWN_HPP

#include <string>
#include <vector>

namespace acpbridge
{
namespace delivery
{

// All lengths are in bytes. Cuts never land inside a UTF-8 sequence.

struct TruncateOptions
{
    size_t max_length = 4000;
    std::string ellipsis = "...";
};

/**
 * Shorten text to fit max_length in one message.
 *
 * Cuts at the last paragraph break, line break or space that falls late
 * enough in the allowed prefix (past 50%, 70% and 80% of it respectively),
 * otherwise hard-cuts. An unbalanced ``` fence is closed before the ellipsis
 * is appended. Text that already fits is returned unchanged.
 */
std::string smart_truncate(const std::string& text, const TruncateOptions& options = {});

/**
 * Split text into chunks of at most max_length bytes for separate messages.
 *
 * Uses the same boundary preference as smart_truncate, never breaks an
 * escape, inline code span, link or image, and closes/re-opens fenced code
 * blocks (keeping the language tag) across chunk boundaries.
 * Empty input yields {""}.
 */
std::vector<std::string> split_into_smart_chunks(const std::string& text, size_t max_length);

/**
 * Latest position <= split_point that does not fall inside an inline code
 * span, link or image. Fenced blocks are skipped; a fence still open at
 * split_point returns split_point.
 */
size_t safe_markdown_split_point(const std::string& text, size_t split_point);

// Number of ``` markers in text
size_t count_code_fences(const std::string& text);

} // namespace delivery
} // namespace acpbridge

#endif // ACPBRIDGE_DELIVERY_MARKDOWN_HPP
