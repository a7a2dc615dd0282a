#ifndef ACPBRIDGE_INTERNAL_LINE_BUFFER_HPP
#define ACPBRIDGE_INTERNAL_LINE_BUFFER_HPP

#include <optional>
#include <string>
#include <vector>

namespace acpbridge
{
namespace internal
{

// Splits a byte stream into newline-delimited frames.
// A partial line longer than max_line_bytes raises ProtocolError.
class LineBuffer
{
  public:
    explicit LineBuffer(size_t max_line_bytes = 10 * 1024 * 1024);

    // Append data and return every complete line (CR/LF stripped, blank lines skipped)
    std::vector<std::string> add_data(const std::string& data);

    // Remaining partial line, if any (used at EOF)
    std::optional<std::string> take_remainder();

    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    void clear()
    {
        buffer_.clear();
        scanned_ = 0;
    }

  private:
    std::optional<std::string> extract_line();

    std::string buffer_;
    size_t scanned_ = 0; // Prefix of buffer_ known to hold no newline
    size_t max_line_bytes_;
};

} // namespace internal
} // namespace acpbridge

#endif // ACPBRIDGE_INTERNAL_LINE_BUFFER_HPP
