#include "line_buffer.hpp"

#include <acpbridge/errors.hpp>

namespace acpbridge
{
namespace internal
{

namespace
{
void strip_line_ending(std::string& line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
}
} // namespace

LineBuffer::LineBuffer(size_t max_line_bytes) : max_line_bytes_(max_line_bytes) {}

std::vector<std::string> LineBuffer::add_data(const std::string& data)
{
    buffer_ += data;

    std::vector<std::string> lines;
    while (auto line = extract_line())
    {
        strip_line_ending(*line);
        if (!line->empty())
            lines.push_back(std::move(*line));
    }

    if (buffer_.size() > max_line_bytes_)
    {
        size_t size = buffer_.size();
        clear();
        throw ProtocolError("Message exceeded maximum size of " + std::to_string(max_line_bytes_) +
                            " bytes (was " + std::to_string(size) + ")");
    }

    return lines;
}

std::optional<std::string> LineBuffer::take_remainder()
{
    if (buffer_.empty())
        return std::nullopt;

    std::string rest = std::move(buffer_);
    clear();
    strip_line_ending(rest);
    if (rest.empty())
        return std::nullopt;
    return rest;
}

std::optional<std::string> LineBuffer::extract_line()
{
    size_t pos = buffer_.find('\n', scanned_);
    if (pos == std::string::npos)
    {
        scanned_ = buffer_.size();
        return std::nullopt;
    }

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    scanned_ = 0;
    return line;
}

} // namespace internal
} // namespace acpbridge
