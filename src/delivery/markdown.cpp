#include <acpbridge/delivery/markdown.hpp>
#include <algorithm>
#include <cctype>

namespace acpbridge
{
namespace delivery
{

namespace
{
constexpr const char* FENCE = "```";
constexpr const char* WHITESPACE = " \t\n\r\f\v";

std::string trim_end(const std::string& text)
{
    auto end = text.find_last_not_of(WHITESPACE);
    return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

std::string trim_start(const std::string& text)
{
    auto begin = text.find_first_not_of(WHITESPACE);
    return begin == std::string::npos ? std::string() : text.substr(begin);
}

bool is_utf8_continuation(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Move pos back to the start of the UTF-8 sequence it points into.
// Moves forward instead when backing off would leave nothing before it.
size_t utf8_boundary(const std::string& text, size_t pos)
{
    if (pos >= text.size())
        return text.size();

    size_t back = pos;
    while (back > 0 && is_utf8_continuation(text[back]))
        --back;
    if (back > 0 || pos == 0)
        return back;

    size_t forward = pos;
    while (forward < text.size() && is_utf8_continuation(text[forward]))
        ++forward;
    return forward;
}

// Last paragraph break past 50%, else line break past 70%, else space past 80%, else window
size_t preferred_boundary(const std::string& text, size_t window)
{
    const std::string head = text.substr(0, window);
    const double size = static_cast<double>(window);

    auto paragraph = head.rfind("\n\n");
    if (paragraph != std::string::npos && paragraph > size * 0.5)
        return paragraph;

    auto line = head.rfind('\n');
    if (line != std::string::npos && line > size * 0.7)
        return line;

    auto space = head.rfind(' ');
    if (space != std::string::npos && space > size * 0.8)
        return space;

    return window;
}

// Index of the closing char, honouring backslash escapes; text.size() if none
size_t find_closing(const std::string& text, size_t i, char closing)
{
    while (i < text.size() && text[i] != closing)
    {
        if (text[i] == '\\' && i + 1 < text.size())
            ++i;
        ++i;
    }
    return i;
}

std::string leading_alnum(const std::string& text)
{
    auto end = std::find_if_not(text.begin(), text.end(),
                                [](unsigned char c) { return std::isalnum(c) != 0; });
    return std::string(text.begin(), end);
}
} // namespace

size_t count_code_fences(const std::string& text)
{
    size_t count = 0;
    for (size_t pos = text.find(FENCE); pos != std::string::npos; pos = text.find(FENCE, pos + 3))
        ++count;
    return count;
}

size_t safe_markdown_split_point(const std::string& text, size_t split_point)
{
    const size_t n = text.size();
    const size_t limit = std::min(split_point, n);
    size_t i = 0;

    while (i < limit)
    {
        const char ch = text[i];

        if (ch == '\\' && i + 1 < n)
        {
            i += 2;
            continue;
        }

        if (ch == '`')
        {
            if (text.compare(i, 3, FENCE) == 0)
            {
                // Fenced blocks are balanced by the chunker; just step over them
                i += 3;
                while (i < n && text[i] != '\n')
                    ++i;
                auto close = text.find(FENCE, i);
                if (close == std::string::npos || close >= limit)
                    return limit;
                i = close + 3;
                continue;
            }

            const size_t start = i;
            ++i;
            while (i < n && text[i] != '`')
                ++i;
            if (i >= limit)
                return start; // inline code span crosses the split
            ++i;
            continue;
        }

        const bool image = ch == '!' && i + 1 < n && text[i + 1] == '[';
        if (image || ch == '[')
        {
            const size_t start = i;
            i = find_closing(text, i + (image ? 2 : 1), ']');
            if (i >= limit)
                return start;
            ++i;
            if (i < n && text[i] == '(')
            {
                i = find_closing(text, i + 1, ')');
                if (i >= limit)
                    return start;
                ++i;
            }
            continue;
        }

        ++i;
    }

    return limit;
}

std::string smart_truncate(const std::string& text, const TruncateOptions& options)
{
    if (text.size() <= options.max_length)
        return text;

    const size_t reserve = options.ellipsis.size() + 8;
    if (options.max_length <= reserve)
        return text.substr(0, utf8_boundary(text, options.max_length));

    const size_t cut = options.max_length - reserve;
    const size_t split = utf8_boundary(text, preferred_boundary(text, cut));

    std::string result = trim_end(text.substr(0, split));
    if (count_code_fences(result) % 2 != 0)
        result += "\n```";
    result += options.ellipsis;
    return result;
}

std::vector<std::string> split_into_smart_chunks(const std::string& text, size_t max_length)
{
    if (text.empty())
        return {""};
    if (text.size() <= max_length)
        return {text};

    const size_t reserve = std::min<size_t>(20, max_length / 10);
    const size_t limit = std::max<size_t>(max_length - reserve, 1);

    std::vector<std::string> chunks;
    std::string remaining = text;

    while (!remaining.empty())
    {
        if (remaining.size() <= max_length)
        {
            chunks.push_back(remaining);
            break;
        }

        size_t split = preferred_boundary(remaining, limit);
        if (split > 0 && remaining[split - 1] == '\\')
            --split;

        split = safe_markdown_split_point(remaining, split);
        if (split == 0)
            split = limit;
        split = utf8_boundary(remaining, split);

        std::string chunk = trim_end(remaining.substr(0, split));
        std::string rest = trim_start(remaining.substr(split));

        if (count_code_fences(chunk) % 2 != 0)
        {
            const std::string language = leading_alnum(chunk.substr(chunk.rfind(FENCE) + 3));
            chunk += "\n```";

            // Re-open the fence in the next chunk unless that stops the text from shrinking
            std::string reopened = FENCE + language + "\n" + rest;
            remaining = reopened.size() < remaining.size() ? std::move(reopened) : std::move(rest);
        }
        else
        {
            remaining = std::move(rest);
        }

        if (!chunk.empty())
            chunks.push_back(std::move(chunk));
    }

    return chunks;
}

} // namespace delivery
} // namespace acpbridge
