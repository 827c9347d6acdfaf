#include "process/LineFramer.hpp"

#include <utility>

namespace rcs::process
{

LineFramer::LineFramer(LineHandler on_line) : on_line_(std::move(on_line))
{
}

void LineFramer::push(std::string_view chunk)
{
    if (finished_ || chunk.empty())
    {
        return;
    }
    auto newline = chunk.find('\n');
    if (newline == std::string_view::npos)
    {
        backlog_.append(chunk);
        return;
    }

    // First line completes whatever was buffered.
    backlog_.append(chunk.substr(0, newline));
    std::string line;
    line.swap(backlog_);
    if (on_line_)
    {
        on_line_(line);
    }

    std::size_t start = newline + 1;
    while ((newline = chunk.find('\n', start)) != std::string_view::npos)
    {
        if (on_line_)
        {
            on_line_(chunk.substr(start, newline - start));
        }
        start = newline + 1;
    }
    backlog_.assign(chunk.substr(start));
}

void LineFramer::finish()
{
    if (finished_)
    {
        return;
    }
    finished_ = true;
    if (!backlog_.empty())
    {
        std::string line;
        line.swap(backlog_);
        if (on_line_)
        {
            on_line_(line);
        }
    }
}

} // namespace rcs::process
