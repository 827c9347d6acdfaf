#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace rcs::process
{

// Splits an unbounded text stream into lines. Chunks may cut a line
// anywhere; at most one partial line is buffered between pushes. Lines are
// delivered without their trailing '\n' and empty lines are delivered as
// empty strings. finish() flushes an unterminated tail once; afterwards the
// framer ignores further input.
class LineFramer
{
  public:
    using LineHandler = std::function<void(std::string_view)>;

    explicit LineFramer(LineHandler on_line);

    void push(std::string_view chunk);
    void finish();

    bool finished() const noexcept { return finished_; }
    std::size_t buffered() const noexcept { return backlog_.size(); }

  private:
    LineHandler on_line_;
    std::string backlog_;
    bool finished_ = false;
};

} // namespace rcs::process
