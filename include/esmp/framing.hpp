#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace esmp {

/// One line taken from a byte stream.
struct framed_line {
    std::string text;
    // True if the line exceeded the limit; `text` is then empty.
    bool overlong = false;
};

/// Splits a byte stream into newline-terminated lines.  A trailing "\r" is removed and blank lines
/// are skipped.  A line longer than the limit is not buffered: its bytes are discarded as they
/// arrive and a single `overlong` entry is produced when its newline is reached, so that every
/// line sent still gets exactly one reply.
class LineFramer {
  public:
    explicit LineFramer(size_t max_line_bytes);

    /// Feeds received bytes, returning the lines completed by them (possibly none).
    std::vector<framed_line> feed(std::string_view data);

    /// Bytes of the current incomplete line held in the buffer.
    size_t pending() const { return buf_.size(); }

  private:
    size_t max_;
    std::string buf_;
    bool discarding_ = false;
};

}  // namespace esmp
