#include "esmp/framing.hpp"

namespace esmp {

LineFramer::LineFramer(size_t max_line_bytes) : max_{max_line_bytes} {}

std::vector<framed_line> LineFramer::feed(std::string_view data) {
    std::vector<framed_line> lines;
    while (!data.empty()) {
        auto nl = data.find('\n');
        auto chunk = data.substr(0, nl);

        if (!discarding_) {
            buf_.append(chunk);
            // Allow for the '\r' of a CRLF terminator.
            if (buf_.size() > max_ + 1) {
                buf_.clear();
                discarding_ = true;
            }
        }

        if (nl == std::string_view::npos)
            break;
        data.remove_prefix(nl + 1);

        if (discarding_) {
            lines.push_back({std::string{}, true});
            discarding_ = false;
            continue;
        }
        if (!buf_.empty() && buf_.back() == '\r')
            buf_.pop_back();
        if (buf_.size() > max_)
            lines.push_back({std::string{}, true});
        else if (!buf_.empty())
            lines.push_back({std::move(buf_), false});
        buf_.clear();
    }
    return lines;
}

}  // namespace esmp
