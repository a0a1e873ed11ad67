#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace esmp {

using ustring = std::basic_string<unsigned char>;
using ustring_view = std::basic_string_view<unsigned char>;

/// Protocol instants (envelope timestamps, `created_at`, `updated_at`).
using sys_time = std::chrono::system_clock::time_point;

/// Per-thread sequence number assigned by a thread log; the first record of a thread is 1.
using seqno_t = std::int64_t;

}  // namespace esmp
