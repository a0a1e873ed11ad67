#pragma once

#include <string_view>

namespace esmp {

/// Returns true if `addr` has the `localpart#domain` shape: exactly one `#`, both sides
/// non-empty, valid UTF-8, and no whitespace or control characters.
bool is_valid_address(std::string_view addr);

}  // namespace esmp
