#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace esmp {

enum class LogLevel { debug = 0, info, warning, error };

/// Log sink installed by the embedding application.  Core components never write to stdout or
/// stderr themselves; they hand messages to this callback, if set.
using Logger = std::function<void(LogLevel lvl, std::string msg)>;

/// Returns "debug", "info", "warning" or "error".
std::string_view to_string(LogLevel lvl);

/// Parses one of the names returned by `to_string`; throws std::invalid_argument otherwise.
LogLevel parse_log_level(std::string_view name);

}  // namespace esmp
