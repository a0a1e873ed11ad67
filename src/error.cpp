#include "esmp/error.hpp"

#include <stdexcept>

#include "esmp/logging.hpp"

namespace esmp {

std::string_view to_string(Error e) {
    switch (e) {
        case Error::MalformedInput: return "MalformedInput";
        case Error::SignatureInvalid: return "SignatureInvalid";
        case Error::SchemaViolation: return "SchemaViolation";
        case Error::StaleMutation: return "StaleMutation";
        case Error::DuplicateGroup: return "DuplicateGroup";
        case Error::UnknownGroup: return "UnknownGroup";
        case Error::Forbidden: return "Forbidden";
        case Error::InvalidField: return "InvalidField";
    }
    return "Unknown";
}

std::string_view to_string(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::debug: return "debug";
        case LogLevel::info: return "info";
        case LogLevel::warning: return "warning";
        case LogLevel::error: return "error";
    }
    return "unknown";
}

LogLevel parse_log_level(std::string_view name) {
    for (auto lvl : {LogLevel::debug, LogLevel::info, LogLevel::warning, LogLevel::error})
        if (to_string(lvl) == name)
            return lvl;
    throw std::invalid_argument{"Invalid log level '" + std::string{name} + "'"};
}

}  // namespace esmp
