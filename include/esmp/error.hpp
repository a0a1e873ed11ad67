#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace esmp {

/// Client-attributable rejection reasons.  Each accepted-or-rejected envelope or profile request
/// resolves to success or exactly one of these.
enum class Error {
    MalformedInput,    // unparseable or non-canonicalizable JSON
    SignatureInvalid,  // Ed25519 verification failed
    SchemaViolation,   // missing/invalid required field for the declared kind
    StaleMutation,     // timestamp not newer than the last applied mutation
    DuplicateGroup,    // group_created for an existing group
    UnknownGroup,      // group message for a group that was never created
    Forbidden,         // authorization or precondition failure
    InvalidField,      // profile field validation failure
};

/// Returns the wire name of the error kind, e.g. "StaleMutation".
std::string_view to_string(Error e);

/// Thrown by the core for every protocol-level rejection.  Carries the error kind; `what()` is a
/// human readable description (for SchemaViolation and InvalidField it names the field).
class protocol_error : public std::runtime_error {
  public:
    protocol_error(Error kind, const std::string& message) :
            std::runtime_error{message}, kind_{kind} {}

    Error kind() const { return kind_; }

  private:
    Error kind_;
};

/// Thrown when a persistence collaborator fails (disk full, unreadable log, ...).  This is an
/// infrastructure fault, never a protocol rejection; state is left as it was before the call.
class storage_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

}  // namespace esmp
