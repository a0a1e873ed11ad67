#pragma once

#include <nlohmann/json.hpp>

#include "envelope.hpp"

namespace esmp::validator {

/// API: validator/validate
///
/// Checks the shape of a signature-verified envelope against its declared kind and decodes it
/// into an `Envelope`.
///
/// - `type=text` needs a non-empty `to` or a `group_id`; `body` may be any JSON value.
/// - `type=system` needs `subtype`, `actor` and `timestamp`; `target` for `removed`,
///   `admin_assigned` and `admin_revoked`; `new_name`, `new_description`, `new_dp_url` or
///   `changes` for `group_renamed`, `description_updated`, `dp_updated` and `profile_updated`
///   respectively; and `group_id` for every subtype except `profile_updated`.
///
/// A JSON `null` is treated the same as an absent field.  Every address must be of the form
/// `localpart#domain`.  `timestamp` is an RFC 3339 string (integer Unix seconds are also
/// accepted).
///
/// This only looks at the envelope; timestamp ordering against group state is checked by the
/// group state machine under the group's lock.
///
/// Inputs:
/// - `msg` -- the parsed wire JSON.
///
/// Outputs:
/// - the decoded envelope.  Throws `protocol_error` with `Error::SchemaViolation` naming the
///   missing or invalid field.
Envelope validate(const nlohmann::json& msg);

/// Decodes the required `timestamp` member of `msg` (an RFC 3339 string or integer Unix
/// seconds).  Throws `protocol_error` with `Error::SchemaViolation` if it is missing or invalid.
sys_time timestamp(const nlohmann::json& msg);

}  // namespace esmp::validator
