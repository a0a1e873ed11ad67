#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace esmp::canonical {

/// Envelope fields that carry the signature itself and so are never part of the signed bytes.
inline constexpr std::string_view SIGNATURE_FIELD = "signature";
inline constexpr std::string_view PUBKEY_FIELD = "sender_pubkey";

/// API: canonical/canonicalize
///
/// Produces the signed byte string of an envelope (or of a signed HTTP request body): the compact
/// JSON encoding of `msg` with the `signature` and `sender_pubkey` members removed.
///
/// The encoding is deterministic: object keys are ordered by their UTF-8 bytes at every nesting
/// level, there is no insignificant whitespace, integers are written in plain decimal, floating
/// point values use the shortest representation that round-trips, and strings are written as
/// UTF-8 with only the escapes JSON requires.  The key order of the wire JSON therefore never
/// matters.
///
/// Inputs:
/// - `msg` -- the parsed envelope; must be a JSON object.
///
/// Outputs:
/// - the canonical bytes.  Throws `protocol_error` with `Error::MalformedInput` if `msg` is not an
///   object, contains a NaN or infinite number, or contains a string that is not valid UTF-8.
std::string canonicalize(const nlohmann::json& msg);

}  // namespace esmp::canonical
