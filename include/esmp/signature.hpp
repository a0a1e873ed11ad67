#pragma once

#include <string_view>

#include "types.hpp"

namespace esmp::signature {

/// API: signature/verify
///
/// Checks `signature` over `canonical` (the output of `canonical::canonicalize`) against
/// `sender_pubkey`.  Both encoded values are taken as they appear on the wire (hex or base64).
/// This never throws: undecodable keys or signatures simply fail verification.
///
/// Inputs:
/// - `canonical` -- the exact signed bytes.
/// - `signature` -- encoded 64-byte Ed25519 signature.
/// - `sender_pubkey` -- encoded 32-byte Ed25519 public key.
///
/// Outputs:
/// - true iff the signature is valid.
bool verify(ustring_view canonical, std::string_view signature, std::string_view sender_pubkey);

}  // namespace esmp::signature
