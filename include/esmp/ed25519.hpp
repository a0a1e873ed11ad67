#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "types.hpp"

namespace esmp::ed25519 {

using pubkey_t = std::array<unsigned char, 32>;
using seckey_t = std::array<unsigned char, 64>;
using signature_t = std::array<unsigned char, 64>;

/// Generates a random Ed25519 key pair
std::pair<pubkey_t, seckey_t> ed25519_key_pair();

/// Given an Ed25519 seed this returns the associated Ed25519 key pair
std::pair<pubkey_t, seckey_t> ed25519_key_pair(ustring_view ed25519_seed);

/// API: ed25519/sign
///
/// Generates a signature for the message using the libsodium-style ed25519 secret key.
///
/// Inputs:
/// - `ed25519_privkey` -- the libsodium-style secret key, 64 bytes, or its 32-byte seed.
/// - `msg` -- the data to generate a signature for.
///
/// Outputs:
/// - The ed25519 signature.  Throws std::invalid_argument if the key has the wrong size.
signature_t sign(ustring_view ed25519_privkey, ustring_view msg);

/// API: ed25519/verify
///
/// Verify a message and signature for a given pubkey.
///
/// Inputs:
/// - `sig` -- the signature to verify, 64 bytes.
/// - `pubkey` -- the pubkey for the secret key that was used to generate the signature, 32 bytes.
/// - `msg` -- the data to verify the signature for.
///
/// Outputs:
/// - A flag indicating whether the signature is valid.  Throws std::invalid_argument if `sig` or
///   `pubkey` have the wrong size.
bool verify(ustring_view sig, ustring_view pubkey, ustring_view msg);

/// API: ed25519/parse_pubkey
///
/// Decodes a public key as it appears on the wire: either 64 hex digits or standard base64
/// (padded or unpadded) of the 32 key bytes.
///
/// Outputs:
/// - The key bytes, or std::nullopt if `encoded` is neither form or decodes to the wrong size.
std::optional<pubkey_t> parse_pubkey(std::string_view encoded);

/// Same as `parse_pubkey`, for 64-byte signatures (128 hex digits or base64).
std::optional<signature_t> parse_signature(std::string_view encoded);

/// Returns the lowercase hex form of a public key; this is how profiles and direct-thread
/// participants identify a key.
std::string pubkey_hex(const pubkey_t& pk);

}  // namespace esmp::ed25519
