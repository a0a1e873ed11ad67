#pragma once

#include <stdexcept>
#include <string_view>

#include "types.hpp"

namespace esmp::encrypt {

/// Thrown by `decrypt` when the ciphertext is truncated, was produced with a different key or
/// binding, or has been modified.
class decrypt_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Bytes added to the plaintext: the 16-byte Poly1305 tag and the 24-byte nonce.
inline constexpr size_t ENCRYPT_DATA_OVERHEAD = 40;

/// API: encrypt/encrypt
///
/// Encrypts a value for storage at rest with XChaCha20-Poly1305.  The encryption key is derived
/// from the long-term `key_base` (the server-held secret), the `domain` and the `binding` value
/// (e.g. the owner's public key), so a ciphertext cannot be moved to another owner or another kind
/// of field.  `binding` is also authenticated as associated data.  A random nonce is used and
/// appended to the returned value.
///
/// Inputs:
/// - `plaintext` -- the value to encrypt.
/// - `key_base` -- 32-byte secret.
/// - `domain` -- short (1-24 character) label of the kind of value, e.g. "profile-address".
/// - `binding` -- the record the value belongs to.
///
/// Outputs:
/// - ciphertext, tag and nonce (`plaintext.size() + ENCRYPT_DATA_OVERHEAD` bytes).  Throws
///   std::invalid_argument if `key_base` or `domain` have an invalid size.
ustring encrypt(
        ustring_view plaintext, ustring_view key_base, std::string_view domain, ustring_view binding);

/// API: encrypt/decrypt
///
/// Inverse of `encrypt`; all of `key_base`, `domain` and `binding` must match.  Throws
/// `decrypt_error` on failure.
ustring decrypt(
        ustring_view ciphertext,
        ustring_view key_base,
        std::string_view domain,
        ustring_view binding);

}  // namespace esmp::encrypt
