#include "esmp/ed25519.hpp"

#include <oxenc/base64.h>
#include <oxenc/hex.h>
#include <sodium/crypto_sign_ed25519.h>

#include <stdexcept>

#include "esmp/util.hpp"

namespace esmp::ed25519 {

namespace {

    // Decodes a hex or base64 value into exactly N bytes.  Hex is tried first: any hex string is
    // also a syntactically valid base64 string, but of the wrong decoded length.
    template <size_t N>
    std::optional<std::array<unsigned char, N>> decode_fixed(std::string_view encoded) {
        std::array<unsigned char, N> out;
        if (encoded.size() == 2 * N && oxenc::is_hex(encoded)) {
            oxenc::from_hex(encoded.begin(), encoded.end(), out.begin());
            return out;
        }
        if (!encoded.empty() && oxenc::is_base64(encoded)) {
            std::string bytes;
            oxenc::from_base64(encoded.begin(), encoded.end(), std::back_inserter(bytes));
            if (bytes.size() == N) {
                std::memcpy(out.data(), bytes.data(), N);
                return out;
            }
        }
        return std::nullopt;
    }

}  // namespace

std::pair<pubkey_t, seckey_t> ed25519_key_pair() {
    pubkey_t ed_pk;
    seckey_t ed_sk;
    crypto_sign_ed25519_keypair(ed_pk.data(), ed_sk.data());

    return {ed_pk, ed_sk};
}

std::pair<pubkey_t, seckey_t> ed25519_key_pair(ustring_view ed25519_seed) {
    if (ed25519_seed.size() != 32)
        throw std::invalid_argument{"Invalid ed25519_seed: expected 32 bytes"};

    pubkey_t ed_pk;
    seckey_t ed_sk;
    crypto_sign_ed25519_seed_keypair(ed_pk.data(), ed_sk.data(), ed25519_seed.data());

    return {ed_pk, ed_sk};
}

signature_t sign(ustring_view ed25519_privkey, ustring_view msg) {
    cleared_array<64> ed_sk_from_seed;
    if (ed25519_privkey.size() == 32) {
        pubkey_t ignore_pk;
        crypto_sign_ed25519_seed_keypair(
                ignore_pk.data(), ed_sk_from_seed.data(), ed25519_privkey.data());
        ed25519_privkey = {ed_sk_from_seed.data(), ed_sk_from_seed.size()};
    } else if (ed25519_privkey.size() != 64) {
        throw std::invalid_argument{"Invalid ed25519_privkey: expected 32 or 64 bytes"};
    }

    signature_t sig;
    if (0 != crypto_sign_ed25519_detached(
                     sig.data(), nullptr, msg.data(), msg.size(), ed25519_privkey.data()))
        throw std::runtime_error{"Failed to sign; perhaps the secret key is invalid?"};

    return sig;
}

bool verify(ustring_view sig, ustring_view pubkey, ustring_view msg) {
    if (sig.size() != 64)
        throw std::invalid_argument{"Invalid sig: expected 64 bytes"};
    if (pubkey.size() != 32)
        throw std::invalid_argument{"Invalid pubkey: expected 32 bytes"};

    return (0 == crypto_sign_ed25519_verify_detached(
                         sig.data(), msg.data(), msg.size(), pubkey.data()));
}

std::optional<pubkey_t> parse_pubkey(std::string_view encoded) {
    return decode_fixed<32>(encoded);
}

std::optional<signature_t> parse_signature(std::string_view encoded) {
    return decode_fixed<64>(encoded);
}

std::string pubkey_hex(const pubkey_t& pk) {
    return oxenc::to_hex(pk.begin(), pk.end());
}

}  // namespace esmp::ed25519
