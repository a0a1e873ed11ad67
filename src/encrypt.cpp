#include "esmp/encrypt.hpp"

#include <sodium/crypto_aead_xchacha20poly1305.h>
#include <sodium/crypto_generichash_blake2b.h>
#include <sodium/randombytes.h>

#include <array>
#include <cassert>

#include "esmp/util.hpp"

namespace esmp::encrypt {

static constexpr size_t DOMAIN_MAX_SIZE = 24;

static_assert(
        ENCRYPT_DATA_OVERHEAD ==
        crypto_aead_xchacha20poly1305_IETF_ABYTES + crypto_aead_xchacha20poly1305_IETF_NPUBBYTES);

using enc_key = cleared_array<crypto_aead_xchacha20poly1305_ietf_KEYBYTES>;

static enc_key make_encrypt_key(
        ustring_view key_base, std::string_view domain, ustring_view binding) {
    if (key_base.size() != 32)
        throw std::invalid_argument{"encrypt called with key_base != 32 bytes"};
    if (domain.size() < 1 || domain.size() > DOMAIN_MAX_SIZE)
        throw std::invalid_argument{"encrypt called with domain size not in [1, 24]"};

    // H(domain || 0x00 || binding) keyed with the secret; the separator keeps different
    // (domain, binding) splits of the same bytes apart.
    enc_key key;
    crypto_generichash_blake2b_state state;
    crypto_generichash_blake2b_init(&state, key_base.data(), key_base.size(), key.size());
    crypto_generichash_blake2b_update(&state, to_unsigned(domain.data()), domain.size());
    const unsigned char sep = 0;
    crypto_generichash_blake2b_update(&state, &sep, 1);
    crypto_generichash_blake2b_update(&state, binding.data(), binding.size());
    crypto_generichash_blake2b_final(&state, key.data(), key.size());
    return key;
}

ustring encrypt(
        ustring_view plaintext,
        ustring_view key_base,
        std::string_view domain,
        ustring_view binding) {
    auto key = make_encrypt_key(key_base, domain, binding);

    std::array<unsigned char, crypto_aead_xchacha20poly1305_ietf_NPUBBYTES> nonce;
    randombytes_buf(nonce.data(), nonce.size());

    ustring out;
    out.resize(plaintext.size() + ENCRYPT_DATA_OVERHEAD);
    unsigned long long outlen = 0;
    crypto_aead_xchacha20poly1305_ietf_encrypt(
            out.data(),
            &outlen,
            plaintext.data(),
            plaintext.size(),
            binding.data(),
            binding.size(),
            nullptr,
            nonce.data(),
            key.data());

    assert(outlen == out.size() - nonce.size());
    std::memcpy(out.data() + outlen, nonce.data(), nonce.size());
    return out;
}

ustring decrypt(
        ustring_view ciphertext,
        ustring_view key_base,
        std::string_view domain,
        ustring_view binding) {
    if (ciphertext.size() < ENCRYPT_DATA_OVERHEAD)
        throw decrypt_error{"Decryption failed: ciphertext is too short"};
    auto key = make_encrypt_key(key_base, domain, binding);

    auto nonce = ciphertext.substr(ciphertext.size() - crypto_aead_xchacha20poly1305_ietf_NPUBBYTES);
    ciphertext.remove_suffix(nonce.size());

    ustring plain;
    plain.resize(ciphertext.size() - crypto_aead_xchacha20poly1305_ietf_ABYTES);
    unsigned long long plain_len = 0;
    if (0 != crypto_aead_xchacha20poly1305_ietf_decrypt(
                     plain.data(),
                     &plain_len,
                     nullptr,
                     ciphertext.data(),
                     ciphertext.size(),
                     binding.data(),
                     binding.size(),
                     nonce.data(),
                     key.data()))
        throw decrypt_error{"Decryption failed"};
    plain.resize(plain_len);
    return plain;
}

}  // namespace esmp::encrypt
