#pragma once

#include <oxenc/hex.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "esmp/canonical.hpp"
#include "esmp/ed25519.hpp"
#include "esmp/error.hpp"
#include "esmp/timestamp.hpp"
#include "esmp/types.hpp"

using esmp::ustring;
using esmp::ustring_view;
using namespace std::literals;

inline ustring operator""_bytes(const char* x, size_t n) {
    return {reinterpret_cast<const unsigned char*>(x), n};
}
inline ustring operator""_hexbytes(const char* x, size_t n) {
    ustring bytes;
    oxenc::from_hex(x, x + n, std::back_inserter(bytes));
    return bytes;
}

inline std::string to_hex(ustring_view bytes) {
    std::string hex;
    oxenc::to_hex(bytes.begin(), bytes.end(), std::back_inserter(hex));
    return hex;
}

inline constexpr auto operator""_kiB(unsigned long long kiB) {
    return kiB * 1024;
}

inline std::string_view to_sv(ustring_view x) {
    return {reinterpret_cast<const char*>(x.data()), x.size()};
}
inline ustring_view to_usv(std::string_view x) {
    return {reinterpret_cast<const unsigned char*>(x.data()), x.size()};
}
template <size_t N>
ustring_view to_usv(const std::array<unsigned char, N>& data) {
    return {data.data(), N};
}

template <typename... T>
std::set<std::common_type_t<T...>> make_set(T&&... args) {
    return {std::forward<T>(args)...};
}

// Parses an RFC 3339 literal that is known to be valid.
inline esmp::sys_time ts(std::string_view s) {
    auto t = esmp::parse_rfc3339(s);
    if (!t)
        throw std::invalid_argument{"bad test timestamp " + std::string{s}};
    return *t;
}

// RFC 3339 form of 2024-01-01T00:00:00Z plus `seconds`.
inline std::string fmt_ts(int seconds) {
    return esmp::to_rfc3339(esmp::sys_time{std::chrono::seconds{1704067200 + seconds}});
}

// A deterministic signing identity.  Seeds are 32 copies of `seed_byte`.
struct test_key {
    esmp::ed25519::pubkey_t pubkey;
    esmp::ed25519::seckey_t seckey;

    explicit test_key(unsigned char seed_byte) {
        ustring seed(32, seed_byte);
        std::tie(pubkey, seckey) = esmp::ed25519::ed25519_key_pair(seed);
    }

    std::string hex() const { return esmp::ed25519::pubkey_hex(pubkey); }

    // Signs `canonical` and returns the hex signature.
    std::string sign_hex(std::string_view canonical) const {
        auto sig = esmp::ed25519::sign(to_usv(seckey), to_usv(canonical));
        return oxenc::to_hex(sig.begin(), sig.end());
    }

    // Fills in `sender_pubkey` and `signature` the way a client does.
    nlohmann::json sign(nlohmann::json msg) const {
        msg["sender_pubkey"] = hex();
        msg["signature"] = sign_hex(esmp::canonical::canonicalize(msg));
        return msg;
    }
};

// Envelope builders.  `ts` strings are RFC 3339.
inline nlohmann::json sys_msg(
        std::string_view subtype,
        std::string_view group_id,
        std::string_view actor,
        std::string_view timestamp,
        nlohmann::json extra = nlohmann::json::object()) {
    nlohmann::json m{
            {"type", "system"},
            {"subtype", subtype},
            {"group_id", group_id},
            {"actor", actor},
            {"timestamp", timestamp}};
    m.update(extra);
    return m;
}

inline nlohmann::json text_to(std::vector<std::string> to, nlohmann::json body) {
    return {{"type", "text"}, {"to", std::move(to)}, {"body", std::move(body)}};
}

inline nlohmann::json group_text(std::string_view group_id, nlohmann::json body) {
    return {{"type", "text"}, {"group_id", group_id}, {"body", std::move(body)}};
}

// Creates a fresh directory under the system temp directory and removes it on destruction.
struct temp_dir {
    std::filesystem::path path;

    temp_dir() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("esmp-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path);
    }
    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;
};

// Runs `f` and returns the kind of the `protocol_error` it throws.  Fails the test if it does not
// throw one.
template <typename F>
esmp::Error error_kind(F&& f) {
    try {
        f();
    } catch (const esmp::protocol_error& e) {
        return e.kind();
    }
    throw std::logic_error{"expected a protocol_error"};
}
