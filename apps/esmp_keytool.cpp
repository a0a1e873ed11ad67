#include <fmt/format.h>
#include <sodium/core.h>

#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <oxenc/hex.h>
#include <string>
#include <string_view>

#include "esmp/canonical.hpp"
#include "esmp/ed25519.hpp"
#include "esmp/error.hpp"
#include "esmp/util.hpp"

namespace {

using namespace std::literals;

void print_usage(const char* argv0) {
    fmt::print(
            stderr,
            "Usage:\n"
            "  {0} keygen                 print a new Ed25519 seed and public key\n"
            "  {0} sign SEED_HEX          sign an envelope read from stdin\n"
            "  {0} sign-profile SEED_HEX  sign a profile update body read from stdin\n",
            argv0);
}

esmp::ustring parse_seed(std::string_view hex) {
    if (hex.size() != 64 || !oxenc::is_hex(hex))
        throw std::invalid_argument{"seed must be 64 hex digits"};
    esmp::ustring seed;
    oxenc::from_hex(hex.begin(), hex.end(), std::back_inserter(seed));
    return seed;
}

// Reads a JSON object from stdin, sets `sender_pubkey` (if requested) and `signature`, and prints
// the signed object on one line.
void sign(std::string_view seed_hex, bool set_pubkey) {
    auto seed = parse_seed(seed_hex);
    auto [pk, sk] = esmp::ed25519::ed25519_key_pair(seed);
    esmp::sodium_zero_buffer(seed.data(), seed.size());

    auto msg = nlohmann::json::parse(std::cin);
    if (set_pubkey)
        msg[std::string{esmp::canonical::PUBKEY_FIELD}] = esmp::ed25519::pubkey_hex(pk);
    auto canonical = esmp::canonical::canonicalize(msg);
    auto sig = esmp::ed25519::sign(esmp::to_unsigned_sv(sk), esmp::to_unsigned_sv(canonical));
    esmp::sodium_zero_buffer(sk.data(), sk.size());
    msg[std::string{esmp::canonical::SIGNATURE_FIELD}] = oxenc::to_hex(sig.begin(), sig.end());
    fmt::print("{}\n", msg.dump());
}

void keygen() {
    esmp::cleared_array<32> seed;
    auto [pk, sk] = esmp::ed25519::ed25519_key_pair();
    std::copy(sk.begin(), sk.begin() + 32, seed.begin());
    esmp::sodium_zero_buffer(sk.data(), sk.size());
    nlohmann::json out{
            {"seed", oxenc::to_hex(seed.begin(), seed.end())},
            {"pubkey", esmp::ed25519::pubkey_hex(pk)}};
    fmt::print("{}\n", out.dump());
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }
    if (sodium_init() < 0) {
        fmt::print(stderr, "libsodium initialization failed\n");
        return 1;
    }

    std::string_view cmd{argv[1]};
    try {
        if (cmd == "keygen" && argc == 2)
            keygen();
        else if ((cmd == "sign" || cmd == "sign-profile") && argc == 3)
            sign(argv[2], cmd == "sign");
        else {
            print_usage(argv[0]);
            return 2;
        }
    } catch (const nlohmann::json::exception& e) {
        fmt::print(stderr, "invalid JSON input: {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }
    return 0;
}
