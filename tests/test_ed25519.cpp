#include <oxenc/base64.h>
#include <oxenc/hex.h>

#include <catch2/catch_test_macros.hpp>

#include "esmp/ed25519.hpp"
#include "esmp/signature.hpp"
#include "utils.hpp"

using namespace esmp;

TEST_CASE("Ed25519 key pair generation", "[ed25519][keypair]") {
    // Generate two random key pairs and make sure they don't match
    auto kp1 = ed25519::ed25519_key_pair();
    auto kp2 = ed25519::ed25519_key_pair();

    CHECK(kp1.first != kp2.first);
    CHECK(kp1.second != kp2.second);
}

TEST_CASE("Ed25519 key pair generation seed", "[ed25519][keypair]") {
    auto ed_seed1 = "4cb76fdc6d32278e3f83dbf608360ecc6b65727934b85d2fb86862ff98c46ab7"_hexbytes;
    auto ed_seed_invalid = "010203040506070809"_hexbytes;

    auto kp1 = ed25519::ed25519_key_pair(ed_seed1);
    CHECK_THROWS_AS(ed25519::ed25519_key_pair(ed_seed_invalid), std::invalid_argument);

    CHECK(ed25519::pubkey_hex(kp1.first) ==
          "8862834829a87e0afadfed763fa8785e893dbde7f2c001ff1071aa55005c347f");
    CHECK(oxenc::to_hex(kp1.second.begin(), kp1.second.end()) ==
          "4cb76fdc6d32278e3f83dbf608360ecc6b65727934b85d2fb86862ff98c46ab7"
          "8862834829a87e0afadfed763fa8785e893dbde7f2c001ff1071aa55005c347f");
}

TEST_CASE("Ed25519 signing", "[ed25519][signature]") {
    auto ed_seed = "4cb76fdc6d32278e3f83dbf608360ecc6b65727934b85d2fb86862ff98c46ab7"_hexbytes;
    auto ed_pk = "8862834829a87e0afadfed763fa8785e893dbde7f2c001ff1071aa55005c347f"_hexbytes;
    auto ed_invalid = "010203040506070809"_hexbytes;

    auto sig1 = ed25519::sign(ed_seed, to_usv("hello"));
    CHECK_THROWS(ed25519::sign(ed_invalid, to_usv("hello")));

    auto expected_sig_hex =
            "e03b6e87a53d83f202f2501e9b52193dbe4a64c6503f88244948dee53271"
            "85011574589aa7b59bc9757f9b9c31b7be9c9212b92ac7c81e029ee21c338ee12405";
    CHECK(oxenc::to_hex(sig1.begin(), sig1.end()) == expected_sig_hex);

    // The 64-byte secret key signs identically to its seed
    auto kp = ed25519::ed25519_key_pair(ed_seed);
    CHECK(ed25519::sign(to_usv(kp.second), to_usv("hello")) == sig1);

    CHECK(ed25519::verify(to_usv(sig1), ed_pk, to_usv("hello")));
    CHECK_FALSE(ed25519::verify(to_usv(sig1), ed_pk, to_usv("hellp")));
    CHECK_THROWS(ed25519::verify(ed_invalid, ed_pk, to_usv("hello")));
    CHECK_THROWS(ed25519::verify(to_usv(sig1), ed_invalid, to_usv("hello")));
}

TEST_CASE("Public key and signature encodings", "[ed25519][encoding]") {
    auto pk_bytes = "8862834829a87e0afadfed763fa8785e893dbde7f2c001ff1071aa55005c347f"_hexbytes;
    ed25519::pubkey_t expected;
    std::copy(pk_bytes.begin(), pk_bytes.end(), expected.begin());

    auto hex = "8862834829a87e0afadfed763fa8785e893dbde7f2c001ff1071aa55005c347f"s;
    auto upper = "8862834829A87E0AFADFED763FA8785E893DBDE7F2C001FF1071AA55005C347F"s;
    auto b64 = oxenc::to_base64(pk_bytes.begin(), pk_bytes.end());
    auto b64_unpadded = b64.substr(0, b64.find('='));

    CHECK(ed25519::parse_pubkey(hex) == expected);
    CHECK(ed25519::parse_pubkey(upper) == expected);
    CHECK(ed25519::parse_pubkey(b64) == expected);
    CHECK(ed25519::parse_pubkey(b64_unpadded) == expected);

    CHECK_FALSE(ed25519::parse_pubkey(""));
    CHECK_FALSE(ed25519::parse_pubkey(hex.substr(2)));
    CHECK_FALSE(ed25519::parse_pubkey(hex + "00"));
    CHECK_FALSE(ed25519::parse_pubkey("not a key at all!"));

    // A signature-sized value is not a key and vice versa
    CHECK_FALSE(ed25519::parse_signature(hex));
    CHECK(ed25519::parse_signature(hex + hex));
}

TEST_CASE("Envelope signature verification", "[signature]") {
    test_key alice{0x01}, bob{0x02};
    auto canonical = R"({"body":"hi","to":["bob#example.org"],"type":"text"})"s;
    auto sig = alice.sign_hex(canonical);

    CHECK(signature::verify(to_usv(canonical), sig, alice.hex()));
    CHECK_FALSE(signature::verify(to_usv(canonical), sig, bob.hex()));
    CHECK_FALSE(signature::verify(to_usv(canonical + " "), sig, alice.hex()));

    // Base64 forms of both are accepted
    auto sig_bytes = *ed25519::parse_signature(sig);
    CHECK(signature::verify(
            to_usv(canonical),
            oxenc::to_base64(sig_bytes.begin(), sig_bytes.end()),
            oxenc::to_base64(alice.pubkey.begin(), alice.pubkey.end())));

    // Garbage never throws, it just fails
    CHECK_FALSE(signature::verify(to_usv(canonical), "", alice.hex()));
    CHECK_FALSE(signature::verify(to_usv(canonical), sig, ""));
    CHECK_FALSE(signature::verify(to_usv(canonical), "zz", "??"));
}
