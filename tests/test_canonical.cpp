#include <catch2/catch_test_macros.hpp>
#include <limits>

#include "esmp/canonical.hpp"
#include "esmp/signature.hpp"
#include "utils.hpp"

using namespace esmp;
using json = nlohmann::json;

TEST_CASE("Canonical form is compact and sorted", "[canonical]") {
    auto msg = json::parse(R"({
        "type": "text",
        "to": ["bob#example.org"],
        "body": {"z": 1, "a": [true, null, 2.5], "m": "é\n"},
        "signature": "00",
        "sender_pubkey": "11"
    })");
    CHECK(canonical::canonicalize(msg) ==
          R"({"body":{"a":[true,null,2.5],"m":"é\n","z":1},"to":["bob#example.org"],"type":"text"})");
}

TEST_CASE("Canonical form does not depend on wire key order", "[canonical]") {
    auto a = json::parse(
            R"({"type":"system","subtype":"joined","group_id":"g1","actor":"a#x","timestamp":"2024-01-01T00:00:00Z"})");
    auto b = json::parse(
            R"({"timestamp":"2024-01-01T00:00:00Z","actor":"a#x","group_id":"g1","subtype":"joined","type":"system"})");
    CHECK(canonical::canonicalize(a) == canonical::canonicalize(b));

    // A signature made over one ordering verifies for the other
    test_key k{0x11};
    auto signed_a = k.sign(a);
    b["sender_pubkey"] = signed_a["sender_pubkey"];
    b["signature"] = signed_a["signature"];
    CHECK(signature::verify(
            to_usv(canonical::canonicalize(b)),
            b["signature"].get<std::string>(),
            b["sender_pubkey"].get<std::string>()));
}

TEST_CASE("Any change to a signed field breaks the signature", "[canonical][signature]") {
    test_key k{0x22};
    auto msg = k.sign(text_to({"bob#example.org"}, {{"text", "hello"}}));

    auto verifies = [](const json& m) {
        return signature::verify(
                to_usv(canonical::canonicalize(m)),
                m["signature"].get<std::string>(),
                m["sender_pubkey"].get<std::string>());
    };
    CHECK(verifies(msg));

    auto tampered = msg;
    tampered["body"]["text"] = "hellp";
    CHECK_FALSE(verifies(tampered));

    tampered = msg;
    tampered["to"].push_back("eve#example.org");
    CHECK_FALSE(verifies(tampered));

    tampered = msg;
    tampered["extra"] = 1;
    CHECK_FALSE(verifies(tampered));

    tampered = msg;
    tampered["sender_pubkey"] = test_key{0x23}.hex();
    CHECK_FALSE(verifies(tampered));
}

TEST_CASE("Values that cannot be canonicalized", "[canonical]") {
    CHECK(error_kind([] { canonical::canonicalize(json::array()); }) == Error::MalformedInput);
    CHECK(error_kind([] { canonical::canonicalize(json("text")); }) == Error::MalformedInput);

    json nan{{"x", std::numeric_limits<double>::quiet_NaN()}};
    CHECK(error_kind([&] { canonical::canonicalize(nan); }) == Error::MalformedInput);
    json inf{{"y", {1, std::numeric_limits<double>::infinity()}}};
    CHECK(error_kind([&] { canonical::canonicalize(inf); }) == Error::MalformedInput);

    json bad_utf8{{"x", "\xff\xfe"}};
    CHECK(error_kind([&] { canonical::canonicalize(bad_utf8); }) == Error::MalformedInput);
}
