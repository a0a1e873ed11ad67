#include "esmp/canonical.hpp"

#include <cmath>

#include "esmp/error.hpp"

namespace esmp::canonical {

namespace {

    // nlohmann::json would silently write non-finite numbers as `null`, which would make two
    // different messages share one signature.
    void check_finite(const nlohmann::json& v) {
        switch (v.type()) {
            case nlohmann::json::value_t::number_float:
                if (!std::isfinite(v.get<double>()))
                    throw protocol_error{Error::MalformedInput, "non-finite number in message"};
                break;
            case nlohmann::json::value_t::object:
            case nlohmann::json::value_t::array:
                for (const auto& child : v)
                    check_finite(child);
                break;
            default: break;
        }
    }

}  // namespace

std::string canonicalize(const nlohmann::json& msg) {
    if (!msg.is_object())
        throw protocol_error{Error::MalformedInput, "message is not a JSON object"};
    check_finite(msg);

    // The default nlohmann::json object type is a std::map, so iteration (and thus dump) order is
    // already the sorted key order.
    nlohmann::json signed_part = msg;
    signed_part.erase(std::string{SIGNATURE_FIELD});
    signed_part.erase(std::string{PUBKEY_FIELD});

    try {
        return signed_part.dump();
    } catch (const nlohmann::json::type_error& e) {
        // type_error 316: invalid UTF-8 byte in a string
        throw protocol_error{Error::MalformedInput, std::string{"cannot canonicalize: "} + e.what()};
    }
}

}  // namespace esmp::canonical
