#include "esmp/signature.hpp"

#include "esmp/ed25519.hpp"
#include "esmp/util.hpp"

namespace esmp::signature {

bool verify(ustring_view canonical, std::string_view signature, std::string_view sender_pubkey) {
    auto pk = ed25519::parse_pubkey(sender_pubkey);
    auto sig = ed25519::parse_signature(signature);
    if (!pk || !sig)
        return false;
    return ed25519::verify(to_unsigned_sv(*sig), to_unsigned_sv(*pk), canonical);
}

}  // namespace esmp::signature
