#include "esmp/address.hpp"

#include "esmp/util.hpp"

namespace esmp {

bool is_valid_address(std::string_view addr) {
    auto hash = addr.find('#');
    if (hash == 0 || hash == std::string_view::npos || hash == addr.size() - 1 ||
        addr.find('#', hash + 1) != std::string_view::npos)
        return false;
    while (!addr.empty()) {
        int32_t cp = utf8_next(addr);
        if (cp < 0 || cp <= 0x20 || cp == 0x7f || (cp >= 0x80 && cp <= 0x9f))
            return false;
    }
    return true;
}

}  // namespace esmp
