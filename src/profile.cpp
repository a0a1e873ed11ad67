#include "esmp/profile.hpp"

#include <sodium/core.h>

#include <algorithm>
#include <cctype>
#include <fstream>

#include <oxenc/base64.h>
#include <oxenc/hex.h>

#include "esmp/encrypt.hpp"
#include "esmp/error.hpp"
#include "esmp/signature.hpp"
#include "esmp/timestamp.hpp"

namespace esmp {

using namespace std::literals;

std::string_view to_string(Visibility v) {
    return v == Visibility::Public ? "public"sv : "private"sv;
}

namespace {

    Visibility parse_visibility(const nlohmann::json& j, std::string_view field) {
        if (j.is_string()) {
            const auto& s = j.get_ref<const std::string&>();
            if (s == "public")
                return Visibility::Public;
            if (s == "private")
                return Visibility::Private;
        }
        throw protocol_error{
                Error::SchemaViolation,
                std::string{field} + ".visibility must be \"public\" or \"private\""};
    }

    template <typename T, typename Encode>
    nlohmann::json field_json(const ProfileField<T>& f, Encode&& encode) {
        return {{"value", f.value ? nlohmann::json(encode(*f.value)) : nlohmann::json(nullptr)},
                {"visibility", to_string(f.visibility)}};
    }

    nlohmann::json field_json(const ProfileField<std::string>& f) {
        return field_json(f, [](const std::string& s) { return s; });
    }

    ProfileField<std::string> string_field(const nlohmann::json& j, const char* name) {
        ProfileField<std::string> f;
        auto it = j.find(name);
        if (it == j.end())
            return f;
        if (!it->is_object())
            throw std::invalid_argument{"profile record: " + std::string{name} + " is not an object"};
        if (auto v = it->find("value"); v != it->end() && !v->is_null())
            f.value = v->get<std::string>();
        if (auto v = it->find("visibility"); v != it->end())
            f.visibility = v->get<std::string>() == "public" ? Visibility::Public
                                                              : Visibility::Private;
        return f;
    }

    [[noreturn]] void invalid(std::string_view field, std::string_view why) {
        throw protocol_error{Error::InvalidField, std::string{field} + " " + std::string{why}};
    }

    bool is_scheme_char(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '+' || c == '-' || c == '.';
    }

    char ascii_lower(char c) {
        return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
    }

    bool valid_host(std::string_view host) {
        if (host.empty())
            return false;
        if (host.front() == '[') {
            if (host.size() < 3 || host.back() != ']')
                return false;
            for (char c : host.substr(1, host.size() - 2))
                if (!(std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.'))
                    return false;
            return true;
        }
        for (char c : host)
            if (c == '[' || c == ']' || c == '@' || c == '\\')
                return false;
        return true;
    }

    void apply_field(
            ProfileField<std::string>& field,
            const std::optional<field_update>& upd) {
        if (!upd)
            return;
        if (upd->value)
            field.value = *upd->value;
        if (upd->visibility)
            field.visibility = *upd->visibility;
    }

}  // namespace

nlohmann::json UserProfile::to_json() const {
    return {{"pubkey", pubkey},
            {"first_name", field_json(first_name)},
            {"middle_name", field_json(middle_name)},
            {"last_name", field_json(last_name)},
            {"display_picture", field_json(display_picture)},
            {"address",
             field_json(address, [](const ustring& c) { return oxenc::to_base64(c); })},
            {"updated_at", to_rfc3339(updated_at)}};
}

UserProfile UserProfile::from_json(const nlohmann::json& j) {
    if (!j.is_object())
        throw std::invalid_argument{"profile record is not an object"};
    UserProfile p;
    try {
        p.pubkey = j.at("pubkey").get<std::string>();
        p.first_name = string_field(j, "first_name");
        p.middle_name = string_field(j, "middle_name");
        p.last_name = string_field(j, "last_name");
        p.display_picture = string_field(j, "display_picture");
        auto addr = string_field(j, "address");
        if (addr.value) {
            if (!oxenc::is_base64(*addr.value))
                throw std::invalid_argument{"profile record: address is not base64"};
            auto bytes = oxenc::from_base64(*addr.value);
            p.address.value.emplace(bytes.begin(), bytes.end());
        }
        p.address.visibility = Visibility::Private;
        auto ts = parse_rfc3339(j.at("updated_at").get<std::string>());
        if (!ts)
            throw std::invalid_argument{"profile record: invalid updated_at"};
        p.updated_at = *ts;
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument{"profile record: "s + e.what()};
    }
    if (p.pubkey.size() != 64 || !oxenc::is_hex(p.pubkey))
        throw std::invalid_argument{"profile record: invalid pubkey"};
    return p;
}

profile_update profile_update::parse(const nlohmann::json& fields, sys_time timestamp) {
    if (!fields.is_object())
        throw protocol_error{Error::SchemaViolation, "profile fields must be an object"};

    profile_update u;
    u.timestamp = timestamp;
    for (auto& [name, val] : fields.items()) {
        std::optional<field_update>* slot = nullptr;
        if (name == "first_name")
            slot = &u.first_name;
        else if (name == "middle_name")
            slot = &u.middle_name;
        else if (name == "last_name")
            slot = &u.last_name;
        else if (name == "display_picture")
            slot = &u.display_picture;
        else if (name == "address")
            slot = &u.address;
        else
            throw protocol_error{Error::SchemaViolation, "unknown profile field '" + name + "'"};

        if (!val.is_object())
            throw protocol_error{Error::SchemaViolation, name + " must be an object"};

        field_update fu;
        if (auto v = val.find("value"); v != val.end()) {
            if (v->is_null())
                fu.value.emplace(std::nullopt);
            else if (v->is_string())
                fu.value.emplace(v->get<std::string>());
            else
                throw protocol_error{
                        Error::SchemaViolation, name + ".value must be a string or null"};
        }
        if (auto v = val.find("visibility"); v != val.end() && !v->is_null())
            fu.visibility = parse_visibility(*v, name);
        *slot = std::move(fu);
    }
    return u;
}

nlohmann::json ProfileView::to_json() const {
    nlohmann::json j{{"pubkey", pubkey}, {"updated_at", to_rfc3339(updated_at)}};
    auto add = [&j](const char* name, const std::optional<ProfileField<std::string>>& f) {
        if (f)
            j[name] = field_json(*f);
    };
    add("first_name", first_name);
    add("middle_name", middle_name);
    add("last_name", last_name);
    add("display_picture", display_picture);
    add("address", address);
    return j;
}

namespace profile {

    bool is_letter(int32_t cp) {
        if (cp < 0x80)
            return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
        // Latin-1 controls, punctuation and symbols, except the feminine/masculine ordinals and
        // micro sign which are letters.
        if (cp <= 0xBF)
            return cp == 0xAA || cp == 0xB5 || cp == 0xBA;
        if (cp == 0xD7 || cp == 0xF7)
            return false;
        // Arabic-Indic, extended Arabic-Indic and Devanagari digits
        if ((cp >= 0x0660 && cp <= 0x0669) || (cp >= 0x06F0 && cp <= 0x06F9) ||
            (cp >= 0x0966 && cp <= 0x096F))
            return false;
        // General punctuation through miscellaneous symbols and arrows, supplemental punctuation,
        // CJK symbols and punctuation
        if ((cp >= 0x2000 && cp <= 0x2BFF) || (cp >= 0x2E00 && cp <= 0x2E7F) ||
            (cp >= 0x3000 && cp <= 0x303F))
            return false;
        // Private use, variation selectors, specials, emoji and pictographs
        if ((cp >= 0xE000 && cp <= 0xF8FF) || (cp >= 0xFE00 && cp <= 0xFE0F) ||
            (cp >= 0xFFF0 && cp <= 0xFFFF) || (cp >= 0x1F000 && cp <= 0x1FAFF) || cp >= 0xF0000)
            return false;
        // Fullwidth digits and punctuation
        if ((cp >= 0xFF00 && cp <= 0xFF20) || (cp >= 0xFF3B && cp <= 0xFF40) ||
            (cp >= 0xFF5B && cp <= 0xFF65))
            return false;
        return true;
    }

    bool is_valid_url(std::string_view url) {
        auto colon = url.find(':');
        if (colon == std::string_view::npos || colon == 0)
            return false;
        auto scheme = url.substr(0, colon);
        if (!((scheme[0] >= 'a' && scheme[0] <= 'z') || (scheme[0] >= 'A' && scheme[0] <= 'Z')))
            return false;
        for (char c : scheme)
            if (!is_scheme_char(c))
                return false;

        auto rest = url.substr(colon + 1);
        if (rest.empty())
            return false;
        if (utf8_length(rest) == std::string_view::npos)
            return false;
        for (unsigned char c : rest)
            if (c <= 0x20 || c == 0x7f)
                return false;

        std::string lower;
        for (char c : scheme)
            lower += ascii_lower(c);
        const bool hierarchical = lower == "http" || lower == "https" || lower == "ws" ||
                                  lower == "wss" || lower == "ftp";
        if (!hierarchical)
            return true;

        if (!starts_with(rest, "//"))
            return false;
        auto authority = rest.substr(2);
        authority = authority.substr(0, authority.find_first_of("/?#"));
        if (auto at = authority.rfind('@'); at != std::string_view::npos)
            authority.remove_prefix(at + 1);

        std::string_view host = authority, port;
        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string_view::npos)
                return false;
            host = authority.substr(0, close + 1);
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':')
                    return false;
                port = after.substr(1);
            }
        } else if (auto pc = authority.rfind(':'); pc != std::string_view::npos) {
            host = authority.substr(0, pc);
            port = authority.substr(pc + 1);
        }
        if (!valid_host(host))
            return false;
        if (!port.empty()) {
            if (port.size() > 5)
                return false;
            unsigned value = 0;
            for (char c : port) {
                if (c < '0' || c > '9')
                    return false;
                value = value * 10 + static_cast<unsigned>(c - '0');
            }
            if (value > 65535)
                return false;
        }
        return true;
    }

    void check_name(std::string_view field, std::string_view value) {
        auto len = utf8_length(value);
        if (len == std::string_view::npos)
            invalid(field, "is not valid UTF-8");
        if (len > MAX_NAME_LENGTH)
            invalid(field, "is longer than 50 characters");
        auto rest = value;
        while (!rest.empty()) {
            auto cp = utf8_next(rest);
            if (cp == ' ' || cp == '-' || cp == '\'' || cp == 0x2019)
                continue;
            // Combining diacritical marks, for decomposed accented names
            if (cp >= 0x0300 && cp <= 0x036F)
                continue;
            if (!is_letter(cp))
                invalid(field, "may only contain letters, spaces, hyphens and apostrophes");
        }
    }

    void check_url(std::string_view field, std::string_view value) {
        if (!is_valid_url(value))
            invalid(field, "is not a valid absolute URL");
    }

    void check_address(std::string_view value) {
        auto len = utf8_length(value);
        if (len == std::string_view::npos)
            invalid("address", "is not valid UTF-8");
        if (len > MAX_ADDRESS_LENGTH)
            invalid("address", "is longer than 200 characters");
    }

}  // namespace profile

ProfileStore::ProfileStore(ustring_view secret) {
    if (secret.size() != secret_.size())
        throw std::invalid_argument{"ProfileStore requires a 32-byte secret"};
    if (sodium_init() < 0)
        throw std::runtime_error{"libsodium initialization failed"};
    std::copy(secret.begin(), secret.end(), secret_.begin());
}

ustring ProfileStore::encrypt_address(
        std::string_view plaintext, const std::string& pubkey_hex) const {
    return encrypt::encrypt(
            to_unsigned_sv(plaintext),
            to_unsigned_sv(secret_),
            profile::ADDRESS_DOMAIN,
            to_unsigned_sv(pubkey_hex));
}

std::string ProfileStore::decrypt_address(
        ustring_view ciphertext, const std::string& pubkey_hex) const {
    auto plain = encrypt::decrypt(
            ciphertext, to_unsigned_sv(secret_), profile::ADDRESS_DOMAIN, to_unsigned_sv(pubkey_hex));
    return std::string{from_unsigned_sv(plain)};
}

UserProfile ProfileStore::apply_update(
        const ed25519::pubkey_t& pubkey,
        const profile_update& update,
        std::string_view signed_bytes,
        std::string_view signature,
        const std::function<void(const std::function<void()>& store)>& persist) {
    const auto pk_hex = ed25519::pubkey_hex(pubkey);

    if (!signature::verify(to_unsigned_sv(signed_bytes), signature, pk_hex))
        throw protocol_error{
                Error::Forbidden, "profile update is not signed by the profile owner"};

    auto check_names = [](const char* name, const std::optional<field_update>& f) {
        if (f && f->value && *f->value)
            profile::check_name(name, **f->value);
    };
    check_names("first_name", update.first_name);
    check_names("middle_name", update.middle_name);
    check_names("last_name", update.last_name);
    if (update.display_picture && update.display_picture->value && *update.display_picture->value)
        profile::check_url("display_picture", **update.display_picture->value);
    if (update.address && update.address->value && *update.address->value)
        profile::check_address(**update.address->value);

    // Encrypt outside the lock; the ciphertext only depends on the owner.
    std::optional<std::optional<ustring>> address;
    if (update.address && update.address->value) {
        if (*update.address->value)
            address.emplace(encrypt_address(**update.address->value, pk_hex));
        else
            address.emplace(std::nullopt);
    }

    return profiles_.modify(pk_hex, [&](std::optional<UserProfile>& current) {
        if (current && update.timestamp <= current->updated_at)
            throw protocol_error{
                    Error::StaleMutation,
                    "profile update at " + to_rfc3339(update.timestamp) +
                            " is not newer than " + to_rfc3339(current->updated_at)};

        UserProfile next;
        if (current)
            next = *current;
        else
            next.pubkey = pk_hex;

        apply_field(next.first_name, update.first_name);
        apply_field(next.middle_name, update.middle_name);
        apply_field(next.last_name, update.last_name);
        apply_field(next.display_picture, update.display_picture);
        if (address)
            next.address.value = *address;
        next.address.visibility = Visibility::Private;
        next.updated_at = update.timestamp;

        auto store = [&] {
            if (on_store)
                on_store(next);
        };
        if (persist)
            persist(store);
        else
            store();

        log(LogLevel::info,
            (current ? "updated profile " : "created profile ") + pk_hex + " at " +
                    to_rfc3339(next.updated_at));
        current = next;
        return next;
    });
}

ProfileView ProfileStore::owner_view(const UserProfile& p) const {
    ProfileView v;
    v.pubkey = p.pubkey;
    v.owner = true;
    v.first_name = p.first_name;
    v.middle_name = p.middle_name;
    v.last_name = p.last_name;
    v.display_picture = p.display_picture;
    ProfileField<std::string> addr;
    addr.visibility = Visibility::Private;
    if (p.address.value)
        addr.value = decrypt_address(*p.address.value, p.pubkey);
    v.address = std::move(addr);
    v.updated_at = p.updated_at;
    return v;
}

std::optional<ProfileView> ProfileStore::get_profile(
        const ed25519::pubkey_t& pubkey,
        const std::optional<ed25519::pubkey_t>& requester) const {
    auto p = profiles_.get(ed25519::pubkey_hex(pubkey));
    if (!p)
        return std::nullopt;
    if (requester && *requester == pubkey)
        return owner_view(*p);

    ProfileView v;
    v.pubkey = p->pubkey;
    v.updated_at = p->updated_at;
    auto pub = [](const ProfileField<std::string>& f) -> std::optional<ProfileField<std::string>> {
        if (f.is_public())
            return f;
        return std::nullopt;
    };
    v.first_name = pub(p->first_name);
    v.middle_name = pub(p->middle_name);
    v.last_name = pub(p->last_name);
    v.display_picture = pub(p->display_picture);
    return v;
}

void ProfileStore::load(UserProfile p) {
    auto key = p.pubkey;
    profiles_.modify(key, [&](std::optional<UserProfile>& current) { current = std::move(p); });
}

namespace profile {

    void write_record(const std::filesystem::path& dir, const UserProfile& p) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            throw storage_error{"cannot create profile directory " + dir.string() + ": " +
                                ec.message()};

        auto file = dir / (p.pubkey + ".json");
        auto tmp = dir / (p.pubkey + ".json.tmp");
        {
            std::ofstream out{tmp, std::ios::trunc};
            out << p.to_json().dump() << '\n';
            out.flush();
            if (!out)
                throw storage_error{"cannot write profile record " + tmp.string()};
        }
        std::filesystem::rename(tmp, file, ec);
        if (ec)
            throw storage_error{"cannot replace profile record " + file.string() + ": " +
                                ec.message()};
    }

    size_t load_records(ProfileStore& store, const std::filesystem::path& dir) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec))
            return 0;

        size_t loaded = 0;
        for (const auto& entry : std::filesystem::directory_iterator{dir, ec}) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
                continue;
            try {
                std::ifstream in{entry.path()};
                auto p = UserProfile::from_json(nlohmann::json::parse(in));
                if (entry.path().stem().string() != p.pubkey)
                    throw std::invalid_argument{"record does not match its file name"};
                store.load(std::move(p));
                loaded++;
            } catch (const std::exception& e) {
                store.log(LogLevel::warning,
                          "skipping profile record " + entry.path().string() + ": " + e.what());
            }
        }
        if (ec)
            throw storage_error{"cannot list profile directory " + dir.string() + ": " +
                                ec.message()};
        return loaded;
    }

}  // namespace profile

}  // namespace esmp
