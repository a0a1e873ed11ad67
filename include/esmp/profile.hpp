#pragma once

#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "ed25519.hpp"
#include "keyed_store.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "util.hpp"

namespace esmp {

enum class Visibility { Public, Private };

/// "public" or "private"
std::string_view to_string(Visibility v);

template <typename T>
struct ProfileField {
    std::optional<T> value;
    Visibility visibility = Visibility::Private;

    bool is_public() const { return visibility == Visibility::Public; }
};

/// A stored profile.  The address value is ciphertext (see `encrypt::encrypt`) and its visibility
/// is always Private.
struct UserProfile {
    std::string pubkey;  // hex
    ProfileField<std::string> first_name;
    ProfileField<std::string> middle_name;
    ProfileField<std::string> last_name;
    ProfileField<std::string> display_picture;
    ProfileField<ustring> address;
    sys_time updated_at;

    /// Storage form: the address ciphertext is base64-encoded.
    nlohmann::json to_json() const;

    /// Inverse of `to_json`; throws std::invalid_argument on a malformed record.
    static UserProfile from_json(const nlohmann::json& j);
};

/// One field of a profile update.  `value` is absent to keep the stored value, holds
/// std::nullopt to clear it, or holds the new value.  `visibility` is absent to keep the stored
/// visibility.
struct field_update {
    std::optional<std::optional<std::string>> value;
    std::optional<Visibility> visibility;
};

/// A parsed profile update: the `fields` of a profile PUT request or the `changes` of a
/// `profile_updated` system message.  Fields not mentioned are left unchanged.
struct profile_update {
    std::optional<field_update> first_name;
    std::optional<field_update> middle_name;
    std::optional<field_update> last_name;
    std::optional<field_update> display_picture;
    std::optional<field_update> address;
    sys_time timestamp;

    /// API: profile/profile_update::parse
    ///
    /// Parses an update object such as
    /// `{"first_name": {"value": "Ada", "visibility": "public"}, "address": {"value": null}}`.
    /// Throws `protocol_error` with `Error::SchemaViolation` for unknown field names or values of
    /// the wrong JSON type; content rules (lengths, charsets, URLs) are checked by the store.
    static profile_update parse(const nlohmann::json& fields, sys_time timestamp);
};

/// What a reader is allowed to see of a profile.  Fields are present only when visible to the
/// reader; the address is only ever present (decrypted) for the owner.
struct ProfileView {
    std::string pubkey;
    bool owner = false;
    std::optional<ProfileField<std::string>> first_name;
    std::optional<ProfileField<std::string>> middle_name;
    std::optional<ProfileField<std::string>> last_name;
    std::optional<ProfileField<std::string>> display_picture;
    std::optional<ProfileField<std::string>> address;
    sys_time updated_at;

    nlohmann::json to_json() const;
};

namespace profile {

    inline constexpr size_t MAX_NAME_LENGTH = 50;
    inline constexpr size_t MAX_ADDRESS_LENGTH = 200;

    /// Encryption domain of stored addresses.
    inline constexpr std::string_view ADDRESS_DOMAIN = "esmp-profile-address";

    /// Throws `InvalidField` unless `value` is at most 50 characters of letters, spaces, hyphens
    /// and apostrophes.  `field` names the field in the error.
    void check_name(std::string_view field, std::string_view value);

    /// Throws `InvalidField` unless `value` is a well-formed absolute URL.
    void check_url(std::string_view field, std::string_view value);

    /// Throws `InvalidField` unless `value` is valid UTF-8 of at most 200 characters.
    void check_address(std::string_view value);

    /// True for Unicode letters (approximated: ASCII letters plus non-ASCII code points outside
    /// the punctuation, symbol, digit and emoji blocks).
    bool is_letter(int32_t cp);

    /// True if `url` is `scheme:rest` with a valid scheme, and, for hierarchical schemes (http,
    /// https, ws, wss, ftp), a `//` authority with a non-empty host and a valid port.
    bool is_valid_url(std::string_view url);

}  // namespace profile

/// Holds every user profile, keyed by the owner's public key.  Updates for one key are
/// serialized; different keys proceed in parallel.
class ProfileStore {
  public:
    /// `secret` is the 32-byte server-held secret used to derive address encryption keys.  Throws
    /// std::invalid_argument if it has the wrong size.
    explicit ProfileStore(ustring_view secret);

    ProfileStore(const ProfileStore&) = delete;
    ProfileStore& operator=(const ProfileStore&) = delete;

    // If set then we log things by calling this callback
    Logger logger;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    // Persistence hook, called with the new record while the profile's lock is held and before it
    // becomes visible.  If it throws (typically `storage_error`) the update is not applied.
    std::function<void(const UserProfile& profile)> on_store;

    /// API: profile/ProfileStore::apply_update
    ///
    /// Applies a signed update to the profile of `pubkey`, creating the profile if needed.
    ///
    /// Inputs:
    /// - `pubkey` -- the profile owner.
    /// - `update` -- the parsed update.
    /// - `signed_bytes` -- the canonical bytes the owner signed.
    /// - `signature` -- the encoded signature over `signed_bytes`.
    /// - `persist` -- optional; when given it is called (with the profile's lock held) instead of
    ///   `on_store` directly, and must call the `store` function it is passed.  Lets a caller
    ///   write other records in the same step: if `persist` throws the update is not applied.
    ///
    /// Outputs:
    /// - the stored profile after the update.  Throws `protocol_error` with `Forbidden` if the
    ///   signature does not verify against `pubkey`, `InvalidField` if a field breaks its rule, or
    ///   `StaleMutation` if `update.timestamp` is not after the stored `updated_at`.  Nothing is
    ///   changed when it throws.
    UserProfile apply_update(
            const ed25519::pubkey_t& pubkey,
            const profile_update& update,
            std::string_view signed_bytes,
            std::string_view signature,
            const std::function<void(const std::function<void()>& store)>& persist = nullptr);

    /// API: profile/ProfileStore::get_profile
    ///
    /// Returns the view of `pubkey`'s profile that `requester` may see: everything (address
    /// decrypted) when the requester is the owner, otherwise only the public fields and never the
    /// address.  An anonymous reader (std::nullopt) is a non-owner.
    ///
    /// Outputs:
    /// - the view, or std::nullopt if the profile was never created.
    std::optional<ProfileView> get_profile(
            const ed25519::pubkey_t& pubkey,
            const std::optional<ed25519::pubkey_t>& requester) const;

    /// Builds the owner's view of a stored profile (decrypting the address).
    ProfileView owner_view(const UserProfile& p) const;

    /// Restores a previously stored profile without validation or signature checks (startup
    /// reload).  Replaces any record for the same key.
    void load(UserProfile p);

    /// Number of stored profiles.
    size_t size() const { return profiles_.keys().size(); }

  private:
    ustring encrypt_address(std::string_view plaintext, const std::string& pubkey_hex) const;
    std::string decrypt_address(ustring_view ciphertext, const std::string& pubkey_hex) const;

    cleared_array<32> secret_;
    keyed_store<UserProfile> profiles_;
};

namespace profile {

    /// Writes `p` to `dir/<pubkey hex>.json`, atomically replacing any previous record (the
    /// record is written to a temporary file that is then renamed).  Throws `storage_error`.
    void write_record(const std::filesystem::path& dir, const UserProfile& p);

    /// Loads every `*.json` record under `dir` into `store`.  A missing directory loads nothing;
    /// unreadable records are skipped with a warning through the store's logger.
    ///
    /// Outputs:
    /// - the number of profiles loaded.
    size_t load_records(ProfileStore& store, const std::filesystem::path& dir);

}  // namespace profile

}  // namespace esmp
