#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>

#include "envelope.hpp"
#include "keyed_store.hpp"
#include "logging.hpp"
#include "thread_log.hpp"
#include "types.hpp"

namespace esmp {

/// Metadata and membership of one group.  Invariant: `admins` is a subset of `members`.
struct GroupMetadata {
    std::string group_id;
    std::optional<std::string> group_name;
    std::optional<std::string> group_description;
    std::optional<std::string> group_dp_url;
    std::set<std::string> admins;
    std::set<std::string> members;
    sys_time created_at;
    // Timestamp of the last applied mutation; equal to `created_at` until the first one.
    sys_time updated_at;

    bool is_member(const std::string& addr) const { return members.count(addr) > 0; }
    bool is_admin(const std::string& addr) const { return admins.count(addr) > 0; }

    /// API: group/GroupMetadata::may
    ///
    /// The access-control predicate: may `actor` perform `subtype` on this (existing) group?
    /// `joined` requires not being a member yet, `left` requires being a member, and every other
    /// mutating subtype requires being an admin.  `group_created` is never allowed on an existing
    /// group and `profile_updated` does not apply to groups.
    bool may(const std::string& actor, SystemSubtype subtype) const;

    /// JSON form used by the HTTP API: timestamps as RFC 3339, sets as sorted arrays, absent
    /// metadata as null.
    nlohmann::json to_json() const;
};

/// Result of an accepted group transition or group post.
struct group_outcome {
    GroupMetadata metadata;  // state after the message
    seqno_t seqno;           // position of the message in the group thread
    // Addresses the message should be delivered to: the members after the transition, plus a
    // member that just left or was removed.
    std::set<std::string> recipients;
};

/// The group state machine.  Owns every group's metadata and is the only code path that mutates
/// it.  Mutations of one group are serialized; different groups proceed in parallel.
class Groups {
  public:
    /// `log` receives one record per accepted message and must outlive this object.
    explicit Groups(ThreadLog& log);

    // If set then we log things by calling this callback
    Logger logger;

    // Invokes the `logger` callback if set, does nothing if there is no logger.
    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    /// API: group/Groups::apply
    ///
    /// Applies a group system message.  Under the group's exclusive lock this checks, in order:
    /// that the group exists (`UnknownGroup`) or, for `group_created`, does not (`DuplicateGroup`);
    /// that the timestamp is strictly newer than `updated_at` (`StaleMutation`); and that the
    /// actor may perform the action and its precondition holds (`Forbidden`).  The message is then
    /// appended to the group thread and the new state committed.  If the append throws
    /// `storage_error` the state is left unchanged.
    ///
    /// Inputs:
    /// - `env` -- a validated envelope carrying a group-affecting system message.
    ///
    /// Outputs:
    /// - the new state, the thread sequence number and the delivery set.
    group_outcome apply(const Envelope& env);

    /// API: group/Groups::post
    ///
    /// Appends a text message to a group thread.  Throws `UnknownGroup` if the group was never
    /// created.  The append happens under the group's lock so it is ordered with respect to
    /// membership changes.
    group_outcome post(const Envelope& env);

    /// Returns a snapshot of a group's metadata.
    std::optional<GroupMetadata> get(const std::string& group_id) const;

    /// Returns whether `actor` may currently perform `subtype` on `group_id`.  For an unknown group
    /// only `group_created` is allowed.
    bool authorized(const std::string& group_id, const std::string& actor, SystemSubtype subtype)
            const;

    /// API: group/Groups::replay
    ///
    /// Rebuilds group state from the group threads of `source` without writing to the log: every
    /// system record is re-verified, re-validated and re-applied in sequence order.  Records that
    /// no longer verify or apply are skipped with a warning.  Intended for startup, before any
    /// message is processed.
    ///
    /// Outputs:
    /// - the number of groups that exist afterwards.
    size_t replay(const ThreadLog& source);

    /// API: group/Groups::transition
    ///
    /// The pure state transition used by `apply` and `replay`: returns the metadata that results
    /// from applying `msg` to `current` (std::nullopt if the group does not exist yet).  Throws
    /// `protocol_error` as described for `apply`.
    static GroupMetadata transition(
            const std::optional<GroupMetadata>& current,
            const std::string& group_id,
            const system_message& msg);

  private:
    ThreadLog& log_;
    keyed_store<GroupMetadata> groups_;
};

}  // namespace esmp
