#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "group.hpp"
#include "logging.hpp"
#include "profile.hpp"
#include "thread_log.hpp"

namespace esmp {

/// Default limit on the size of one wire line.
inline constexpr size_t DEFAULT_MAX_LINE_BYTES = 64 * 1024;

/// Where an accepted envelope was stored.
struct stored_at {
    std::string thread;
    seqno_t seqno;
};

/// Result of processing one wire message.
struct outcome {
    bool ok = false;

    // Set when !ok
    std::optional<Error> error;
    std::string message;

    // Set when ok: "text" or the system subtype name.
    std::string kind;
    std::vector<stored_at> stored;
    // Addresses the envelope should be delivered to.
    std::set<std::string> recipients;

    /// The sequence number of the first record written, or 0 if nothing was written.
    seqno_t seqno() const { return stored.empty() ? 0 : stored.front().seqno; }

    /// The reply line sent back to the client:
    /// `{"ok":true,"kind":...,"seqno":...,"threads":[...]}` or
    /// `{"ok":false,"error":"<kind>","message":"..."}`.
    nlohmann::json reply() const;

    static outcome rejected(Error e, std::string message);
};

/// The message pipeline shared by every transport: parse, canonicalize, verify, validate, then
/// route to the group state machine, the profile store or the direct threads of the thread log.
class Engine {
  public:
    /// All three collaborators must outlive the engine.
    Engine(Groups& groups,
           ProfileStore& profiles,
           ThreadLog& log,
           size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES);

    // If set then we log things by calling this callback
    Logger logger;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    /// API: engine/Engine::process
    ///
    /// Processes one wire line (a JSON object, without the trailing newline).
    ///
    /// Protocol rejections are returned as a failed outcome and leave no trace: a message that
    /// does not verify or validate is never logged or applied.  Throws `storage_error` if the
    /// thread log or profile persistence fails.
    outcome process(std::string_view line);

    /// Same as `process`, for an already-parsed message (the line size is not checked).
    outcome process_message(const nlohmann::json& msg);

    size_t max_line_bytes() const { return max_line_bytes_; }

  private:
    outcome route(const Envelope& env, std::string_view canonical);
    // Stores `env` in the sender's direct thread with every recipient, all or none of them.
    // `commit` runs once every record is written; if it throws nothing is stored.
    outcome deliver_direct(
            const Envelope& env, std::string kind, const std::function<void()>& commit = nullptr);

    Groups& groups_;
    ProfileStore& profiles_;
    ThreadLog& log_;
    size_t max_line_bytes_;
};

}  // namespace esmp
