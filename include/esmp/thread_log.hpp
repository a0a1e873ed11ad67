#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "keyed_store.hpp"
#include "types.hpp"

namespace esmp {

/// Thread key of a group thread: "group:<group_id>".
std::string group_thread_key(std::string_view group_id);

/// Thread key of the direct thread between two participants: "direct:<a>|<b>" with the two
/// participant names in sorted order, so both directions share one thread.
std::string direct_thread_key(std::string_view a, std::string_view b);

/// Returns the group id of a group thread key, or std::nullopt for any other key.
std::optional<std::string> group_id_of(std::string_view thread_key);

struct thread_record {
    seqno_t seqno;
    nlohmann::json envelope;
};

/// Append-only, ordered persistence of accepted envelopes.  Implementations must be safe to call
/// concurrently; appends to one thread are totally ordered.
class ThreadLog {
  public:
    virtual ~ThreadLog() = default;

    /// API: thread_log/ThreadLog::append
    ///
    /// Appends an envelope to the end of a thread.
    ///
    /// Inputs:
    /// - `thread_key` -- a key made by `group_thread_key` or `direct_thread_key`.
    /// - `envelope` -- the accepted envelope, as received.
    ///
    /// Outputs:
    /// - the record's sequence number: 1 for the first record of a thread, then increasing by one
    ///   and never reused.  Throws `storage_error` if the record could not be stored, in which case
    ///   the sequence number is not consumed.
    virtual seqno_t append(const std::string& thread_key, const nlohmann::json& envelope) = 0;

    /// API: thread_log/ThreadLog::append_all
    ///
    /// Appends one envelope to several threads as a single unit.  All the threads are locked for
    /// the whole call.  Once every record is written `commit` (if given) is called, still under
    /// the locks; if any append or `commit` throws, every record this call wrote is removed again
    /// and the exception propagates, so either all threads get the record or none does.
    ///
    /// Outputs:
    /// - the sequence numbers, in the (sorted) order of `thread_keys`.
    virtual std::vector<seqno_t> append_all(
            const std::set<std::string>& thread_keys,
            const nlohmann::json& envelope,
            const std::function<void()>& commit = nullptr) = 0;

    /// API: thread_log/ThreadLog::read
    ///
    /// Returns up to `limit` records of a thread in sequence order, starting at sequence number
    /// `from`.  An unknown thread reads as empty.
    virtual std::vector<thread_record> read(
            const std::string& thread_key,
            seqno_t from = 1,
            size_t limit = std::numeric_limits<size_t>::max()) const = 0;

    /// Returns every thread key that has at least one record.
    virtual std::vector<std::string> threads() const = 0;
};

class MemoryThreadLog final : public ThreadLog {
  public:
    seqno_t append(const std::string& thread_key, const nlohmann::json& envelope) override;
    std::vector<seqno_t> append_all(
            const std::set<std::string>& thread_keys,
            const nlohmann::json& envelope,
            const std::function<void()>& commit = nullptr) override;
    std::vector<thread_record> read(
            const std::string& thread_key,
            seqno_t from = 1,
            size_t limit = std::numeric_limits<size_t>::max()) const override;
    std::vector<std::string> threads() const override;

  private:
    keyed_store<std::vector<nlohmann::json>> threads_;
};

/// Thread log storing each thread as a file of JSON lines
/// (`{"thread":"<key>","seqno":N,"envelope":{...}}`) under a data directory.  Files are named by
/// a BLAKE2b digest of the thread key, so keys of any length or content map to short, safe names.
///
/// A record is only durable once its line is complete.  A failed write is truncated away again;
/// an unterminated last line left by a crash is ignored on read and cut off before the next
/// append.
class FileThreadLog final : public ThreadLog {
  public:
    /// Creates `dir` if needed.  Throws `storage_error` if it cannot be created.
    explicit FileThreadLog(std::filesystem::path dir);

    seqno_t append(const std::string& thread_key, const nlohmann::json& envelope) override;
    std::vector<seqno_t> append_all(
            const std::set<std::string>& thread_keys,
            const nlohmann::json& envelope,
            const std::function<void()>& commit = nullptr) override;
    std::vector<thread_record> read(
            const std::string& thread_key,
            seqno_t from = 1,
            size_t limit = std::numeric_limits<size_t>::max()) const override;
    std::vector<std::string> threads() const override;

    const std::filesystem::path& directory() const { return dir_; }

    /// The file holding `thread_key`'s records.
    std::filesystem::path path_for(std::string_view thread_key) const;

  private:
    // End of a thread file: last sequence number and the size of its complete lines.
    struct tail {
        seqno_t seqno = 0;
        std::uintmax_t size = 0;
    };

    struct loaded {
        std::vector<thread_record> records;
        tail end;
    };

    loaded load(const std::string& thread_key) const;

    std::filesystem::path dir_;
    // Per thread, loaded from disk on first append.
    mutable keyed_store<tail> tails_;
};

}  // namespace esmp
