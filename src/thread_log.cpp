#include "esmp/thread_log.hpp"

#include <oxenc/hex.h>
#include <sodium/crypto_generichash_blake2b.h>

#include <array>
#include <fstream>
#include <iterator>

#include "esmp/error.hpp"
#include "esmp/util.hpp"

namespace esmp {

using namespace std::literals;

static constexpr auto GROUP_PREFIX = "group:"sv;
static constexpr auto DIRECT_PREFIX = "direct:"sv;
static constexpr auto THREAD_FILE_PREFIX = "thread-"sv;
static constexpr auto THREAD_FILE_SUFFIX = ".jsonl"sv;

std::string group_thread_key(std::string_view group_id) {
    std::string key{GROUP_PREFIX};
    key += group_id;
    return key;
}

std::string direct_thread_key(std::string_view a, std::string_view b) {
    if (b < a)
        std::swap(a, b);
    std::string key{DIRECT_PREFIX};
    key += a;
    key += '|';
    key += b;
    return key;
}

std::optional<std::string> group_id_of(std::string_view thread_key) {
    if (!starts_with(thread_key, GROUP_PREFIX))
        return std::nullopt;
    return std::string{thread_key.substr(GROUP_PREFIX.size())};
}

namespace {

    std::vector<thread_record> slice(
            const std::vector<nlohmann::json>& all, seqno_t from, size_t limit) {
        std::vector<thread_record> out;
        if (from < 1)
            from = 1;
        for (auto i = static_cast<size_t>(from - 1); i < all.size() && out.size() < limit; i++)
            out.push_back({static_cast<seqno_t>(i + 1), all[i]});
        return out;
    }

}  // namespace

seqno_t MemoryThreadLog::append(const std::string& thread_key, const nlohmann::json& envelope) {
    return append_all({thread_key}, envelope).front();
}

std::vector<seqno_t> MemoryThreadLog::append_all(
        const std::set<std::string>& thread_keys,
        const nlohmann::json& envelope,
        const std::function<void()>& commit) {
    return threads_.modify_all(thread_keys, [&](auto& slots) {
        std::vector<seqno_t> seqnos;
        size_t written = 0;
        try {
            for (auto* thread : slots) {
                if (!*thread)
                    thread->emplace();
                (*thread)->push_back(envelope);
                written++;
                seqnos.push_back(static_cast<seqno_t>((*thread)->size()));
            }
            if (commit)
                commit();
        } catch (...) {
            for (size_t i = 0; i < written; i++)
                (*slots[i])->pop_back();
            for (auto* thread : slots)
                if (*thread && (*thread)->empty())
                    thread->reset();
            throw;
        }
        return seqnos;
    });
}

std::vector<thread_record> MemoryThreadLog::read(
        const std::string& thread_key, seqno_t from, size_t limit) const {
    return threads_.read(thread_key, [&](const auto& thread) {
        return thread ? slice(*thread, from, limit) : std::vector<thread_record>{};
    });
}

std::vector<std::string> MemoryThreadLog::threads() const {
    return threads_.keys();
}

FileThreadLog::FileThreadLog(std::filesystem::path dir) : dir_{std::move(dir)} {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec)
        throw storage_error{"Unable to create thread log directory " + dir_.string() + ": " +
                            ec.message()};
}

std::filesystem::path FileThreadLog::path_for(std::string_view thread_key) const {
    std::array<unsigned char, 32> digest;
    crypto_generichash_blake2b(
            digest.data(),
            digest.size(),
            to_unsigned(thread_key.data()),
            thread_key.size(),
            nullptr,
            0);
    std::string name{THREAD_FILE_PREFIX};
    oxenc::to_hex(digest.begin(), digest.end(), std::back_inserter(name));
    name += THREAD_FILE_SUFFIX;
    return dir_ / name;
}

namespace {

    std::string read_file(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            throw storage_error{"Thread file " + path.string() + " is not a regular file"};
        std::ifstream in{path, std::ios::binary};
        if (!in)
            throw storage_error{"Unable to open thread file " + path.string()};
        std::string data{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        if (in.bad())
            throw storage_error{"Failed reading thread file " + path.string()};
        return data;
    }

    // Parses one complete line; throws storage_error if it is not a record of `thread_key`.
    thread_record parse_line(
            std::string_view line, const std::string& thread_key, const std::filesystem::path& path) {
        auto rec = nlohmann::json::parse(line, nullptr, false);
        if (rec.is_discarded() || !rec.is_object() || !rec.contains("thread") ||
            !rec["thread"].is_string() || !rec.contains("seqno") ||
            !rec["seqno"].is_number_integer() || !rec.contains("envelope"))
            throw storage_error{"Corrupt record in thread file " + path.string()};
        if (rec["thread"].get_ref<const std::string&>() != thread_key)
            throw storage_error{"Thread file " + path.string() + " belongs to another thread"};
        return {rec["seqno"].get<seqno_t>(), std::move(rec["envelope"])};
    }

    // Cuts `path` back to `size` bytes.
    void truncate_to(const std::filesystem::path& path, std::uintmax_t size, std::error_code& ec) {
        if (size == 0)
            std::filesystem::remove(path, ec);
        else
            std::filesystem::resize_file(path, size, ec);
    }

}  // namespace

FileThreadLog::loaded FileThreadLog::load(const std::string& thread_key) const {
    loaded out;
    auto path = path_for(thread_key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return out;

    auto data = read_file(path);
    std::string_view rest{data};
    // Only newline-terminated lines count; anything after the last newline is an interrupted
    // write.
    for (auto nl = rest.find('\n'); nl != std::string_view::npos; nl = rest.find('\n')) {
        auto line = rest.substr(0, nl);
        rest.remove_prefix(nl + 1);
        out.end.size += nl + 1;
        if (line.empty())
            continue;
        out.records.push_back(parse_line(line, thread_key, path));
        out.end.seqno = out.records.back().seqno;
    }
    return out;
}

seqno_t FileThreadLog::append(const std::string& thread_key, const nlohmann::json& envelope) {
    return append_all({thread_key}, envelope).front();
}

std::vector<seqno_t> FileThreadLog::append_all(
        const std::set<std::string>& thread_keys,
        const nlohmann::json& envelope,
        const std::function<void()>& commit) {
    return tails_.modify_all(thread_keys, [&](auto& tails) {
        struct undo {
            std::optional<tail>* t;
            tail before;
            std::filesystem::path path;
        };
        std::vector<undo> written;
        std::vector<seqno_t> seqnos;
        try {
            auto key = thread_keys.begin();
            for (auto* t : tails) {
                auto path = path_for(*key);
                if (!*t) {
                    auto end = load(*key).end;
                    // Drop an interrupted write left behind by an earlier crash.
                    std::error_code ec;
                    if (std::filesystem::exists(path, ec) &&
                        std::filesystem::file_size(path, ec) != end.size && !ec) {
                        truncate_to(path, end.size, ec);
                        if (ec)
                            throw storage_error{
                                    "Unable to repair thread file " + path.string() + ": " +
                                    ec.message()};
                    }
                    *t = end;
                }
                written.push_back({t, **t, path});

                seqno_t seqno = (*t)->seqno + 1;
                auto line = nlohmann::json{{"thread", *key}, {"seqno", seqno}, {"envelope", envelope}}
                                    .dump();
                line += '\n';
                std::ofstream out{path, std::ios::binary | std::ios::app};
                out << line;
                out.flush();
                if (!out)
                    throw storage_error{"Failed to append to thread file " + path.string()};

                **t = tail{seqno, (*t)->size + line.size()};
                seqnos.push_back(seqno);
                ++key;
            }
            if (commit)
                commit();
        } catch (...) {
            std::string failed;
            for (auto& w : written) {
                std::error_code ec;
                truncate_to(w.path, w.before.size, ec);
                if (ec) {
                    // Unknown length on disk: reload it on next use.
                    w.t->reset();
                    failed += " " + w.path.string() + ": " + ec.message();
                } else {
                    *w.t = w.before;
                }
            }
            if (!failed.empty())
                throw storage_error{"Unable to roll back thread append;" + failed};
            throw;
        }
        return seqnos;
    });
}

std::vector<thread_record> FileThreadLog::read(
        const std::string& thread_key, seqno_t from, size_t limit) const {
    // Reads take the thread's exclusive lock so they never see a half-written line.
    return tails_.modify(thread_key, [&](auto&) {
        std::vector<thread_record> out;
        for (auto& rec : load(thread_key).records) {
            if (out.size() >= limit)
                break;
            if (rec.seqno >= from)
                out.push_back(std::move(rec));
        }
        return out;
    });
}

std::vector<std::string> FileThreadLog::threads() const {
    std::vector<std::string> keys;
    std::error_code ec;
    for (std::filesystem::directory_iterator it{dir_, ec}, end; !ec && it != end; it.increment(ec)) {
        auto name = it->path().filename().string();
        if (!starts_with(name, THREAD_FILE_PREFIX) || !ends_with(name, THREAD_FILE_SUFFIX) ||
            !it->is_regular_file(ec))
            continue;
        // The key is stored in every record; the first complete line names it.
        auto data = read_file(it->path());
        auto nl = data.find('\n');
        if (nl == std::string::npos)
            continue;
        auto rec = nlohmann::json::parse(data.substr(0, nl), nullptr, false);
        if (rec.is_discarded() || !rec.is_object() || !rec.contains("thread") ||
            !rec["thread"].is_string())
            throw storage_error{"Corrupt record in thread file " + it->path().string()};
        auto key = rec["thread"].get<std::string>();
        if (it->path().filename() != path_for(key).filename())
            throw storage_error{"Thread file " + it->path().string() + " is misnamed"};
        keys.push_back(std::move(key));
    }
    if (ec)
        throw storage_error{"Unable to list thread log directory " + dir_.string()};
    return keys;
}

}  // namespace esmp
