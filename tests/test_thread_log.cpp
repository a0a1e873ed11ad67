#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <fstream>
#include <thread>

#include "esmp/thread_log.hpp"
#include "utils.hpp"

using namespace esmp;
using json = nlohmann::json;

TEST_CASE("Thread keys", "[thread_log]") {
    CHECK(group_thread_key("hikers") == "group:hikers");
    CHECK(direct_thread_key("bob#x", "alice#x") == "direct:alice#x|bob#x");
    CHECK(direct_thread_key("alice#x", "bob#x") == direct_thread_key("bob#x", "alice#x"));
    CHECK(group_id_of("group:hikers") == "hikers");
    CHECK_FALSE(group_id_of("direct:a#x|b#x"));
}

namespace {

void check_log_semantics(ThreadLog& log) {
    CHECK(log.read("group:g").empty());
    CHECK(log.threads().empty());

    CHECK(log.append("group:g", json{{"n", 1}}) == 1);
    CHECK(log.append("group:g", json{{"n", 2}}) == 2);
    CHECK(log.append("direct:a#x|b#x", json{{"n", 3}}) == 1);
    CHECK(log.append("group:g", json{{"n", 4}}) == 3);

    auto all = log.read("group:g");
    REQUIRE(all.size() == 3);
    CHECK(all[0].seqno == 1);
    CHECK(all[0].envelope["n"] == 1);
    CHECK(all[2].seqno == 3);
    CHECK(all[2].envelope["n"] == 4);

    auto page = log.read("group:g", 2, 1);
    REQUIRE(page.size() == 1);
    CHECK(page[0].seqno == 2);
    CHECK(log.read("group:g", 4).empty());

    auto threads = log.threads();
    CHECK(std::set<std::string>(threads.begin(), threads.end()) ==
          make_set("group:g"s, "direct:a#x|b#x"s));
}

}  // namespace

TEST_CASE("In-memory thread log", "[thread_log][memory]") {
    MemoryThreadLog log;
    check_log_semantics(log);
}

TEST_CASE("File thread log", "[thread_log][file]") {
    temp_dir tmp;
    {
        FileThreadLog log{tmp.path / "threads"};
        check_log_semantics(log);
    }

    // Sequence numbers continue after reopening and are never reused
    FileThreadLog reopened{tmp.path / "threads"};
    CHECK(reopened.read("group:g").size() == 3);
    CHECK(reopened.append("group:g", json{{"n", 5}}) == 4);
    CHECK(reopened.append("direct:a#x|b#x", json{{"n", 6}}) == 2);

    // Keys with path-hostile characters are stored safely
    CHECK(reopened.append("group:../../etc/passwd", json::object()) == 1);
    CHECK(reopened.read("group:../../etc/passwd").size() == 1);
}

TEST_CASE("File thread log reports corrupt files", "[thread_log][file]") {
    temp_dir tmp;
    FileThreadLog log{tmp.path};
    log.append("group:g", json{{"n", 1}});

    REQUIRE(log.threads().size() == 1);
    auto file = log.path_for("group:g");
    REQUIRE(std::filesystem::exists(file));
    {
        std::ofstream out{file, std::ios::app};
        out << "{not json\n";
    }
    CHECK_THROWS_AS(log.read("group:g"), storage_error);
}

TEST_CASE("File thread log handles long thread keys", "[thread_log][file]") {
    temp_dir tmp;
    auto long_group = group_thread_key(std::string(300, 'g'));
    auto long_direct = direct_thread_key(std::string(200, 'a') + "#x", std::string(200, 'b') + "#x");
    {
        FileThreadLog log{tmp.path};
        CHECK(log.append(long_group, json{{"n", 1}}) == 1);
        CHECK(log.append(long_group, json{{"n", 2}}) == 2);
        CHECK(log.append(long_direct, json{{"n", 3}}) == 1);

        auto file = log.path_for(long_group);
        CHECK(file.filename().string().size() < 100);
        CHECK(file != log.path_for(long_direct));
        CHECK(std::filesystem::exists(file));

        // The key itself is kept in every record
        std::ifstream in{file};
        std::string first;
        REQUIRE(std::getline(in, first));
        CHECK(json::parse(first)["thread"] == long_group);
    }

    FileThreadLog reopened{tmp.path};
    auto threads = reopened.threads();
    CHECK(std::set<std::string>(threads.begin(), threads.end()) ==
          make_set(long_group, long_direct));
    CHECK(reopened.read(long_group).size() == 2);
    CHECK(reopened.append(long_group, json{{"n", 4}}) == 3);
}

TEST_CASE("File thread log recovers from an interrupted write", "[thread_log][file]") {
    temp_dir tmp;
    std::filesystem::path file;
    {
        FileThreadLog log{tmp.path};
        log.append("group:g", json{{"n", 1}});
        log.append("group:g", json{{"n", 2}});
        file = log.path_for("group:g");
    }
    auto intact = std::filesystem::file_size(file);
    {
        std::ofstream out{file, std::ios::app};
        out << R"({"thread":"group:g","seqno":3,"envel)";
    }

    FileThreadLog log{tmp.path};
    auto records = log.read("group:g");
    REQUIRE(records.size() == 2);
    CHECK(records[1].envelope["n"] == 2);
    CHECK(log.threads() == std::vector{"group:g"s});

    // The partial line is cut off and numbering continues after the last complete record
    CHECK(log.append("group:g", json{{"n", 3}}) == 3);
    records = log.read("group:g");
    REQUIRE(records.size() == 3);
    CHECK(records[2].seqno == 3);
    CHECK(records[2].envelope["n"] == 3);
    CHECK(std::filesystem::file_size(file) > intact);
}

namespace {

// Checks that a failed `append_all` leaves no record behind and consumes no sequence number.
void check_append_all_rollback(ThreadLog& log) {
    CHECK(log.append("direct:a#x|b#x", json{{"n", 1}}) == 1);

    auto seqnos = log.append_all(
            make_set("direct:a#x|b#x"s, "direct:a#x|c#x"s), json{{"n", 2}});
    CHECK(seqnos == std::vector<seqno_t>{2, 1});

    bool committed = false;
    CHECK_THROWS_AS(
            log.append_all(
                    make_set("direct:a#x|b#x"s, "direct:a#x|c#x"s, "direct:a#x|d#x"s),
                    json{{"n", 3}},
                    [] { throw storage_error{"commit failed"}; }),
            storage_error);
    CHECK_FALSE(committed);

    CHECK(log.read("direct:a#x|b#x").size() == 2);
    CHECK(log.read("direct:a#x|c#x").size() == 1);
    CHECK(log.read("direct:a#x|d#x").empty());
    CHECK(log.threads().size() == 2);

    seqnos = log.append_all(
            make_set("direct:a#x|b#x"s, "direct:a#x|d#x"s),
            json{{"n", 4}},
            [&] { committed = true; });
    CHECK(committed);
    CHECK(seqnos == std::vector<seqno_t>{3, 1});
    auto b = log.read("direct:a#x|b#x");
    REQUIRE(b.size() == 3);
    CHECK(b[2].envelope["n"] == 4);
}

}  // namespace

TEST_CASE("Appending to several threads is all or nothing", "[thread_log][append_all]") {
    SECTION("memory") {
        MemoryThreadLog log;
        check_append_all_rollback(log);
    }
    SECTION("file") {
        temp_dir tmp;
        {
            FileThreadLog log{tmp.path};
            check_append_all_rollback(log);
        }
        // Nothing of the failed append survives on disk
        FileThreadLog reopened{tmp.path};
        CHECK(reopened.read("direct:a#x|c#x").size() == 1);
        CHECK(reopened.append("direct:a#x|c#x", json::object()) == 2);
    }
    SECTION("file, second write fails") {
        temp_dir tmp;
        FileThreadLog log{tmp.path};
        log.append("direct:a#x|b#x", json{{"n", 1}});
        auto size = std::filesystem::file_size(log.path_for("direct:a#x|b#x"));

        // A directory where the second thread's file belongs makes that write fail
        std::filesystem::create_directory(log.path_for("direct:a#x|z#x"));
        CHECK_THROWS_AS(
                log.append_all(make_set("direct:a#x|b#x"s, "direct:a#x|z#x"s), json{{"n", 2}}),
                storage_error);

        CHECK(std::filesystem::file_size(log.path_for("direct:a#x|b#x")) == size);
        CHECK(log.read("direct:a#x|b#x").size() == 1);
        CHECK(log.append("direct:a#x|b#x", json{{"n", 3}}) == 2);
    }
}

TEST_CASE("Concurrent appends get distinct sequence numbers", "[thread_log][concurrency]") {
    MemoryThreadLog log;
    constexpr int threads = 8, per_thread = 200;
    std::vector<std::thread> workers;
    std::vector<std::vector<seqno_t>> got(threads);
    for (int t = 0; t < threads; t++)
        workers.emplace_back([&, t] {
            for (int i = 0; i < per_thread; i++)
                got[t].push_back(log.append("group:busy", json{{"t", t}, {"i", i}}));
        });
    for (auto& w : workers)
        w.join();

    std::set<seqno_t> all;
    for (auto& g : got) {
        // Each writer sees its own appends in increasing order
        CHECK(std::is_sorted(g.begin(), g.end()));
        all.insert(g.begin(), g.end());
    }
    CHECK(all.size() == threads * per_thread);
    CHECK(*all.begin() == 1);
    CHECK(*all.rbegin() == threads * per_thread);
}
