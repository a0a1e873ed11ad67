#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <fstream>

#include "esmp/config.hpp"
#include "utils.hpp"

using namespace esmp;
using json = nlohmann::json;

TEST_CASE("Config defaults", "[config]") {
    server_config conf;
    CHECK(conf.tcp_port == 5888);
    CHECK(conf.http_port == 8080);
    CHECK(conf.max_line_bytes == 64_kiB);
    CHECK(conf.log_level == LogLevel::info);
    CHECK(conf.key_file() == conf.data_dir / "server.key");
    CHECK_NOTHROW(conf.check());
}

TEST_CASE("Config from JSON", "[config]") {
    server_config conf;
    conf.apply_json(json::parse(R"({
        "listen_address": "0.0.0.0",
        "tcp_port": 7000,
        "data_dir": "/var/lib/esmp",
        "secret_key_file": "/etc/esmp/key",
        "max_line_bytes": 1024,
        "log_level": "debug"
    })"));
    CHECK(conf.listen_address == "0.0.0.0");
    CHECK(conf.tcp_port == 7000);
    CHECK(conf.http_port == 8080);
    CHECK(conf.data_dir == "/var/lib/esmp");
    CHECK(conf.key_file() == "/etc/esmp/key");
    CHECK(conf.max_line_bytes == 1024);
    CHECK(conf.log_level == LogLevel::debug);

    CHECK_THROWS_AS((conf.apply_json(json{{"tcp_port", 70000}})), std::invalid_argument);
    CHECK_THROWS_AS((conf.apply_json(json{{"tcp_port", "80"}})), std::invalid_argument);
    CHECK_THROWS_AS((conf.apply_json(json{{"log_level", "loud"}})), std::invalid_argument);
    CHECK_THROWS_AS((conf.apply_json(json{{"colour", "blue"}})), std::invalid_argument);
    CHECK_THROWS_AS(conf.apply_json(json::array()), std::invalid_argument);
}

TEST_CASE("Config from the command line", "[config]") {
    temp_dir tmp;
    auto file = (tmp.path / "esmp.json").string();
    {
        std::ofstream out{file};
        out << R"({"tcp_port": 6000, "http_port": 6001, "log_level": "warning"})";
    }

    // Flags override the file no matter where --config appears
    const char* argv[] = {"esmp-server", "--http-port", "9000", "--config", file.c_str()};
    auto conf = parse_command_line(5, argv);
    CHECK(conf.tcp_port == 6000);
    CHECK(conf.http_port == 9000);
    CHECK(conf.log_level == LogLevel::warning);

    const char* unknown[] = {"esmp-server", "--frobnicate", "1"};
    CHECK_THROWS_AS(parse_command_line(3, unknown), std::invalid_argument);
    const char* missing[] = {"esmp-server", "--tcp-port"};
    CHECK_THROWS_AS(parse_command_line(2, missing), std::invalid_argument);
    const char* bad_port[] = {"esmp-server", "--tcp-port", "http"};
    CHECK_THROWS_AS(parse_command_line(3, bad_port), std::invalid_argument);
    const char* same_ports[] = {"esmp-server", "--tcp-port", "7000", "--http-port", "7000"};
    CHECK_THROWS_AS(parse_command_line(5, same_ports), std::invalid_argument);
    const char* no_file[] = {"esmp-server", "--config", "/nonexistent/esmp.json"};
    CHECK_THROWS_AS(parse_command_line(3, no_file), std::invalid_argument);
}

TEST_CASE("Server secret key file", "[config][secret]") {
    temp_dir tmp;
    auto file = tmp.path / "sub" / "server.key";

    auto created = load_or_create_secret(file);
    REQUIRE(std::filesystem::exists(file));
    auto reloaded = load_or_create_secret(file);
    CHECK(std::equal(created.begin(), created.end(), reloaded.begin()));

    auto perms = std::filesystem::status(file).permissions();
    CHECK((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none);

    {
        std::ofstream out{file, std::ios::trunc};
        out << "  000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f\n";
    }
    auto fixed = load_or_create_secret(file);
    CHECK(fixed[0] == 0x00);
    CHECK(fixed[31] == 0x1f);

    {
        std::ofstream out{file, std::ios::trunc};
        out << "too short";
    }
    CHECK_THROWS_AS(load_or_create_secret(file), std::invalid_argument);
}
