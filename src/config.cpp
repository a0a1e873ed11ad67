#include "esmp/config.hpp"

#include <sodium/core.h>
#include <sodium/randombytes.h>

#include <oxenc/hex.h>

#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>

#include "esmp/error.hpp"

namespace esmp {

using json = nlohmann::json;
using namespace std::literals;

namespace {

    template <typename Int>
    Int parse_number(std::string_view name, std::string_view s) {
        Int value{};
        auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || end != s.data() + s.size())
            throw std::invalid_argument{
                    "invalid " + std::string{name} + " '" + std::string{s} + "'"};
        return value;
    }

    template <typename Int>
    Int json_number(const std::string& name, const json& v) {
        if (!v.is_number_unsigned())
            throw std::invalid_argument{name + " must be a non-negative integer"};
        auto n = v.get<uint64_t>();
        if (n > std::numeric_limits<Int>::max())
            throw std::invalid_argument{name + " is out of range"};
        return static_cast<Int>(n);
    }

    std::string json_string(const std::string& name, const json& v) {
        if (!v.is_string())
            throw std::invalid_argument{name + " must be a string"};
        return v.get<std::string>();
    }

    std::string_view trim(std::string_view s) {
        constexpr auto ws = " \t\r\n"sv;
        auto b = s.find_first_not_of(ws);
        if (b == std::string_view::npos)
            return {};
        return s.substr(b, s.find_last_not_of(ws) - b + 1);
    }

}  // namespace

std::filesystem::path server_config::key_file() const {
    return secret_key_file.empty() ? data_dir / "server.key" : secret_key_file;
}

void server_config::apply_json(const json& j) {
    if (!j.is_object())
        throw std::invalid_argument{"config must be a JSON object"};
    for (auto& [key, v] : j.items()) {
        if (key == "listen_address")
            listen_address = json_string(key, v);
        else if (key == "tcp_port")
            tcp_port = json_number<uint16_t>(key, v);
        else if (key == "http_port")
            http_port = json_number<uint16_t>(key, v);
        else if (key == "data_dir")
            data_dir = json_string(key, v);
        else if (key == "max_line_bytes")
            max_line_bytes = json_number<size_t>(key, v);
        else if (key == "secret_key_file")
            secret_key_file = json_string(key, v);
        else if (key == "log_level")
            log_level = parse_log_level(json_string(key, v));
        else
            throw std::invalid_argument{"unknown config key '" + key + "'"};
    }
}

void server_config::apply_file(const std::filesystem::path& file) {
    std::ifstream in{file};
    if (!in)
        throw std::invalid_argument{"cannot read config file " + file.string()};
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument{"invalid config file " + file.string() + ": " + e.what()};
    }
    apply_json(j);
}

void server_config::check() const {
    if (listen_address.empty())
        throw std::invalid_argument{"listen address must not be empty"};
    if (tcp_port == 0 || http_port == 0)
        throw std::invalid_argument{"ports must be non-zero"};
    if (tcp_port == http_port)
        throw std::invalid_argument{"TCP and HTTP ports must differ"};
    if (max_line_bytes == 0)
        throw std::invalid_argument{"max_line_bytes must be non-zero"};
    if (data_dir.empty())
        throw std::invalid_argument{"data directory must not be empty"};
}

server_config parse_command_line(int argc, const char* const argv[]) {
    server_config conf;

    // --config is applied before anything else so that the other flags override it.
    for (int i = 1; i < argc; i++)
        if (argv[i] == "--config"sv) {
            if (i + 1 >= argc)
                throw std::invalid_argument{"--config requires a value"};
            conf.apply_file(argv[i + 1]);
        }

    for (int i = 1; i < argc; i++) {
        std::string_view flag{argv[i]};
        if (i + 1 >= argc)
            throw std::invalid_argument{
                    starts_with(flag, "--") ? std::string{flag} + " requires a value"
                                            : "unexpected argument '" + std::string{flag} + "'"};
        std::string_view value{argv[++i]};
        if (flag == "--config")
            continue;
        else if (flag == "--listen")
            conf.listen_address = value;
        else if (flag == "--tcp-port")
            conf.tcp_port = parse_number<uint16_t>("TCP port", value);
        else if (flag == "--http-port")
            conf.http_port = parse_number<uint16_t>("HTTP port", value);
        else if (flag == "--data-dir")
            conf.data_dir = value;
        else if (flag == "--max-line-bytes")
            conf.max_line_bytes = parse_number<size_t>("line limit", value);
        else if (flag == "--secret-key-file")
            conf.secret_key_file = value;
        else if (flag == "--log-level")
            conf.log_level = parse_log_level(value);
        else
            throw std::invalid_argument{"unknown option '" + std::string{flag} + "'"};
    }
    conf.check();
    return conf;
}

cleared_array<32> load_or_create_secret(const std::filesystem::path& file) {
    cleared_array<32> secret;
    std::error_code ec;

    if (!std::filesystem::exists(file, ec)) {
        if (sodium_init() < 0)
            throw std::runtime_error{"libsodium initialization failed"};
        randombytes_buf(secret.data(), secret.size());

        if (file.has_parent_path())
            std::filesystem::create_directories(file.parent_path(), ec);
        {
            std::ofstream out{file, std::ios::trunc};
            if (!out)
                throw storage_error{"cannot create secret key file " + file.string()};
            out << oxenc::to_hex(secret.begin(), secret.end()) << '\n';
            out.flush();
            if (!out)
                throw storage_error{"cannot write secret key file " + file.string()};
        }
        std::filesystem::permissions(
                file,
                std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                std::filesystem::perm_options::replace,
                ec);
        return secret;
    }

    std::ifstream in{file};
    if (!in)
        throw storage_error{"cannot read secret key file " + file.string()};
    std::stringstream buf;
    buf << in.rdbuf();
    auto contents = buf.str();
    auto hex = trim(contents);
    if (hex.size() != 64 || !oxenc::is_hex(hex)) {
        sodium_zero_buffer(contents.data(), contents.size());
        throw std::invalid_argument{
                "secret key file " + file.string() + " must contain 64 hex digits"};
    }
    oxenc::from_hex(hex.begin(), hex.end(), secret.begin());
    sodium_zero_buffer(contents.data(), contents.size());
    return secret;
}

}  // namespace esmp
