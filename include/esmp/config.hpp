#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "engine.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace esmp {

/// Server settings.  Every field has a default; a JSON config file and command-line flags
/// override them in that order.
struct server_config {
    std::string listen_address = "127.0.0.1";
    uint16_t tcp_port = 5888;
    uint16_t http_port = 8080;
    std::filesystem::path data_dir = "esmp-data";
    size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES;
    // Empty means `data_dir / "server.key"`.
    std::filesystem::path secret_key_file;
    LogLevel log_level = LogLevel::info;

    /// The secret key file actually used.
    std::filesystem::path key_file() const;

    /// API: config/server_config::apply_json
    ///
    /// Overrides the fields present in `j`, an object with any of the keys `listen_address`,
    /// `tcp_port`, `http_port`, `data_dir`, `max_line_bytes`, `secret_key_file` and `log_level`.
    /// Throws std::invalid_argument for unknown keys or invalid values.
    void apply_json(const nlohmann::json& j);

    /// Reads a JSON config file and applies it.  Throws std::invalid_argument if the file cannot
    /// be read or parsed.
    void apply_file(const std::filesystem::path& file);

    /// Throws std::invalid_argument if the settings are inconsistent (zero ports or line size,
    /// empty listen address or data directory).
    void check() const;
};

/// API: config/parse_command_line
///
/// Builds the configuration from the command line.  `--config <file>` is applied first,
/// wherever it appears; then `--listen <addr>`, `--tcp-port <n>`, `--http-port <n>`,
/// `--data-dir <dir>`, `--max-line-bytes <n>`, `--secret-key-file <file>` and
/// `--log-level <level>` override individual settings.  Throws std::invalid_argument for unknown
/// or incomplete options.
server_config parse_command_line(int argc, const char* const argv[]);

/// API: config/load_or_create_secret
///
/// Reads the 32-byte server secret from `file` (64 hex digits, surrounding whitespace ignored).
/// If the file does not exist a random secret is generated and written to it, readable by the
/// owner only.  Throws std::invalid_argument if the file holds anything else, and
/// `storage_error` if it cannot be read or written.
cleared_array<32> load_or_create_secret(const std::filesystem::path& file);

}  // namespace esmp
