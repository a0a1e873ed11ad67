#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "engine.hpp"
#include "group.hpp"
#include "logging.hpp"
#include "profile.hpp"
#include "thread_log.hpp"

namespace esmp {

struct http_response {
    int status = 200;
    nlohmann::json body;
};

/// Splits a request target into its percent-decoded path segments and query parameters.  Throws
/// std::invalid_argument on a malformed percent escape.
struct http_target {
    std::vector<std::string> path;
    std::map<std::string, std::string> query;

    static http_target parse(std::string_view target);
};

/// Percent-decodes `s` (`+` is left as is).  Throws std::invalid_argument on a bad escape.
std::string percent_decode(std::string_view s);

/// Transport-independent handler for the HTTP API:
///
/// - `GET /users/{pubkey}/profile[?as={pubkey}]`
/// - `PUT /users/{pubkey}/profile` with `{"fields":{...},"timestamp":"...","signature":"..."}`
/// - `GET /groups/{group_id}`
/// - `PUT /groups/{group_id}` with a signed `group_renamed`, `description_updated` or `dp_updated`
///   system message for that group, answered with the updated metadata
/// - `GET /groups/{group_id}/messages[?from=N&limit=M]`
///
/// Errors are answered with `{"error":"<kind>","message":"..."}`.
class HttpApi {
  public:
    /// Largest page `GET /groups/{id}/messages` returns, and its default size.
    static constexpr size_t MAX_PAGE = 1000;
    static constexpr size_t DEFAULT_PAGE = 100;

    /// Metadata updates go through `engine`, so they are verified, applied and logged exactly as
    /// on the wire protocol.  Everything passed in must outlive the handler.
    HttpApi(Engine& engine, ProfileStore& profiles, const Groups& groups, const ThreadLog& log);

    // If set then we log things by calling this callback
    Logger logger;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    /// API: http_api/HttpApi::handle
    ///
    /// Handles one request.  Never throws: storage and other internal faults become a 500
    /// response.
    ///
    /// Inputs:
    /// - `method` -- the request method, e.g. "GET".
    /// - `target` -- the request target, path plus optional query string.
    /// - `body` -- the request body (empty for GET).
    http_response handle(std::string_view method, std::string_view target, std::string_view body);

  private:
    http_response get_profile(const std::string& pubkey, const http_target& t) const;
    http_response put_profile(const std::string& pubkey, std::string_view body);
    http_response get_group(const std::string& group_id) const;
    http_response put_group(const std::string& group_id, std::string_view body);
    http_response get_messages(const std::string& group_id, const http_target& t) const;

    Engine& engine_;
    ProfileStore& profiles_;
    const Groups& groups_;
    const ThreadLog& log_;
};

}  // namespace esmp
