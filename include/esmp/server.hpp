#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>

#include "config.hpp"
#include "engine.hpp"
#include "http_api.hpp"
#include "logging.hpp"

namespace esmp {

/// TCP and HTTP listeners in front of an `Engine` and an `HttpApi`.  Each accepted connection is
/// served by its own thread with blocking socket I/O.
///
/// TCP connections carry one JSON object per line and get one reply line per input line.  A
/// client sending `{"bind":"<address>"}` additionally receives every accepted envelope whose
/// recipients include that address.  HTTP connections serve a single request each.
class Server {
  public:
    Server(const server_config& conf, Engine& engine, HttpApi& api);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // If set then we log things by calling this callback
    Logger logger;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    /// Binds both listeners and starts accepting.  Throws std::runtime_error if a socket cannot be
    /// set up.
    void start();

    /// Stops accepting, closes every connection and joins all threads.  Safe to call twice.
    void stop();

    struct connection {
        int fd = -1;
        std::string peer;
        std::thread thread;
        std::atomic<bool> done{false};

        /// Writes all of `data`, serialized with other writers.  Returns false once the socket
        /// has failed.
        bool send(std::string_view data);

        void bind(std::string address);
        bool bound_to_any(const std::set<std::string>& addresses) const;

      private:
        std::mutex send_mutex_;
        mutable std::mutex bind_mutex_;
        std::set<std::string> bound_;
    };

    /// API: server/Server::handle_line
    ///
    /// Processes one complete TCP line from `conn` and returns the reply line (without the
    /// newline).  Bind requests update `conn`; accepted envelopes are forwarded to the other
    /// bound connections.
    std::string handle_line(connection& conn, std::string_view line);

  private:
    void accept_loop(int listen_fd, bool http);
    void serve_tcp(const std::shared_ptr<connection>& conn);
    void serve_http(const std::shared_ptr<connection>& conn);
    void fan_out(const std::set<std::string>& recipients, std::string_view line,
                 const connection* origin);
    void reap();

    server_config conf_;
    Engine& engine_;
    HttpApi& api_;

    std::atomic<bool> running_{false};
    int tcp_fd_ = -1;
    int http_fd_ = -1;
    std::thread tcp_thread_;
    std::thread http_thread_;

    std::mutex conns_mutex_;
    std::list<std::shared_ptr<connection>> conns_;
};

/// Opens a listening IPv4 TCP socket on `address:port`.  Throws std::runtime_error on failure.
int listen_on(const std::string& address, uint16_t port);

}  // namespace esmp
