#include "esmp/server.hpp"

#include <arpa/inet.h>
#include <fmt/format.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "esmp/address.hpp"
#include "esmp/error.hpp"
#include "esmp/framing.hpp"
#include "esmp/util.hpp"

namespace esmp {

using json = nlohmann::json;

namespace {

    constexpr size_t MAX_HTTP_HEADER_BYTES = 16 * 1024;

    // Replies may quote client bytes (e.g. in a parse error), which need not be valid UTF-8.
    std::string reply_line(const json& j) {
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::string_view reason_phrase(int status) {
        switch (status) {
            case 200: return "OK";
            case 400: return "Bad Request";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 413: return "Payload Too Large";
            default: return "Internal Server Error";
        }
    }

    char ascii_lower(char c) {
        return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
    }

    bool iequals(std::string_view a, std::string_view b) {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); i++)
            if (ascii_lower(a[i]) != ascii_lower(b[i]))
                return false;
        return true;
    }

}  // namespace

int listen_on(const std::string& address, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
        throw std::runtime_error{fmt::format("invalid listen address '{}'", address)};

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        throw std::runtime_error{fmt::format("socket() failed: {}", std::strerror(errno))};
    int yes = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error{
                fmt::format("bind({}:{}) failed: {}", address, port, std::strerror(err))};
    }
    if (::listen(fd, SOMAXCONN) < 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error{
                fmt::format("listen({}:{}) failed: {}", address, port, std::strerror(err))};
    }
    return fd;
}

bool Server::connection::send(std::string_view data) {
    std::lock_guard lock{send_mutex_};
    while (!data.empty()) {
        auto n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

void Server::connection::bind(std::string address) {
    std::lock_guard lock{bind_mutex_};
    bound_.insert(std::move(address));
}

bool Server::connection::bound_to_any(const std::set<std::string>& addresses) const {
    std::lock_guard lock{bind_mutex_};
    for (const auto& a : bound_)
        if (addresses.count(a))
            return true;
    return false;
}

Server::Server(const server_config& conf, Engine& engine, HttpApi& api) :
        conf_{conf}, engine_{engine}, api_{api} {}

Server::~Server() {
    stop();
}

void Server::start() {
    tcp_fd_ = listen_on(conf_.listen_address, conf_.tcp_port);
    try {
        http_fd_ = listen_on(conf_.listen_address, conf_.http_port);
    } catch (...) {
        ::close(tcp_fd_);
        tcp_fd_ = -1;
        throw;
    }
    running_ = true;
    tcp_thread_ = std::thread{[this] { accept_loop(tcp_fd_, false); }};
    http_thread_ = std::thread{[this] { accept_loop(http_fd_, true); }};
    log(LogLevel::info,
        fmt::format(
                "listening on {}:{} (tcp) and {}:{} (http)",
                conf_.listen_address,
                conf_.tcp_port,
                conf_.listen_address,
                conf_.http_port));
}

void Server::stop() {
    if (!running_.exchange(false))
        return;

    for (int fd : {tcp_fd_, http_fd_})
        ::shutdown(fd, SHUT_RDWR);
    if (tcp_thread_.joinable())
        tcp_thread_.join();
    if (http_thread_.joinable())
        http_thread_.join();
    ::close(tcp_fd_);
    ::close(http_fd_);
    tcp_fd_ = http_fd_ = -1;

    std::list<std::shared_ptr<connection>> conns;
    {
        std::lock_guard lock{conns_mutex_};
        for (auto& c : conns_)
            ::shutdown(c->fd, SHUT_RDWR);
        conns.swap(conns_);
    }
    for (auto& c : conns) {
        if (c->thread.joinable())
            c->thread.join();
        ::close(c->fd);
    }
    log(LogLevel::info, "server stopped");
}

void Server::reap() {
    std::lock_guard lock{conns_mutex_};
    for (auto it = conns_.begin(); it != conns_.end();) {
        auto& c = *it;
        if (!c->done) {
            ++it;
            continue;
        }
        if (c->thread.joinable())
            c->thread.join();
        ::close(c->fd);
        it = conns_.erase(it);
    }
}

void Server::accept_loop(int listen_fd, bool http) {
    while (running_) {
        sockaddr_in cli{};
        socklen_t len = sizeof(cli);
        int fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&cli), &len);
        if (fd < 0) {
            if (!running_)
                break;
            if (errno != EINTR)
                log(LogLevel::warning, fmt::format("accept() failed: {}", std::strerror(errno)));
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {};
        auto conn = std::make_shared<connection>();
        conn->fd = fd;
        conn->peer = fmt::format(
                "{}:{}",
                ::inet_ntop(AF_INET, &cli.sin_addr, ip, sizeof(ip)) ? ip : "?",
                ntohs(cli.sin_port));

        reap();
        std::lock_guard lock{conns_mutex_};
        conns_.push_back(conn);
        conn->thread = std::thread{[this, conn, http] {
            try {
                if (http)
                    serve_http(conn);
                else
                    serve_tcp(conn);
            } catch (const std::exception& e) {
                log(LogLevel::error, fmt::format("connection {} failed: {}", conn->peer, e.what()));
            }
            ::shutdown(conn->fd, SHUT_RDWR);
            conn->done = true;
        }};
    }
}

std::string Server::handle_line(connection& conn, std::string_view line) {
    json msg;
    try {
        msg = json::parse(line);
    } catch (const json::parse_error& e) {
        return reply_line(outcome::rejected(Error::MalformedInput, e.what()).reply());
    }

    if (msg.is_object() && msg.size() == 1 && msg.contains("bind")) {
        const auto& addr = msg["bind"];
        if (!addr.is_string() || !is_valid_address(addr.get_ref<const std::string&>()))
            return reply_line(
                    outcome::rejected(
                            Error::SchemaViolation, "bind: expected a localpart#domain address")
                            .reply());
        conn.bind(addr.get<std::string>());
        log(LogLevel::debug,
            fmt::format("{} bound to {}", conn.peer, addr.get_ref<const std::string&>()));
        return reply_line({{"ok", true}, {"kind", "bind"}, {"address", addr}});
    }

    outcome o;
    try {
        o = engine_.process_message(msg);
    } catch (const storage_error& e) {
        log(LogLevel::error, fmt::format("storage failure: {}", e.what()));
        return reply_line({{"ok", false}, {"error", "StorageError"}, {"message", e.what()}});
    }
    if (o.ok) {
        log(LogLevel::debug,
            fmt::format("{}: accepted {} (seqno {})", conn.peer, o.kind, o.seqno()));
        fan_out(o.recipients, line, &conn);
    }
    return reply_line(o.reply());
}

void Server::fan_out(
        const std::set<std::string>& recipients, std::string_view line, const connection* origin) {
    std::vector<std::shared_ptr<connection>> targets;
    {
        std::lock_guard lock{conns_mutex_};
        for (auto& c : conns_)
            if (c.get() != origin && !c->done && c->bound_to_any(recipients))
                targets.push_back(c);
    }
    std::string data{line};
    data += '\n';
    for (auto& c : targets)
        if (!c->send(data))
            log(LogLevel::debug, fmt::format("dropping delivery to {}", c->peer));
}

void Server::serve_tcp(const std::shared_ptr<connection>& conn) {
    log(LogLevel::debug, fmt::format("tcp connection from {}", conn->peer));
    LineFramer framer{conf_.max_line_bytes};
    char buf[4096];
    while (running_) {
        auto n = ::recv(conn->fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        for (auto& l : framer.feed({buf, static_cast<size_t>(n)})) {
            auto reply =
                    l.overlong ? reply_line(outcome::rejected(
                                                    Error::MalformedInput,
                                                    fmt::format(
                                                            "line exceeds the {} byte limit",
                                                            conf_.max_line_bytes))
                                                    .reply())
                               : handle_line(*conn, l.text);
            reply += '\n';
            if (!conn->send(reply))
                return;
        }
    }
}

void Server::serve_http(const std::shared_ptr<connection>& conn) {
    std::string data;
    char buf[4096];
    size_t header_end;
    while ((header_end = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > MAX_HTTP_HEADER_BYTES)
            return;
        auto n = ::recv(conn->fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return;
        data.append(buf, static_cast<size_t>(n));
    }

    auto respond = [&conn](const http_response& r) {
        auto body = reply_line(r.body);
        conn->send(fmt::format(
                "HTTP/1.1 {} {}\r\nContent-Type: application/json\r\nContent-Length: {}\r\n"
                "Connection: close\r\n\r\n{}",
                r.status,
                reason_phrase(r.status),
                body.size(),
                body));
    };

    auto lines = split(std::string_view{data}.substr(0, header_end), "\r\n");
    auto request = split(lines.front(), " ");
    if (request.size() != 3 || !starts_with(request[2], "HTTP/1.")) {
        respond({400, {{"error", "MalformedInput"}, {"message", "invalid request line"}}});
        return;
    }

    size_t content_length = 0;
    for (size_t i = 1; i < lines.size(); i++) {
        auto colon = lines[i].find(':');
        if (colon == std::string_view::npos ||
            !iequals(lines[i].substr(0, colon), "content-length"))
            continue;
        auto value = lines[i].substr(colon + 1);
        while (!value.empty() && value.front() == ' ')
            value.remove_prefix(1);
        try {
            content_length = std::stoul(std::string{value});
        } catch (const std::exception&) {
            respond({400, {{"error", "MalformedInput"}, {"message", "invalid Content-Length"}}});
            return;
        }
    }
    if (content_length > conf_.max_line_bytes) {
        respond({413, {{"error", "MalformedInput"}, {"message", "request body too large"}}});
        return;
    }

    std::string body = data.substr(header_end + 4);
    while (body.size() < content_length) {
        auto n = ::recv(conn->fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return;
        body.append(buf, static_cast<size_t>(n));
    }
    body.resize(content_length);

    auto r = api_.handle(request[0], request[1], body);
    log(LogLevel::debug,
        fmt::format("{} {} {} -> {}", conn->peer, request[0], request[1], r.status));
    respond(r);
}

}  // namespace esmp
