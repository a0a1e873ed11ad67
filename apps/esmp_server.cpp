#include <fmt/format.h>
#include <sodium/core.h>

#include <chrono>
#include <pthread.h>
#include <signal.h>

#include <csignal>
#include <cstdio>
#include <ctime>
#include <mutex>

#include "esmp/config.hpp"
#include "esmp/engine.hpp"
#include "esmp/error.hpp"
#include "esmp/group.hpp"
#include "esmp/http_api.hpp"
#include "esmp/profile.hpp"
#include "esmp/server.hpp"
#include "esmp/thread_log.hpp"
#include "esmp/timestamp.hpp"

namespace {

void print_usage(const char* argv0) {
    fmt::print(
            stderr,
            "Usage: {} [--config FILE] [--listen ADDR] [--tcp-port N] [--http-port N]\n"
            "          [--data-dir DIR] [--max-line-bytes N] [--secret-key-file FILE]\n"
            "          [--log-level debug|info|warning|error]\n",
            argv0);
}

esmp::Logger stderr_logger(esmp::LogLevel min_level) {
    auto mutex = std::make_shared<std::mutex>();
    return [mutex, min_level](esmp::LogLevel lvl, std::string msg) {
        if (lvl < min_level)
            return;
        auto now = esmp::to_rfc3339(std::chrono::time_point_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now()));
        std::lock_guard lock{*mutex};
        fmt::print(stderr, "{} [{}] {}\n", now, esmp::to_string(lvl), msg);
    };
}

}  // namespace

int main(int argc, char* argv[]) {
    esmp::server_config conf;
    try {
        conf = esmp::parse_command_line(argc, argv);
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n", e.what());
        print_usage(argv[0]);
        return 2;
    }

    auto logger = stderr_logger(conf.log_level);

    // Handled by sigwait below; blocked before any thread starts so every thread inherits it.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    try {
        if (sodium_init() < 0)
            throw std::runtime_error{"libsodium initialization failed"};

        auto secret = esmp::load_or_create_secret(conf.key_file());

        esmp::FileThreadLog thread_log{conf.data_dir / "threads"};

        esmp::Groups groups{thread_log};
        groups.logger = logger;
        auto ngroups = groups.replay(thread_log);

        esmp::ProfileStore profiles{esmp::to_unsigned_sv(secret)};
        profiles.logger = logger;
        auto profile_dir = conf.data_dir / "profiles";
        auto nprofiles = esmp::profile::load_records(profiles, profile_dir);
        profiles.on_store = [profile_dir](const esmp::UserProfile& p) {
            esmp::profile::write_record(profile_dir, p);
        };
        logger(esmp::LogLevel::info,
               fmt::format(
                       "loaded {} group(s) and {} profile(s) from {}",
                       ngroups,
                       nprofiles,
                       conf.data_dir.string()));

        esmp::Engine engine{groups, profiles, thread_log, conf.max_line_bytes};
        engine.logger = logger;
        esmp::HttpApi api{engine, profiles, groups, thread_log};
        api.logger = logger;

        esmp::Server server{conf, engine, api};
        server.logger = logger;
        server.start();

        int sig = 0;
        sigwait(&stop_signals, &sig);
        logger(esmp::LogLevel::info, fmt::format("received signal {}, shutting down", sig));
        server.stop();
    } catch (const std::exception& e) {
        logger(esmp::LogLevel::error, e.what());
        return 1;
    }
    return 0;
}
