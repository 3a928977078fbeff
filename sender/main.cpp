// ============================================================
// sender/main.cpp -- shr-send entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/errors.hpp"
#include "../common/cli_options.hpp"
#include "../common/tcp_connectivity.hpp"
#include "send_agent.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

static volatile std::sig_atomic_t g_interrupted = 0;

static void sig_handler(int /*sig*/) {
    g_interrupted = 1;
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <file> [options]\n"
        << "       " << prog << " cleanup [--max-age S] (--storage-dir D | --storage-url URL)\n"
        << "       " << prog << " stats (--storage-dir D | --storage-url URL)\n"
        << "\n"
        << "Sends <file> directly to a peer, or uploads it as a bundle to the\n"
        << "storage when no peer is reachable. Prints the locator on stdout.\n"
        << "\nOptions:\n"
        << "  --peer HOST:PORT      receiver to connect to\n"
        << "  --force-fallback      skip the peer and upload a bundle\n"
        << "  --max-age S           cleanup: delete bundles older than S seconds\n"
        << "                        (default: the bundle lifetime, --expiry)\n";
    cli::print_common_usage(std::cerr);
    std::cerr
        << "\nExamples:\n"
        << "  " << prog << " data.bin --peer 192.168.1.20:9400 --storage-dir /mnt/share/shr\n"
        << "  " << prog << " data.bin --storage-url http://fallback:8000\n"
        << "  " << prog << " cleanup --max-age 3600 --storage-url http://fallback:8000\n";
}

static int run_admin(const std::string& cmd, const cli::StorageOptions& st,
                     const TransferConfig& cfg, u64 max_age) {
    std::unique_ptr<Storage> storage = cli::make_storage(st, cfg);
    if (!storage) {
        std::cerr << "ERROR: " << cmd << " needs --storage-dir or --storage-url\n";
        return 1;
    }
    if (cmd == "cleanup") {
        u64 deleted = storage->cleanup(max_age);
        LOG_INFO("Deleted " + std::to_string(deleted) + " bundles older than " +
                 std::to_string(max_age) + " s from " + storage->describe());
        std::cout << deleted << "\n";
    } else {
        StorageStats s = storage->stats();
        std::cout << "files: " << s.file_count << "\n"
                  << "bytes: " << s.total_bytes << " (" << utils::format_bytes(s.total_bytes) << ")\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    platform::ignore_sigpipe();

    if (argc < 2 || std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
        print_usage(argv[0]);
        return 1;
    }

    std::string target = argv[1];
    std::string peer;
    bool force_fallback = false;
    std::optional<u64> max_age;
    TransferConfig cfg;
    cli::StorageOptions st;

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--peer") == 0 && i + 1 < argc) {
            peer = argv[++i];
            continue;
        }
        if (std::strcmp(argv[i], "--force-fallback") == 0) {
            force_fallback = true;
            continue;
        }
        if (std::strcmp(argv[i], "--max-age") == 0) {
            u64 secs = 0;
            if (!cli::parse_u64(i + 1 < argc ? argv[++i] : nullptr, secs)) {
                std::cerr << "ERROR: --max-age needs a number of seconds\n";
                return 1;
            }
            max_age = secs;
            continue;
        }
        cli::FlagResult r = cli::apply_flag(argc, argv, i, cfg, st);
        if (r == cli::FlagResult::BAD_VALUE) {
            std::cerr << "ERROR: Missing or invalid value for " << argv[i] << "\n";
            return 1;
        }
        if (r == cli::FlagResult::UNKNOWN) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        cfg.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    if (target == "cleanup" || target == "stats") {
        try {
            return run_admin(target, st, cfg, cli::cleanup_max_age(max_age, cfg));
        } catch (const std::exception& e) {
            LOG_ERROR(e.what());
            return 2;
        }
    }

    if (!peer.empty()) {
        std::string host;
        int port = 0;
        if (!utils::split_host_port(peer, host, port)) {
            std::cerr << "ERROR: Invalid peer (expected host:port): " << peer << "\n";
            return 1;
        }
    }
    if (peer.empty() && st.dir.empty() && st.url.empty()) {
        std::cerr << "ERROR: Nothing to send to: give --peer and/or a storage option\n";
        return 1;
    }

    try {
        std::unique_ptr<Storage> storage = cli::make_storage(st, cfg);
        TcpConnectivity conn;
        SendAgent agent(&conn, storage.get(), cfg);

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        std::atomic<bool> done{false};
        std::thread watcher([&]() {
            while (!done.load()) {
                if (g_interrupted) {
                    LOG_WARN("Interrupted, cancelling");
                    agent.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        SendResult res;
        try {
            res = agent.send(target, peer, force_fallback);
        } catch (const std::exception&) {
            done.store(true);
            watcher.join();
            throw;
        }
        done.store(true);
        watcher.join();

        if (res.outcome == SendOutcome::CANCELLED) {
            LOG_WARN("Send cancelled");
            return 3;
        }
        if (res.outcome == SendOutcome::FALLBACK) {
            LOG_INFO("Bundle expires in " + std::to_string(res.expires_at_unix - utils::now_unix()) + " s");
        }
        std::cout << res.locator << "\n";
        return 0;
    } catch (const TransferError& e) {
        LOG_ERROR(e.what());
        return e.kind() == ErrorKind::CANCELLED ? 3 : 2;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("FATAL: ") + e.what());
        return 2;
    }
}
