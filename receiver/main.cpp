// ============================================================
// receiver/main.cpp -- shr-recv entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/errors.hpp"
#include "../common/locator.hpp"
#include "../common/cli_options.hpp"
#include "../common/tcp_connectivity.hpp"
#include "recv_agent.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

static RecvAgent* g_agent = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_agent) g_agent->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " listen <ip> <port> <out_dir> [options]\n"
        << "       " << prog << " fetch <locator> <out_path> [options]\n"
        << "\n"
        << "  listen   accept one peer session and write the file into out_dir\n"
        << "  fetch    resolve a locator printed by shr-send into out_path;\n"
        << "           a shr:// locator waits for that file on --listen\n"
        << "\nOptions:\n"
        << "  --listen IP:PORT      where to wait for a shr:// locator\n";
    cli::print_common_usage(std::cerr);
    std::cerr
        << "\nExamples:\n"
        << "  " << prog << " listen 0.0.0.0 9400 /data/incoming\n"
        << "  " << prog << " fetch http://fallback:8000/files/ab12.shr ./data.bin\n"
        << "  " << prog << " fetch shr://10.0.0.5:9400/ab12... ./data.bin --listen 0.0.0.0:9400\n";
}

int main(int argc, char* argv[]) {
    platform::ignore_sigpipe();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }
    std::string mode = argv[1];
    int positional = mode == "listen" ? 3 : mode == "fetch" ? 2 : -1;
    if (positional < 0 || argc < 2 + positional) {
        print_usage(argv[0]);
        return 1;
    }

    std::string listen_addr;
    TransferConfig cfg;
    cli::StorageOptions st;
    for (int i = 2 + positional; i < argc; ++i) {
        if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen_addr = argv[++i];
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

    std::string ip;
    int port = 0;
    ReceiveTarget target;
    std::string loc;

    if (mode == "listen") {
        ip   = argv[2];
        port = std::atoi(argv[3]);
        target.out_dir = argv[4];
        if (!utils::validate_port(port)) {
            std::cerr << "ERROR: Invalid port: " << argv[3] << "\n";
            return 1;
        }
        if (!utils::validate_path(target.out_dir.string())) {
            std::cerr << "ERROR: Invalid out_dir\n";
            return 1;
        }
    } else {
        loc = argv[2];
        target.out_path = argv[3];
        LocatorKind kind = locator::classify(loc);
        if (kind == LocatorKind::INVALID) {
            std::cerr << "ERROR: Not a shr://, http(s):// or file:// locator: " << loc << "\n";
            return 1;
        }
        if (kind == LocatorKind::PEER) {
            if (listen_addr.empty() || !utils::split_host_port(listen_addr, ip, port)) {
                std::cerr << "ERROR: A peer locator needs --listen IP:PORT\n";
                return 1;
            }
        }
        // A bare file:// locator can be read without naming the directory
        if (locator::is_file_url(loc) && st.dir.empty() && st.url.empty()) {
            try {
                st.dir = DirectoryStorage::from_locator(loc).parent_path().string();
            } catch (const TransferError& e) {
                std::cerr << "ERROR: " << e.what() << "\n";
                return 1;
            }
        }
        if (locator::is_http_url(loc) && st.url.empty()) {
            st.url = loc.substr(0, loc.find('/', 7));
        }
    }

    try {
        std::unique_ptr<Storage> storage = cli::make_storage(st, cfg);
        std::unique_ptr<TcpConnectivity> conn;
        if (!ip.empty()) conn = std::make_unique<TcpConnectivity>(ip, (u16)port);

        RecvAgent agent(conn.get(), storage.get(), cfg);
        g_agent = &agent;
        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        if (mode == "listen") {
            LOG_INFO("Listening on " + ip + ":" + std::to_string(port) + ", writing into " +
                     target.out_dir.string());
            auto r = agent.listen(target);
            g_agent = nullptr;
            if (!r) {
                LOG_WARN("Stopped before any file arrived");
                return 3;
            }
            if (r->outcome == ReceiveOutcome::CANCELLED) {
                LOG_WARN("Sender cancelled " + r->name);
                return 3;
            }
            std::cout << r->path.string() << "\n";
            return 0;
        }

        fs::path out = agent.fetch(loc, target);
        g_agent = nullptr;
        std::cout << out.string() << "\n";
        return 0;
    } catch (const TransferError& e) {
        g_agent = nullptr;
        Logger::get().transfer_error(e.what());
        return e.kind() == ErrorKind::CANCELLED ? 3 : 2;
    } catch (const std::exception& e) {
        g_agent = nullptr;
        LOG_ERROR(std::string("FATAL: ") + e.what());
        return 2;
    }
}
