// ============================================================
// test_storage.cpp -- DirectoryStorage and HttpStorage
// ============================================================

#include <gtest/gtest.h>
#include "common/directory_storage.hpp"
#include "common/http_storage.hpp"
#include "common/cli_options.hpp"
#include "common/socket.hpp"
#include "common/utils.hpp"
#include "sender/send_agent.hpp"
#include "receiver/recv_agent.hpp"
#include "test_support.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>
#include <functional>
#include <sstream>

using namespace testing_support;
using json = nlohmann::json;

// ============================================================
// DirectoryStorage
// ============================================================

TEST(DirectoryStorage, UploadDownloadStats) {
    TempDir dir;
    DirectoryStorage store(dir.path() / "bundles", 600);
    std::vector<u8> data = random_bytes(700000);
    std::istringstream in(std::string(data.begin(), data.end()));

    u64 before = utils::now_unix();
    UploadReceipt r = store.upload(in, data.size(), "0011.shr");
    EXPECT_EQ(r.locator, "file://" + (fs::absolute(dir.path() / "bundles") / "0011.shr").string());
    EXPECT_GE(r.expires_at_unix, before + 600);
    EXPECT_FALSE(fs::exists(dir.path() / "bundles" / "0011.shr.part"));

    std::ostringstream out;
    store.download(r.locator, out);
    std::string s = out.str();
    EXPECT_EQ(std::vector<u8>(s.begin(), s.end()), data);

    StorageStats st = store.stats();
    EXPECT_EQ(st.file_count, 1u);
    EXPECT_EQ(st.total_bytes, data.size());
}

TEST(DirectoryStorage, RejectsUnsafeNameAndShortSource) {
    TempDir dir;
    DirectoryStorage store(dir.path(), 600);

    std::istringstream a("abc");
    try {
        store.upload(a, 3, "../up.shr");
        FAIL() << "expected storage failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::STORAGE_FAILURE);
    }

    std::istringstream b("only ten b");
    EXPECT_THROW(store.upload(b, 50, "short.shr"), TransferError);
    EXPECT_FALSE(fs::exists(dir.path() / "short.shr"));
    EXPECT_FALSE(fs::exists(dir.path() / "short.shr.part"));
}

TEST(DirectoryStorage, LocatorsMustBeAbsoluteFileUrls) {
    EXPECT_EQ(DirectoryStorage::from_locator("file:///srv/x.shr"), fs::path("/srv/x.shr"));
    EXPECT_THROW(DirectoryStorage::from_locator("file://relative/x.shr"), TransferError);
    EXPECT_THROW(DirectoryStorage::from_locator("http://host/x.shr"), TransferError);

    TempDir dir;
    DirectoryStorage store(dir.path(), 600);
    std::ostringstream out;
    EXPECT_THROW(store.download(DirectoryStorage::to_locator(dir.path() / "absent.shr"), out),
                 TransferError);
}

TEST(DirectoryStorage, CleanupRemovesOnlyOldBundles) {
    TempDir dir;
    DirectoryStorage store(dir.path(), 600);
    write_file(dir.path() / "old.shr", random_bytes(10));
    write_file(dir.path() / "new.shr", random_bytes(20));
    write_file(dir.path() / "notes.txt", random_bytes(30));

    auto two_hours_ago = fs::file_time_type::clock::now() - std::chrono::hours(2);
    fs::last_write_time(dir.path() / "old.shr", two_hours_ago);
    fs::last_write_time(dir.path() / "notes.txt", two_hours_ago);

    EXPECT_EQ(store.cleanup(3600), 1u);
    EXPECT_FALSE(fs::exists(dir.path() / "old.shr"));
    EXPECT_TRUE(fs::exists(dir.path() / "new.shr"));
    EXPECT_TRUE(fs::exists(dir.path() / "notes.txt"));

    StorageStats st = store.stats();
    EXPECT_EQ(st.file_count, 1u);
    EXPECT_EQ(st.total_bytes, 20u);
}

TEST(DirectoryStorage, DefaultCleanupKeepsUnexpiredBundles) {
    TempDir dir;
    TransferConfig cfg;
    DirectoryStorage store(dir.path(), cfg.expiry_secs);

    std::istringstream a(std::string(64, 'a'));
    std::istringstream b(std::string(32, 'b'));
    store.upload(a, 64, "fresh.shr");
    store.upload(b, 32, "stale.shr");
    auto now = fs::file_time_type::clock::now();
    fs::last_write_time(dir.path() / "fresh.shr", now - std::chrono::hours(2));
    fs::last_write_time(dir.path() / "stale.shr", now - std::chrono::hours(25));

    u64 max_age = cli::cleanup_max_age(std::nullopt, cfg);
    EXPECT_EQ(max_age, cfg.expiry_secs);
    EXPECT_EQ(store.cleanup(max_age), 1u);
    EXPECT_TRUE(fs::exists(dir.path() / "fresh.shr"));
    EXPECT_FALSE(fs::exists(dir.path() / "stale.shr"));

    // An explicit age still wins
    EXPECT_EQ(cli::cleanup_max_age(u64(60), cfg), 60u);
    EXPECT_EQ(store.cleanup(60), 1u);
    EXPECT_FALSE(fs::exists(dir.path() / "fresh.shr"));
}

// ============================================================
// HttpStorage against an in-process file server
// ============================================================

// Serves the upload API one connection at a time on 127.0.0.1
class FakeFileServer {
public:
    FakeFileServer() {
        listener_.bind_and_listen("127.0.0.1", 0);
        port_ = listener_.local_port();
        thread_ = std::thread([this] { run(); });
    }

    ~FakeFileServer() {
        stop_.store(true);
        if (thread_.joinable()) thread_.join();
    }

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::map<std::string, std::string> files() {
        std::lock_guard<std::mutex> lk(mutex_);
        return files_;
    }

    std::string last_cleanup_body() {
        std::lock_guard<std::mutex> lk(mutex_);
        return cleanup_body_;
    }

    // Answer every later request with these exact bytes
    void set_canned_reply(const std::string& raw) {
        std::lock_guard<std::mutex> lk(mutex_);
        canned_ = raw;
    }

private:
    struct Request {
        std::string method;
        std::string path;
        std::string head;
        std::string body;
    };

    void run() {
        while (!stop_.load()) {
            TcpSocket c = listener_.accept(50);
            if (!c.is_valid()) continue;
            try {
                Request req;
                if (read_request(c, req)) serve(c, req);
            } catch (const std::exception& e) {
                ADD_FAILURE() << "file server: " << e.what();
            }
        }
    }

    static std::string lower(std::string s) {
        for (auto& ch : s) ch = (char)std::tolower((unsigned char)ch);
        return s;
    }

    bool read_request(TcpSocket& c, Request& req) {
        std::string data;
        std::vector<char> buf(64 * 1024);
        size_t end;
        while ((end = data.find("\r\n\r\n")) == std::string::npos) {
            size_t got = 0;
            if (c.recv_some(buf.data(), buf.size(), 2000, got) != RecvStatus::DATA) return false;
            data.append(buf.data(), got);
        }
        req.head = data.substr(0, end);
        req.body = data.substr(end + 4);
        size_t sp1 = req.head.find(' ');
        size_t sp2 = req.head.find(' ', sp1 + 1);
        req.method = req.head.substr(0, sp1);
        req.path   = req.head.substr(sp1 + 1, sp2 - sp1 - 1);

        size_t len = 0;
        std::string lh = lower(req.head);
        size_t cl = lh.find("content-length:");
        if (cl != std::string::npos) len = std::stoul(lh.substr(cl + 15));
        while (req.body.size() < len) {
            size_t got = 0;
            if (c.recv_some(buf.data(), buf.size(), 2000, got) != RecvStatus::DATA) return false;
            req.body.append(buf.data(), got);
        }
        return true;
    }

    static void reply(TcpSocket& c, int status, const std::string& body) {
        std::string r = "HTTP/1.1 " + std::to_string(status) + (status == 200 ? " OK" : " Not Found") +
                        "\r\nContent-Type: application/json\r\nContent-Length: " +
                        std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
        c.send_all(r.data(), r.size());
    }

    void serve(TcpSocket& c, const Request& req) {
        std::string canned;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            canned = canned_;
        }
        if (!canned.empty()) {
            c.send_all(canned.data(), canned.size());
            return;
        }
        if (req.method == "POST" && req.path == "/upload") {
            size_t b = req.head.find("boundary=");
            std::string boundary = req.head.substr(b + 9, req.head.find("\r\n", b) - b - 9);
            size_t fn = req.body.find("filename=\"") + 10;
            std::string name = req.body.substr(fn, req.body.find('"', fn) - fn);
            size_t start = req.body.find("\r\n\r\n") + 4;
            size_t stop = req.body.rfind("\r\n--" + boundary + "--");
            std::string stored = "srv-" + name;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                files_[stored] = req.body.substr(start, stop - start);
            }
            json j = {{"status", "success"}, {"filename", stored},
                      {"size", stop - start}, {"download_url", "/files/" + stored}};
            reply(c, 200, j.dump());
            return;
        }
        if (req.method == "GET" && req.path.compare(0, 7, "/files/") == 0) {
            std::string content;
            bool found;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                auto it = files_.find(req.path.substr(7));
                found = it != files_.end();
                if (found) content = it->second;
            }
            if (!found) {
                reply(c, 404, "{\"detail\":\"File not found\"}");
                return;
            }
            // Chunked, in small pieces
            std::string r = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n";
            c.send_all(r.data(), r.size());
            for (size_t off = 0; off < content.size(); off += 1000) {
                size_t n = std::min<size_t>(1000, content.size() - off);
                char size_line[32];
                std::snprintf(size_line, sizeof(size_line), "%zx\r\n", n);
                std::string piece = size_line + content.substr(off, n) + "\r\n";
                c.send_all(piece.data(), piece.size());
            }
            c.send_all("0\r\n\r\n", 5);
            return;
        }
        if (req.method == "GET" && req.path == "/stats") {
            u64 count = 0, bytes = 0;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                for (const auto& kv : files_) {
                    ++count;
                    bytes += kv.second.size();
                }
            }
            // No Content-Length: body runs until close
            json j = {{"total_files", count}, {"total_bytes", bytes}};
            std::string r = "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nConnection: close\r\n\r\n" +
                            j.dump();
            c.send_all(r.data(), r.size());
            return;
        }
        if (req.method == "POST" && req.path == "/cleanup") {
            {
                std::lock_guard<std::mutex> lk(mutex_);
                cleanup_body_ = req.body;
            }
            reply(c, 200, "{\"deleted_count\": 2}");
            return;
        }
        reply(c, 404, "{\"detail\":\"Not Found\"}");
    }

    TcpSocket                          listener_;
    u16                                port_ = 0;
    std::thread                        thread_;
    std::atomic<bool>                  stop_{false};
    std::mutex                         mutex_;
    std::map<std::string, std::string> files_;
    std::string                        cleanup_body_;
    std::string                        canned_;
};

TEST(HttpStorage, ParsesBaseUrls) {
    HttpStorage::Url u = HttpStorage::parse_url("http://files.local:8000/api/v1");
    EXPECT_EQ(u.host, "files.local");
    EXPECT_EQ(u.port, 8000);
    EXPECT_EQ(u.path, "/api/v1");

    u = HttpStorage::parse_url("http://files.local");
    EXPECT_EQ(u.port, 80);
    EXPECT_EQ(u.path, "/");

    EXPECT_THROW(HttpStorage::parse_url("https://files.local"), TransferError);
    EXPECT_THROW(HttpStorage::parse_url("http://files.local:99999"), TransferError);
    EXPECT_THROW(HttpStorage::parse_url("http://:80/"), TransferError);
    EXPECT_THROW(HttpStorage::parse_url("ftp://files.local"), TransferError);
}

TEST(HttpStorage, UploadThenDownload) {
    FakeFileServer server;
    HttpStorage store(server.base_url() + "/", 900, 5000);
    std::vector<u8> data = random_bytes(300000);
    std::istringstream in(std::string(data.begin(), data.end()));

    u64 before = utils::now_unix();
    UploadReceipt r = store.upload(in, data.size(), "abcd.shr");
    EXPECT_EQ(r.locator, server.base_url() + "/files/srv-abcd.shr");
    EXPECT_GE(r.expires_at_unix, before + 900);

    auto files = server.files();
    ASSERT_EQ(files.count("srv-abcd.shr"), 1u);
    EXPECT_EQ(files["srv-abcd.shr"], std::string(data.begin(), data.end()));

    std::ostringstream out;
    store.download(r.locator, out);
    EXPECT_EQ(out.str(), std::string(data.begin(), data.end()));
}

TEST(HttpStorage, MissingObjectIsAStorageFailure) {
    FakeFileServer server;
    HttpStorage store(server.base_url(), 900, 5000);
    std::ostringstream out;
    try {
        store.download(server.base_url() + "/files/nothing.shr", out);
        FAIL() << "expected storage failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::STORAGE_FAILURE);
        EXPECT_NE(std::string(e.what()).find("404"), std::string::npos);
    }
    EXPECT_TRUE(out.str().empty());
}

TEST(HttpStorage, StatsAndCleanup) {
    FakeFileServer server;
    HttpStorage store(server.base_url(), 900, 5000);
    std::istringstream a(std::string(100, 'a'));
    std::istringstream b(std::string(250, 'b'));
    store.upload(a, 100, "a.shr");
    store.upload(b, 250, "b.shr");

    StorageStats st = store.stats();
    EXPECT_EQ(st.file_count, 2u);
    EXPECT_EQ(st.total_bytes, 350u);

    EXPECT_EQ(store.cleanup(3600), 2u);
    json sent = json::parse(server.last_cleanup_body());
    EXPECT_EQ(sent.at("max_age_seconds").get<u64>(), 3600u);
}

static void expect_storage_failure(const std::function<void()>& op) {
    try {
        op();
        FAIL() << "expected storage failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::STORAGE_FAILURE) << e.what();
    }
}

TEST(HttpStorage, OversizedChunkLengthIsAStorageFailure) {
    FakeFileServer server;
    server.set_canned_reply("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
                            "ffffffffffffffff\r\nABCDEFGH");
    HttpStorage store(server.base_url(), 900, 2000);

    expect_storage_failure([&] { store.stats(); });
    expect_storage_failure([&] { store.cleanup(60); });
    std::ostringstream out;
    expect_storage_failure([&] { store.download(server.base_url() + "/files/x.shr", out); });
    EXPECT_TRUE(out.str().empty());
}

TEST(HttpStorage, GarbledBodyFramingIsAStorageFailure) {
    FakeFileServer server;
    HttpStorage store(server.base_url(), 900, 2000);

    server.set_canned_reply("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
                            "zz\r\n{}\r\n0\r\n\r\n");
    expect_storage_failure([&] { store.stats(); });

    server.set_canned_reply("HTTP/1.1 200 OK\r\nContent-Length: lots\r\nConnection: close\r\n\r\n{}");
    expect_storage_failure([&] { store.stats(); });

    server.set_canned_reply("HTTP/1.1 200 OK\r\nContent-Length: 99999999999999999999999\r\n"
                            "Connection: close\r\n\r\n{}");
    expect_storage_failure([&] { store.stats(); });
}

TEST(HttpStorage, ChunkExtensionsAreIgnored) {
    FakeFileServer server;
    server.set_canned_reply("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
                            "2a;note=x\r\n{\"total_files\": 3, \"total_bytes\": 1234567}\r\n0\r\n\r\n");
    HttpStorage store(server.base_url(), 900, 2000);
    StorageStats st = store.stats();
    EXPECT_EQ(st.file_count, 3u);
    EXPECT_EQ(st.total_bytes, 1234567u);
}

TEST(HttpStorage, UnreachableServerIsAStorageFailure) {
    // Grab a free port, then close it so nothing listens there
    u16 port;
    {
        TcpSocket reserve;
        reserve.bind_and_listen("127.0.0.1", 0);
        port = reserve.local_port();
    }
    HttpStorage store("http://127.0.0.1:" + std::to_string(port), 900, 1000);
    try {
        store.stats();
        FAIL() << "expected storage failure";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::STORAGE_FAILURE);
    }
}

TEST(HttpStorage, BundleRoundTripThroughServer) {
    Logger::get().set_transfer_error_file("");
    TempDir dir;
    FakeFileServer server;
    HttpStorage store(server.base_url(), 900, 5000);

    TransferConfig cfg;
    cfg.block_size = 4096;
    cfg.workers    = 2;
    cfg.spool_dir  = dir.path().string();

    std::vector<u8> data = random_bytes(20 * 4096 + 77);
    data.insert(data.end(), 4096 * 3, 0);
    write_file(dir.path() / "movie.bin", data);

    SendAgent sender(nullptr, &store, cfg);
    SendResult sent = sender.send(dir.path() / "movie.bin", "", true);
    EXPECT_EQ(sent.outcome, SendOutcome::FALLBACK);
    EXPECT_EQ(sent.locator.rfind(server.base_url() + "/files/srv-", 0), 0u);

    RecvAgent receiver(nullptr, &store, cfg);
    ReceiveTarget t;
    t.out_dir = dir.path() / "inbox";
    fs::path got = receiver.fetch(sent.locator, t);
    EXPECT_EQ(got, dir.path() / "inbox" / "movie.bin");
    EXPECT_EQ(read_file(got), data);
}
