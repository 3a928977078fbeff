#pragma once

// ============================================================
// http_storage.hpp -- Storage backed by an HTTP file server
//
// Talks to a minimal upload server:
//   POST /upload          multipart field "file" -> {"filename": ...}
//   GET  /files/<name>    bundle bytes
//   GET  /stats           {"total_files": N, "total_bytes": N}
//   POST /cleanup         {"max_age_seconds": N} -> {"deleted_count": N}
//
// Plain HTTP/1.1, one connection per request ("Connection: close").
// ============================================================

#include "storage.hpp"
#include <functional>
#include <map>
#include <string>

class TcpSocket;

class HttpStorage : public Storage {
public:
    // base_url: "http://host[:port][/prefix]". Throws
    // TransferError(STORAGE_FAILURE) if it cannot be parsed.
    HttpStorage(const std::string& base_url, u64 expiry_secs, u32 io_timeout_ms = 30000);

    UploadReceipt upload(std::istream& data, u64 size, const std::string& name_hint) override;
    void download(const std::string& locator, std::ostream& out) override;
    u64 cleanup(u64 max_age_secs) override;
    StorageStats stats() override;
    std::string describe() const override { return base_url_; }

    struct Url {
        std::string host;
        u16         port = 80;
        std::string path;    // always starts with '/'
    };

    static Url parse_url(const std::string& url);

private:
    struct Response {
        int                                status = 0;
        std::map<std::string, std::string> headers;   // lower-case names
    };

    using BodySink = std::function<void(int status, const char*, size_t)>;

    void connect(TcpSocket& sock, const Url& url);
    Response read_response(TcpSocket& sock, const BodySink& sink);
    std::string request_json(const std::string& method, const std::string& path,
                             const std::string& json_body);

    std::string base_url_;
    Url         base_;
    u64         expiry_secs_;
    u32         io_timeout_ms_;
};
