// ============================================================
// http_storage.cpp -- HttpStorage implementation
// ============================================================

#include "http_storage.hpp"
#include "socket.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include "locator.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <vector>

using json = nlohmann::json;

static constexpr size_t IO_BUF          = 256 * 1024;
static constexpr size_t MAX_HEADER_SIZE = 64 * 1024;
static constexpr u64    MAX_HTTP_CHUNK  = 64ull * 1024 * 1024;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// Whole-string unsigned parse; false on empty input, junk or overflow
static bool parse_size(const std::string& s, int base, u64& out) {
    if (s.empty() || !std::isxdigit((unsigned char)s[0])) return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, base);
    if (errno == ERANGE || *end != '\0') return false;
    out = v;
    return true;
}

HttpStorage::Url HttpStorage::parse_url(const std::string& url) {
    if (locator::starts_with(url, "https://")) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "https is not supported: " + url);
    }
    if (!locator::starts_with(url, "http://")) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "not an http:// URL: " + url);
    }
    std::string rest = url.substr(7);
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    Url u;
    u.path = slash == std::string::npos ? "/" : rest.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
        u.host = authority;
    } else {
        u.host = authority.substr(0, colon);
        std::string p = authority.substr(colon + 1);
        char* end = nullptr;
        long port = std::strtol(p.c_str(), &end, 10);
        if (p.empty() || *end != '\0' || !utils::validate_port((int)port)) {
            throw TransferError(ErrorKind::STORAGE_FAILURE, "bad port in URL: " + url);
        }
        u.port = (u16)port;
    }
    if (u.host.empty()) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "missing host in URL: " + url);
    }
    return u;
}

HttpStorage::HttpStorage(const std::string& base_url, u64 expiry_secs, u32 io_timeout_ms)
    : base_url_(base_url)
    , expiry_secs_(expiry_secs)
    , io_timeout_ms_(io_timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    base_ = parse_url(base_url_);
    if (base_.path == "/") base_.path.clear();
}

void HttpStorage::connect(TcpSocket& sock, const Url& url) {
    try {
        sock.connect(url.host, url.port, io_timeout_ms_);
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::STORAGE_FAILURE,
                            "cannot reach " + url.host + ":" + std::to_string(url.port) + ": " + e.what());
    }
}

// Reads status line and headers, then feeds the body to sink. Handles
// Content-Length, chunked transfer coding and read-until-close bodies.
HttpStorage::Response HttpStorage::read_response(TcpSocket& sock, const BodySink& sink) {
    std::vector<char> buf(IO_BUF);
    std::string head;
    std::string pending;   // bytes received past the current parse point
    bool closed = false;

    auto fill = [&]() -> bool {
        if (closed) return false;
        size_t got = 0;
        RecvStatus st;
        try {
            st = sock.recv_some(buf.data(), buf.size(), (int)io_timeout_ms_, got);
        } catch (const std::runtime_error& e) {
            throw TransferError(ErrorKind::STORAGE_FAILURE, e.what());
        }
        if (st == RecvStatus::TIMEOUT) {
            throw TransferError(ErrorKind::STORAGE_FAILURE,
                                "no response within " + std::to_string(io_timeout_ms_) + " ms");
        }
        if (st == RecvStatus::CLOSED) {
            closed = true;
            return false;
        }
        pending.append(buf.data(), got);
        return true;
    };

    // ---- Head ----
    size_t end;
    while ((end = pending.find("\r\n\r\n")) == std::string::npos) {
        if (pending.size() > MAX_HEADER_SIZE) {
            throw TransferError(ErrorKind::STORAGE_FAILURE, "response header too large");
        }
        if (!fill()) {
            throw TransferError(ErrorKind::STORAGE_FAILURE, "connection closed before response header");
        }
    }
    head = pending.substr(0, end);
    pending.erase(0, end + 4);

    Response resp;
    size_t line_end = head.find("\r\n");
    std::string status_line = head.substr(0, line_end);
    size_t sp = status_line.find(' ');
    if (status_line.compare(0, 5, "HTTP/") != 0 || sp == std::string::npos) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "malformed status line: " + status_line);
    }
    resp.status = std::atoi(status_line.c_str() + sp + 1);

    size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t nl = head.find("\r\n", pos);
        if (nl == std::string::npos) nl = head.size();
        std::string line = head.substr(pos, nl - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            resp.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
        pos = nl + 2;
    }

    // ---- Body ----
    auto te = resp.headers.find("transfer-encoding");
    auto cl = resp.headers.find("content-length");

    if (te != resp.headers.end() && lower(te->second).find("chunked") != std::string::npos) {
        for (;;) {
            size_t nl;
            while ((nl = pending.find("\r\n")) == std::string::npos) {
                if (!fill()) throw TransferError(ErrorKind::STORAGE_FAILURE, "truncated chunked body");
            }
            // Chunk extensions after ';' are ignored
            std::string size_line = trim(pending.substr(0, std::min(nl, pending.find(';'))));
            u64 chunk = 0;
            if (!parse_size(size_line, 16, chunk) || chunk > MAX_HTTP_CHUNK) {
                throw TransferError(ErrorKind::STORAGE_FAILURE, "bad chunk size line: " + size_line);
            }
            pending.erase(0, nl + 2);
            if (chunk == 0) break;
            while (pending.size() < chunk + 2) {
                if (!fill()) throw TransferError(ErrorKind::STORAGE_FAILURE, "truncated chunked body");
            }
            sink(resp.status, pending.data(), (size_t)chunk);
            pending.erase(0, (size_t)chunk + 2);
        }
    } else if (cl != resp.headers.end()) {
        u64 left = 0;
        if (!parse_size(cl->second, 10, left)) {
            throw TransferError(ErrorKind::STORAGE_FAILURE, "bad Content-Length: " + cl->second);
        }
        for (;;) {
            size_t take = (size_t)std::min<u64>(left, pending.size());
            if (take > 0) sink(resp.status, pending.data(), take);
            pending.erase(0, take);
            left -= take;
            if (left == 0) break;
            if (!fill()) {
                throw TransferError(ErrorKind::STORAGE_FAILURE,
                                    "body ended " + std::to_string(left) + " bytes short");
            }
        }
    } else {
        do {
            if (!pending.empty()) sink(resp.status, pending.data(), pending.size());
            pending.clear();
        } while (fill());
    }
    return resp;
}

std::string HttpStorage::request_json(const std::string& method, const std::string& path,
                                      const std::string& json_body) {
    TcpSocket sock;
    connect(sock, base_);

    std::string req = method + " " + base_.path + path + " HTTP/1.1\r\n"
                      "Host: " + base_.host + ":" + std::to_string(base_.port) + "\r\n"
                      "Accept: application/json\r\n"
                      "Connection: close\r\n";
    if (!json_body.empty()) {
        req += "Content-Type: application/json\r\n"
               "Content-Length: " + std::to_string(json_body.size()) + "\r\n";
    }
    req += "\r\n" + json_body;

    std::string body;
    Response resp;
    try {
        sock.send_all(req.data(), req.size());
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, std::string("request failed: ") + e.what());
    }
    resp = read_response(sock, [&](int, const char* p, size_t n) { body.append(p, n); });
    if (resp.status != 200) {
        throw TransferError(ErrorKind::STORAGE_FAILURE,
                            method + " " + path + " returned HTTP " + std::to_string(resp.status) +
                            ": " + body.substr(0, 256));
    }
    return body;
}

UploadReceipt HttpStorage::upload(std::istream& data, u64 size, const std::string& name_hint) {
    std::string boundary = "----shrlink" + utils::to_hex(utils::generate_file_id().data(), 16);
    std::string preamble = "--" + boundary + "\r\n"
                           "Content-Disposition: form-data; name=\"file\"; filename=\"" + name_hint + "\"\r\n"
                           "Content-Type: application/octet-stream\r\n\r\n";
    std::string epilogue = "\r\n--" + boundary + "--\r\n";
    u64 content_len = preamble.size() + size + epilogue.size();

    std::string head = "POST " + base_.path + "/upload HTTP/1.1\r\n"
                       "Host: " + base_.host + ":" + std::to_string(base_.port) + "\r\n"
                       "Content-Type: multipart/form-data; boundary=" + boundary + "\r\n"
                       "Content-Length: " + std::to_string(content_len) + "\r\n"
                       "Accept: application/json\r\n"
                       "Connection: close\r\n\r\n" + preamble;

    TcpSocket sock;
    connect(sock, base_);
    u64 start = utils::steady_ms();
    try {
        sock.send_all(head.data(), head.size());
        std::vector<char> buf(IO_BUF);
        u64 left = size;
        while (left > 0) {
            size_t want = left < buf.size() ? (size_t)left : buf.size();
            data.read(buf.data(), (std::streamsize)want);
            size_t got = (size_t)data.gcount();
            if (got == 0) {
                throw TransferError(ErrorKind::STORAGE_FAILURE,
                                    "upload source ended " + std::to_string(left) + " bytes short");
            }
            sock.send_all(buf.data(), got);
            left -= got;
        }
        sock.send_all(epilogue.data(), epilogue.size());
    } catch (const TransferError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, std::string("upload failed: ") + e.what());
    }

    std::string body;
    Response resp = read_response(sock, [&](int, const char* p, size_t n) { body.append(p, n); });
    if (resp.status != 200) {
        throw TransferError(ErrorKind::STORAGE_FAILURE,
                            "upload returned HTTP " + std::to_string(resp.status) + ": " + body.substr(0, 256));
    }

    std::string stored = name_hint;
    try {
        json j = json::parse(body);
        if (j.contains("filename") && j["filename"].is_string()) {
            stored = j["filename"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, std::string("bad upload response: ") + e.what());
    }

    UploadReceipt r;
    r.locator         = base_url_ + "/files/" + stored;
    r.expires_at_unix = utils::now_unix() + expiry_secs_;
    u64 elapsed = utils::steady_ms() - start;
    LOG_DEBUG("Uploaded " + utils::format_bytes(size) + " to " + r.locator + " in " +
              utils::format_duration_ms(elapsed));
    return r;
}

void HttpStorage::download(const std::string& loc, std::ostream& out) {
    Url u = parse_url(loc);
    TcpSocket sock;
    connect(sock, u);
    std::string req = "GET " + u.path + " HTTP/1.1\r\n"
                      "Host: " + u.host + ":" + std::to_string(u.port) + "\r\n"
                      "Connection: close\r\n\r\n";
    try {
        sock.send_all(req.data(), req.size());
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, std::string("request failed: ") + e.what());
    }

    // Only a 200 body goes to `out`; anything else is kept for the error
    std::string error_body;
    Response resp = read_response(sock, [&](int status, const char* p, size_t n) {
        if (status != 200) {
            if (error_body.size() < 256) error_body.append(p, std::min<size_t>(n, 256 - error_body.size()));
            return;
        }
        out.write(p, (std::streamsize)n);
        if (!out) throw TransferError(ErrorKind::STORAGE_FAILURE, "write failed while downloading " + loc);
    });
    if (resp.status != 200) {
        throw TransferError(ErrorKind::STORAGE_FAILURE,
                            "GET " + u.path + " returned HTTP " + std::to_string(resp.status) +
                            ": " + error_body);
    }
}

u64 HttpStorage::cleanup(u64 max_age_secs) {
    json req = {{"max_age_seconds", max_age_secs}};
    std::string body = request_json("POST", "/cleanup", req.dump());
    try {
        return json::parse(body).at("deleted_count").get<u64>();
    } catch (const json::exception& e) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, std::string("bad cleanup response: ") + e.what());
    }
}

StorageStats HttpStorage::stats() {
    std::string body = request_json("GET", "/stats", "");
    try {
        json j = json::parse(body);
        StorageStats s;
        s.file_count  = j.at("total_files").get<u64>();
        s.total_bytes = j.at("total_bytes").get<u64>();
        return s;
    } catch (const json::exception& e) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, std::string("bad stats response: ") + e.what());
    }
}
