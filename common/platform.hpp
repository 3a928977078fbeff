#pragma once

// ============================================================
// platform.hpp -- POSIX socket helpers and portable types
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <csignal>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <netdb.h>

using socket_t = int;
#define INVALID_SOCKET_VAL (-1)
#define SOCKET_ERROR_VAL   (-1)
#define CLOSE_SOCKET(s)    ::close(s)

inline int last_socket_error() { return errno; }
inline bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK; }
inline bool connect_in_progress(int err) { return err == EINPROGRESS; }
inline std::string socket_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

namespace platform {

// A peer hanging up mid-send must surface as EPIPE, not kill the process.
inline void ignore_sigpipe() {
    std::signal(SIGPIPE, SIG_IGN);
}

inline void set_nonblocking(socket_t fd, bool on) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return;
    fcntl(fd, F_SETFL, on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK));
}

// Wait until fd is readable (want_write=false) or writable (want_write=true).
// Returns 1 when ready, 0 on timeout, -1 on error. timeout_ms < 0 waits forever.
inline int wait_socket(socket_t fd, bool want_write, int timeout_ms) {
    pollfd pfd{};
    pfd.fd     = fd;
    pfd.events = want_write ? POLLOUT : POLLIN;
    int rc;
    do {
        rc = ::poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) return -1;
    return rc == 0 ? 0 : 1;
}

} // namespace platform

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i32 = int32_t;
using i64 = int64_t;
