/**
 * @file transport.cpp
 * @brief TcpTransport implementation: framed messages over non-blocking sockets.
 */

#include "network/transport.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace runbox {

namespace {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

constexpr uint32_t kRequestTimeoutMs = 10000;
constexpr uint32_t kResponseTimeoutMs = 5000;
constexpr size_t kPendingPerThread = 4;
constexpr int kAcceptPollMs = 100;

Deadline deadline_after(uint32_t ms) {
    return Clock::now() + std::chrono::milliseconds(ms);
}

int remaining_ms(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return static_cast<int>(std::max<int64_t>(left.count(), 0));
}

Error errno_error(const std::string& what) {
    return Error{ErrorCode::Io, what + ": " + std::strerror(errno)};
}

/// Waits for `events` on fd; EINTR restarts with the time left.
Result<void> wait_ready(int fd, short events, Deadline deadline) {
    for (;;) {
        pollfd pfd{.fd = fd, .events = events, .revents = 0};
        int ready = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ready > 0) return Result<void>{};
        if (ready == 0) return Error{ErrorCode::Io, "Socket I/O timed out"};
        if (errno != EINTR) return errno_error("poll");
    }
}

Result<void> write_exact(int fd, const uint8_t* data, size_t len, Deadline deadline) {
    while (len > 0) {
        auto sent = ::send(fd, data, len, MSG_NOSIGNAL);
        if (sent > 0) {
            data += sent;
            len -= static_cast<size_t>(sent);
            continue;
        }
        if (sent < 0 && errno == EINTR) continue;
        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto ready = wait_ready(fd, POLLOUT, deadline);
            if (!ready) return ready.error();
            continue;
        }
        return errno_error("send");
    }
    return Result<void>{};
}

Result<void> read_exact(int fd, uint8_t* data, size_t len, Deadline deadline) {
    while (len > 0) {
        auto got = ::recv(fd, data, len, 0);
        if (got > 0) {
            data += got;
            len -= static_cast<size_t>(got);
            continue;
        }
        if (got == 0) return Error{ErrorCode::Io, "Connection closed by peer"};
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            auto ready = wait_ready(fd, POLLIN, deadline);
            if (!ready) return ready.error();
            continue;
        }
        return errno_error("recv");
    }
    return Result<void>{};
}

Result<void> write_frame(int fd, const std::vector<uint8_t>& payload, Deadline deadline) {
    if (payload.size() > TcpTransport::MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::InvalidRequest, "Message too large"};
    }
    const uint32_t length = htonl(static_cast<uint32_t>(payload.size()));
    uint8_t header[sizeof(length)];
    std::memcpy(header, &length, sizeof(length));

    auto wrote = write_exact(fd, header, sizeof(header), deadline);
    if (!wrote) return wrote;
    return write_exact(fd, payload.data(), payload.size(), deadline);
}

Result<std::vector<uint8_t>> read_frame(int fd, uint32_t max_size, Deadline deadline) {
    uint8_t header[sizeof(uint32_t)];
    auto got = read_exact(fd, header, sizeof(header), deadline);
    if (!got) return got.error();

    uint32_t length = 0;
    std::memcpy(&length, header, sizeof(length));
    length = ntohl(length);
    if (length > max_size) {
        return Error{ErrorCode::InvalidRequest,
                     "Message too large: " + std::to_string(length) + " bytes"};
    }

    std::vector<uint8_t> payload(length);
    got = read_exact(fd, payload.data(), payload.size(), deadline);
    if (!got) return got.error();
    return payload;
}

void tune_socket(int fd) {
    int on = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

TcpTransport::TcpTransport(size_t connection_threads, uint32_t max_request_size)
    : max_request_size_(std::min(max_request_size, MAX_MESSAGE_SIZE))
    , connection_threads_(std::max<size_t>(connection_threads, 1)) {}

TcpTransport::~TcpTransport() {
    stop_serving();
}

// ─────────────────────────────────────────────
// Client Side
// ─────────────────────────────────────────────

Result<void> TcpTransport::connect(const std::string& address, uint16_t port,
                                   uint32_t timeout_ms) {
    if (client_fd_) return Error{ErrorCode::Io, "Already connected"};

    sockaddr_in peer{};
    peer.sin_family = AF_INET;
    peer.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &peer.sin_addr) != 1) {
        return Error{ErrorCode::InvalidRequest, "Invalid address: " + address};
    }

    UniqueFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd) return errno_error("socket");

    if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&peer), sizeof(peer)) < 0) {
        if (errno != EINPROGRESS) return errno_error("connect");

        auto ready = wait_ready(fd.get(), POLLOUT, deadline_after(timeout_ms));
        if (!ready) return Error{ErrorCode::Io, "Connect failed: " + ready.error().message};

        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            return Error{ErrorCode::Io, "Connect failed: " + std::string(std::strerror(err))};
        }
    }

    tune_socket(fd.get());
    client_fd_ = std::move(fd);
    return Result<void>{};
}

Result<void> TcpTransport::send(const std::vector<uint8_t>& data) {
    if (!client_fd_) return Error{ErrorCode::Io, "Not connected"};
    return write_frame(client_fd_.get(), data, deadline_after(kResponseTimeoutMs));
}

Result<std::vector<uint8_t>> TcpTransport::receive(uint32_t timeout_ms) {
    if (!client_fd_) return Error{ErrorCode::Io, "Not connected"};
    return read_frame(client_fd_.get(), MAX_MESSAGE_SIZE, deadline_after(timeout_ms));
}

void TcpTransport::disconnect() {
    if (client_fd_) ::shutdown(client_fd_.get(), SHUT_RDWR);
    client_fd_.reset();
}

// ─────────────────────────────────────────────
// Server Side
// ─────────────────────────────────────────────

Result<void> TcpTransport::listen(uint16_t port, int backlog) {
    if (server_fd_) return Error{ErrorCode::Io, "Already listening"};

    UniqueFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd) return errno_error("socket");

    int on = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = INADDR_ANY;
    if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        return errno_error("bind port " + std::to_string(port));
    }
    if (::listen(fd.get(), backlog) < 0) return errno_error("listen");

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(fd.get(), reinterpret_cast<sockaddr*>(&bound), &bound_len) < 0) {
        return errno_error("getsockname");
    }
    bound_port_ = ntohs(bound.sin_port);
    server_fd_ = std::move(fd);
    return Result<void>{};
}

void TcpTransport::serve(MessageHandler handler) {
    if (!server_fd_ || serve_thread_.joinable()) return;

    connections_ = std::make_unique<ThreadPool>(connection_threads_, "runbox-conn",
                                                connection_threads_ * kPendingPerThread);
    // Shared so that connections still in flight outlive the accept thread.
    auto shared_handler = std::make_shared<const MessageHandler>(std::move(handler));
    serve_thread_ = std::jthread([this, shared_handler](std::stop_token stop) {
        accept_loop(stop, shared_handler);
    });
}

void TcpTransport::accept_loop(std::stop_token stop,
                               std::shared_ptr<const MessageHandler> handler) {
    while (!stop.stop_requested()) {
        pollfd pfd{.fd = server_fd_.get(), .events = POLLIN, .revents = 0};
        if (::poll(&pfd, 1, kAcceptPollMs) <= 0) continue;

        UniqueFd client(::accept4(server_fd_.get(), nullptr, nullptr,
                                  SOCK_NONBLOCK | SOCK_CLOEXEC));
        if (!client) continue;
        tune_socket(client.get());

        // std::function needs a copyable callable, so the fd travels as a shared owner.
        auto owned = std::make_shared<UniqueFd>(std::move(client));
        bool queued = connections_->try_submit([this, owned, handler](std::stop_token) {
            handle_connection(std::move(*owned), *handler);
        });
        if (!queued) {
            // Every handler busy and the backlog full: refuse rather than stall.
            refused_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

void TcpTransport::stop_serving() {
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
    // Queued connections are still served before the threads join.
    if (connections_) connections_->shutdown();
    connections_.reset();
    server_fd_.reset();
}

void TcpTransport::handle_connection(UniqueFd fd, const MessageHandler& handler) {
    auto request = read_frame(fd.get(), max_request_size_, deadline_after(kRequestTimeoutMs));
    if (request) {
        // A client that went away just loses its response.
        (void)write_frame(fd.get(), handler(*request), deadline_after(kResponseTimeoutMs));
    }
    ::shutdown(fd.get(), SHUT_RDWR);
}

}  // namespace runbox
