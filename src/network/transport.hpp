/**
 * @file transport.hpp
 * @brief TCP transport for execution requests with length-prefixed framing.
 *
 * Messages are framed as [4-byte big-endian length][payload]. One request and
 * one response travel per connection. All socket I/O is non-blocking with a
 * deadline per message, so a client trickling bytes cannot hold a connection
 * thread past the deadline.
 */

#pragma once

#include "core/result.hpp"
#include "core/unique_fd.hpp"
#include "executor/thread_pool.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace runbox {

/**
 * @brief Length-prefixed TCP transport.
 *
 * Client side: connect(), send(), receive(). Server side: listen(), then
 * serve() hands each request to the handler on a connection pool and writes
 * back the handler's response. When every handler thread is busy and the
 * pool backlog is full, new connections are closed without a response.
 */
class TcpTransport {
public:
    static constexpr uint32_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16 MB
    static constexpr int DEFAULT_BACKLOG = 64;

    explicit TcpTransport(size_t connection_threads = 1,
                          uint32_t max_request_size = MAX_MESSAGE_SIZE);
    ~TcpTransport();

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // ── Client-side ──────────────────────────
    Result<void> connect(const std::string& address, uint16_t port,
                         uint32_t timeout_ms = 5000);
    Result<void> send(const std::vector<uint8_t>& data);
    Result<std::vector<uint8_t>> receive(uint32_t timeout_ms = 10000);
    void disconnect();

    // ── Server-side ──────────────────────────
    using MessageHandler = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;

    /// Port 0 binds an ephemeral port; see bound_port().
    Result<void> listen(uint16_t port, int backlog = DEFAULT_BACKLOG);
    void serve(MessageHandler handler);
    void stop_serving();

    // ── State queries ────────────────────────
    [[nodiscard]] bool is_connected() const noexcept { return client_fd_.valid(); }
    [[nodiscard]] bool is_listening() const noexcept { return server_fd_.valid(); }
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }
    /// Connections closed unanswered because the handler backlog was full.
    [[nodiscard]] uint64_t refused_connections() const noexcept { return refused_.load(); }

private:
    void accept_loop(std::stop_token stop, std::shared_ptr<const MessageHandler> handler);
    void handle_connection(UniqueFd fd, const MessageHandler& handler);

    UniqueFd client_fd_;
    UniqueFd server_fd_;
    uint16_t bound_port_ = 0;
    uint32_t max_request_size_;
    size_t connection_threads_;
    std::unique_ptr<ThreadPool> connections_;
    std::jthread serve_thread_;
    std::atomic<uint64_t> refused_{0};
};

}  // namespace runbox
