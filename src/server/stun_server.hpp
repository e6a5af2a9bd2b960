#pragma once

#include "common/config.hpp"
#include "common/errors.hpp"
#include "stun/message.hpp"

#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace stunlink {

namespace net = boost::asio;
using udp = boost::asio::ip::udp;

// ============================================================================
// StunServer - answers binding requests over UDP
// ============================================================================
// Every datagram gets its own handler coroutine. Socket operations run on one
// strand, so the io_context may be run from several threads. At most
// max_inflight handlers exist at a time; datagrams beyond that are dropped.
class StunServer {
public:
    StunServer(net::io_context& ioc, const ServerConfig& config);
    ~StunServer();

    StunServer(const StunServer&) = delete;
    StunServer& operator=(const StunServer&) = delete;

    // Bind and start the receive loop. SOCKET_FAILURE if the address is
    // not an IPv4 literal or the bind fails.
    std::expected<void, ErrorCode> start();

    // Safe from any thread. The socket is closed on the strand, so the
    // server must outlive the threads running the io_context.
    void stop();

    bool is_running() const { return running_; }

    // Bound address; useful when configured with port 0
    udp::endpoint local_endpoint() const;

    // Statistics
    struct Stats {
        std::atomic<uint64_t> requests_received{0};
        std::atomic<uint64_t> responses_sent{0};
        std::atomic<uint64_t> errors{0};
        std::atomic<uint64_t> dropped{0};
    };
    const Stats& stats() const { return stats_; }

    size_t inflight() const { return inflight_.load(std::memory_order_relaxed); }

    // Binding response for `request` as seen from `sender`: the request's
    // transaction ID and one XOR-MAPPED-ADDRESS of the sender.
    static std::expected<stun::Message, ErrorCode> make_response(
        const stun::Message& request, const udp::endpoint& sender);

    // Decode, answer and encode without touching a socket
    static std::expected<std::vector<uint8_t>, ErrorCode> build_response(
        std::span<const uint8_t> request, const udp::endpoint& sender);

private:
    net::awaitable<void> receive_loop();
    net::awaitable<void> handle_request(std::vector<uint8_t> datagram, udp::endpoint remote);

    ServerConfig config_;
    net::strand<net::io_context::executor_type> strand_;
    udp::socket socket_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> inflight_{0};

    Stats stats_;
};

} // namespace stunlink
