#pragma once

#include "common/config.hpp"
#include "common/errors.hpp"
#include "stun/message.hpp"

#include <boost/asio.hpp>
#include <expected>

namespace stunlink {

namespace net = boost::asio;
using udp = boost::asio::ip::udp;

// ============================================================================
// StunClient - single-shot binding transaction
// ============================================================================
// Each call resolves the server, sends one request from a fresh IPv4 socket
// and waits for one datagram. There is no retransmission.
class StunClient {
public:
    StunClient(net::io_context& ioc, const ClientConfig& config);

    // Send `request` with a fresh transaction ID and the protocol cookie,
    // then decode the reply. Errors: ADDRESS_RESOLUTION_FAILURE,
    // SOCKET_FAILURE, SHORT_WRITE, TIMEOUT, codec errors, INVALID_COOKIE,
    // TRANSACTION_MISMATCH.
    net::awaitable<std::expected<stun::Message, ErrorCode>> dial(stun::Message request);

    // Binding request plus extraction of the mapped address
    net::awaitable<std::expected<stun::XorMappedAddress, ErrorCode>> query_mapped_address();

    // Blocking wrappers: run handlers of the io_context on the calling thread
    // until the call completes. Other work on the context is left in place.
    // Not for use from inside a handler running on that io_context, nor while
    // other threads are running it.
    std::expected<stun::Message, ErrorCode> dial_sync(stun::Message request);
    std::expected<stun::XorMappedAddress, ErrorCode> query_mapped_address_sync();

    const ClientConfig& config() const { return config_; }

private:
    net::awaitable<std::expected<udp::endpoint, ErrorCode>> resolve_server();

    template<typename T>
    std::expected<T, ErrorCode> run_sync(net::awaitable<std::expected<T, ErrorCode>> op);

    net::io_context& ioc_;
    ClientConfig config_;
};

} // namespace stunlink
