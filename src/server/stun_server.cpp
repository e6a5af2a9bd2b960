#include "server/stun_server.hpp"
#include "common/crypto.hpp"
#include "common/log.hpp"

namespace stunlink {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::SERVER_LOGGER);
    return instance;
}

} // anonymous namespace

// ============================================================================
// StunServer Implementation
// ============================================================================

StunServer::StunServer(net::io_context& ioc, const ServerConfig& config)
    : config_(config)
    , strand_(net::make_strand(ioc))
    , socket_(strand_)
{
}

StunServer::~StunServer() {
    // No handler runs on the strand any more once the owner destroys us
    running_ = false;
    boost::system::error_code ec;
    socket_.close(ec);
}

std::expected<void, ErrorCode> StunServer::start() {
    if (running_) {
        logger().warn("StunServer already running");
        return {};
    }

    boost::system::error_code ec;
    auto address = net::ip::make_address_v4(config_.listen_address, ec);
    if (ec) {
        logger().error("Invalid listen address '{}': {}", config_.listen_address, ec.message());
        return std::unexpected(ErrorCode::SOCKET_FAILURE);
    }

    udp::endpoint endpoint(address, config_.port);

    socket_.open(udp::v4(), ec);
    if (!ec) socket_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) socket_.bind(endpoint, ec);
    if (ec) {
        logger().error("Failed to bind {}:{}: {}", config_.listen_address, config_.port, ec.message());
        boost::system::error_code close_ec;
        socket_.close(close_ec);
        return std::unexpected(ErrorCode::SOCKET_FAILURE);
    }

    running_ = true;

    net::co_spawn(
        strand_,
        receive_loop(),
        [](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    logger().error("Receive loop exception: {}", e.what());
                }
            }
        });

    auto bound = local_endpoint();
    logger().info("StunServer listening on {}:{}", bound.address().to_string(), bound.port());
    return {};
}

void StunServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Socket operations belong to the strand; the close cancels the pending
    // receive and the loop exits from there
    net::dispatch(strand_, [this] {
        boost::system::error_code ec;
        socket_.close(ec);
    });

    logger().info("StunServer stopped (received {}, sent {}, errors {}, dropped {})",
                  stats_.requests_received.load(), stats_.responses_sent.load(),
                  stats_.errors.load(), stats_.dropped.load());
}

udp::endpoint StunServer::local_endpoint() const {
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    return ec ? udp::endpoint{} : endpoint;
}

net::awaitable<void> StunServer::receive_loop() {
    std::vector<uint8_t> buffer(config_.recv_buffer_size);
    udp::endpoint remote;

    while (running_) {
        boost::system::error_code ec;
        size_t received = co_await socket_.async_receive_from(
            net::buffer(buffer), remote, net::redirect_error(net::use_awaitable, ec));

        if (ec) {
            if (ec == net::error::operation_aborted || !running_) {
                break;
            }
            // ICMP errors from earlier sends surface here; keep serving
            logger().warn("Receive error: {}", ec.message());
            stats_.errors++;
            continue;
        }

        stats_.requests_received++;

        if (inflight_.load(std::memory_order_relaxed) >= config_.max_inflight) {
            logger().warn("Dropping datagram from {}:{}: {} handlers in flight",
                          remote.address().to_string(), remote.port(), config_.max_inflight);
            stats_.dropped++;
            continue;
        }

        inflight_.fetch_add(1, std::memory_order_relaxed);
        net::co_spawn(
            strand_,
            handle_request(std::vector<uint8_t>(buffer.begin(), buffer.begin() + received), remote),
            [this](std::exception_ptr ep) {
                inflight_.fetch_sub(1, std::memory_order_relaxed);
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        logger().error("Request handler exception: {}", e.what());
                        stats_.errors++;
                    }
                }
            });
    }

    logger().debug("Receive loop finished");
}

net::awaitable<void> StunServer::handle_request(std::vector<uint8_t> datagram, udp::endpoint remote) {
    auto request = stun::Message::decode(datagram);
    if (!request) {
        logger().warn("Malformed request from {}:{}: {}", remote.address().to_string(),
                      remote.port(), error_code_to_string(request.error()));
        stats_.errors++;
        co_return;
    }

    const auto& header = request->header;
    if (!header.has_valid_cookie()) {
        logger().debug("Ignoring message with cookie 0x{:08X} from {}:{}",
                       header.magic_cookie, remote.address().to_string(), remote.port());
        stats_.dropped++;
        co_return;
    }

    if (!header.is(stun::MessageType::BINDING_REQUEST)) {
        logger().debug("Ignoring {} (0x{:04X}) from {}:{}", header.type_name(), header.type,
                       remote.address().to_string(), remote.port());
        stats_.dropped++;
        co_return;
    }

    logger().debug("{} from {}:{} (txn {})", header.type_name(),
                   remote.address().to_string(), remote.port(),
                   crypto::to_hex(header.transaction_id));

    auto response = make_response(*request, remote);
    if (!response) {
        logger().error("Cannot answer {}:{}: {}", remote.address().to_string(), remote.port(),
                       error_code_to_string(response.error()));
        stats_.errors++;
        co_return;
    }

    auto bytes = response->encode();
    if (!bytes) {
        logger().error("Cannot encode response for {}:{}: {}", remote.address().to_string(),
                       remote.port(), error_code_to_string(bytes.error()));
        stats_.errors++;
        co_return;
    }

    boost::system::error_code ec;
    size_t sent = co_await socket_.async_send_to(
        net::buffer(*bytes), remote, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        logger().error("Send to {}:{} failed: {}", remote.address().to_string(), remote.port(),
                       ec.message());
        stats_.errors++;
        co_return;
    }
    if (sent < bytes->size()) {
        logger().error("Short write to {}:{}: {} of {} bytes", remote.address().to_string(),
                       remote.port(), sent, bytes->size());
        stats_.errors++;
        co_return;
    }

    stats_.responses_sent++;
    logger().info("Answered {}:{} (txn {})", remote.address().to_string(), remote.port(),
                  crypto::to_hex(header.transaction_id));
}

std::expected<stun::Message, ErrorCode> StunServer::make_response(
    const stun::Message& request, const udp::endpoint& sender) {
    return stun::Message::binding_response(
        request.header.transaction_id, sender.address(), sender.port());
}

std::expected<std::vector<uint8_t>, ErrorCode> StunServer::build_response(
    std::span<const uint8_t> request, const udp::endpoint& sender) {
    auto decoded = stun::Message::decode(request);
    if (!decoded) return std::unexpected(decoded.error());

    auto response = make_response(*decoded, sender);
    if (!response) return std::unexpected(response.error());

    return response->encode();
}

} // namespace stunlink
