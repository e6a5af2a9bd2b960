#include "client/stun_client.hpp"
#include "common/crypto.hpp"
#include "common/log.hpp"
#include <boost/asio/experimental/awaitable_operators.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stunlink {

using namespace boost::asio::experimental::awaitable_operators;

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::CLIENT_LOGGER);
    return instance;
}

} // anonymous namespace

StunClient::StunClient(net::io_context& ioc, const ClientConfig& config)
    : ioc_(ioc)
    , config_(config)
{
}

net::awaitable<std::expected<udp::endpoint, ErrorCode>> StunClient::resolve_server() {
    auto executor = co_await net::this_coro::executor;
    boost::system::error_code ec;

    udp::resolver resolver(executor);
    auto results = co_await resolver.async_resolve(
        udp::v4(), config_.server_host, std::to_string(config_.server_port),
        net::redirect_error(net::use_awaitable, ec));

    if (ec || results.empty()) {
        logger().warn("Failed to resolve {}:{}: {}", config_.server_host, config_.server_port,
                      ec ? ec.message() : "no IPv4 address");
        co_return std::unexpected(ErrorCode::ADDRESS_RESOLUTION_FAILURE);
    }

    co_return results.begin()->endpoint();
}

net::awaitable<std::expected<stun::Message, ErrorCode>> StunClient::dial(stun::Message request) {
    auto executor = co_await net::this_coro::executor;
    boost::system::error_code ec;

    auto server = co_await resolve_server();
    if (!server) co_return std::unexpected(server.error());

    request.header.magic_cookie = stun::MAGIC_COOKIE;
    request.header.transaction_id = stun::generate_transaction_id();
    auto bytes = request.encode();
    if (!bytes) {
        logger().error("Cannot encode {}: {}", request.header.type_name(),
                       error_code_to_string(bytes.error()));
        co_return std::unexpected(bytes.error());
    }

    udp::socket socket(executor);
    socket.open(udp::v4(), ec);
    if (ec) {
        logger().error("Failed to open socket: {}", ec.message());
        co_return std::unexpected(ErrorCode::SOCKET_FAILURE);
    }

    logger().debug("Sending {} to {}:{} (txn {})",
                   request.header.type_name(), server->address().to_string(), server->port(),
                   crypto::to_hex(request.header.transaction_id));

    size_t sent = co_await socket.async_send_to(
        net::buffer(*bytes), *server, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        logger().error("Send failed: {}", ec.message());
        co_return std::unexpected(ErrorCode::SOCKET_FAILURE);
    }
    if (sent < bytes->size()) {
        logger().error("Short write: {} of {} bytes", sent, bytes->size());
        co_return std::unexpected(ErrorCode::SHORT_WRITE);
    }

    std::vector<uint8_t> buffer(config_.recv_buffer_size);
    udp::endpoint sender;
    boost::system::error_code timer_ec;
    net::steady_timer timer(executor, config_.timeout);

    // Whichever finishes first cancels the other
    auto outcome = co_await (
        socket.async_receive_from(net::buffer(buffer), sender,
                                  net::redirect_error(net::use_awaitable, ec)) ||
        timer.async_wait(net::redirect_error(net::use_awaitable, timer_ec)));

    if (outcome.index() == 1) {
        logger().warn("No response from {}:{} within {}ms",
                      config_.server_host, config_.server_port, config_.timeout.count());
        co_return std::unexpected(ErrorCode::TIMEOUT);
    }
    if (ec) {
        logger().error("Receive failed: {}", ec.message());
        co_return std::unexpected(ErrorCode::SOCKET_FAILURE);
    }
    size_t received = std::get<0>(outcome);

    auto response = stun::Message::decode(std::span<const uint8_t>(buffer.data(), received));
    if (!response) {
        logger().warn("Malformed response from {}: {}", sender.address().to_string(),
                      error_code_to_string(response.error()));
        co_return std::unexpected(response.error());
    }

    if (!response->header.has_valid_cookie()) {
        logger().warn("Response from {} carries cookie 0x{:08X}",
                      sender.address().to_string(), response->header.magic_cookie);
        co_return std::unexpected(ErrorCode::INVALID_COOKIE);
    }

    if (response->header.transaction_id != request.header.transaction_id) {
        logger().warn("Response from {} answers txn {}, expected {}",
                      sender.address().to_string(),
                      crypto::to_hex(response->header.transaction_id),
                      crypto::to_hex(request.header.transaction_id));
        co_return std::unexpected(ErrorCode::TRANSACTION_MISMATCH);
    }

    logger().info("Received {} ({} bytes) from {}:{}",
                  response->header.type_name(), received,
                  sender.address().to_string(), sender.port());
    for (const auto& attr : response->attributes) {
        logger().debug("  {} (0x{:04X}), {} bytes",
                       stun::attribute_type_name(attr.type), attr.type, attr.length);
    }

    co_return std::move(*response);
}

net::awaitable<std::expected<stun::XorMappedAddress, ErrorCode>> StunClient::query_mapped_address() {
    auto response = co_await dial(stun::Message::binding_request({}));
    if (!response) co_return std::unexpected(response.error());

    auto mapped = response->xor_mapped_address();
    if (!mapped) co_return std::unexpected(mapped.error());
    if (!*mapped) {
        // Error response or another non-binding reply
        logger().warn("Server answered with {}", response->header.type_name());
        co_return std::unexpected(ErrorCode::ATTRIBUTE_NOT_FOUND);
    }

    logger().info("Mapped address {}", (*mapped)->to_string());
    co_return **mapped;
}

template<typename T>
std::expected<T, ErrorCode> StunClient::run_sync(net::awaitable<std::expected<T, ErrorCode>> op) {
    std::optional<std::expected<T, ErrorCode>> result;
    std::exception_ptr failure;
    bool done = false;

    net::co_spawn(
        ioc_,
        std::move(op),
        [&result, &failure, &done](std::exception_ptr ep, std::expected<T, ErrorCode> r) {
            if (ep) {
                failure = ep;
            } else {
                result = std::move(r);
            }
            done = true;
        });

    // Drive the context one handler at a time so that other work sharing it
    // keeps running afterwards
    if (ioc_.stopped()) {
        ioc_.restart();
    }
    while (!done) {
        if (ioc_.run_one() == 0) {
            break;
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    if (!result) {
        // io_context was stopped before the transaction finished
        return std::unexpected(ErrorCode::SOCKET_FAILURE);
    }
    return std::move(*result);
}

std::expected<stun::Message, ErrorCode> StunClient::dial_sync(stun::Message request) {
    return run_sync(dial(std::move(request)));
}

std::expected<stun::XorMappedAddress, ErrorCode> StunClient::query_mapped_address_sync() {
    return run_sync(query_mapped_address());
}

} // namespace stunlink
