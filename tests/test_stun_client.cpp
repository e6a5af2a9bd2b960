#include <gtest/gtest.h>
#include "client/stun_client.hpp"

#include <functional>
#include <optional>
#include <thread>

using namespace stunlink;
using namespace std::chrono_literals;

namespace {

// Answers the first datagram it receives with whatever `make_reply` returns,
// `delay` after it arrived. Runs a blocking socket on its own thread.
class FakeResponder {
public:
    using ReplyFn = std::function<std::vector<uint8_t>(const stun::Message& request)>;

    explicit FakeResponder(ReplyFn make_reply, std::chrono::milliseconds delay = 0ms)
        : socket_(ioc_, udp::endpoint(net::ip::make_address_v4("127.0.0.1"), 0))
        , make_reply_(std::move(make_reply))
        , delay_(delay)
    {
        thread_ = std::thread([this] { serve_one(); });
    }

    ~FakeResponder() {
        if (thread_.joinable()) {
            // Unblock the receive if the client never sent anything
            boost::system::error_code ec;
            udp::socket poke(ioc_, udp::v4());
            const std::array<uint8_t, 1> byte{};
            poke.send_to(net::buffer(byte), endpoint(), 0, ec);
            thread_.join();
        }
    }

    uint16_t port() const { return socket_.local_endpoint().port(); }

    // Waits for the reply to go out, then returns the request it answered
    std::optional<stun::Message> last_request() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return request_;
    }

private:
    udp::endpoint endpoint() const { return socket_.local_endpoint(); }

    void serve_one() {
        std::array<uint8_t, 2048> buffer{};
        udp::endpoint peer;
        boost::system::error_code ec;

        size_t received = socket_.receive_from(net::buffer(buffer), peer, 0, ec);
        if (ec) return;

        auto request = stun::Message::decode(std::span<const uint8_t>(buffer.data(), received));
        if (!request) return;
        request_ = *request;

        auto reply = make_reply_(*request);
        if (delay_ > 0ms) {
            std::this_thread::sleep_for(delay_);
        }
        socket_.send_to(net::buffer(reply), peer, 0, ec);
    }

    net::io_context ioc_;
    udp::socket socket_;
    ReplyFn make_reply_;
    std::chrono::milliseconds delay_;
    std::optional<stun::Message> request_;
    std::thread thread_;
};

ClientConfig local_config(uint16_t port, std::chrono::milliseconds timeout = 2000ms) {
    ClientConfig config;
    config.server_host = "127.0.0.1";
    config.server_port = port;
    config.timeout = timeout;
    return config;
}

std::vector<uint8_t> mapped_reply(const stun::TransactionId& txn) {
    auto response = stun::Message::binding_response(txn, net::ip::make_address("198.51.100.20"), 40000);
    return response ? response->encode().value() : std::vector<uint8_t>{};
}

} // anonymous namespace

class StunClientTest : public ::testing::Test {
protected:
    net::io_context ioc_;
};

TEST_F(StunClientTest, ReturnsDecodedResponse) {
    FakeResponder responder([](const stun::Message& request) {
        return mapped_reply(request.header.transaction_id);
    });

    StunClient client(ioc_, local_config(responder.port()));
    auto mapped = client.query_mapped_address_sync();
    ASSERT_TRUE(mapped.has_value()) << error_code_to_string(mapped.error());
    EXPECT_EQ(mapped->to_string(), "198.51.100.20:40000");
}

TEST_F(StunClientTest, RequestCarriesCookieAndFreshTransactionId) {
    FakeResponder responder([](const stun::Message& request) {
        return mapped_reply(request.header.transaction_id);
    });

    StunClient client(ioc_, local_config(responder.port()));

    const stun::TransactionId zero{};
    auto response = client.dial_sync(stun::Message::binding_request(zero));
    ASSERT_TRUE(response.has_value()) << error_code_to_string(response.error());

    auto request = responder.last_request();
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->header.is(stun::MessageType::BINDING_REQUEST));
    EXPECT_TRUE(request->header.has_valid_cookie());
    EXPECT_EQ(request->header.length, 0);
    EXPECT_NE(request->header.transaction_id, zero);
    EXPECT_EQ(response->header.transaction_id, request->header.transaction_id);
}

TEST_F(StunClientTest, TimesOutAgainstSilentSocket) {
    udp::socket silent(ioc_, udp::endpoint(net::ip::make_address_v4("127.0.0.1"), 0));

    StunClient client(ioc_, local_config(silent.local_endpoint().port(), 200ms));
    auto start = std::chrono::steady_clock::now();
    auto result = client.query_mapped_address_sync();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::TIMEOUT);
    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(StunClientTest, ReplyAndTimeoutReadyTogether) {
    // The reply lands at ~60ms and the 50ms timeout expires while the io
    // thread is blocked, so both completions are queued when it resumes.
    FakeResponder responder([](const stun::Message& request) {
        return mapped_reply(request.header.transaction_id);
    }, 60ms);

    net::co_spawn(ioc_, []() -> net::awaitable<void> {
        net::steady_timer pause(co_await net::this_coro::executor, 20ms);
        co_await pause.async_wait(net::use_awaitable);
        std::this_thread::sleep_for(150ms);
    }, net::detached);

    StunClient client(ioc_, local_config(responder.port(), 50ms));
    auto result = client.query_mapped_address_sync();
    if (result) {
        EXPECT_EQ(result->to_string(), "198.51.100.20:40000");
    } else {
        EXPECT_EQ(result.error(), ErrorCode::TIMEOUT);
    }
    EXPECT_TRUE(responder.last_request().has_value());

    // Run whatever the finished transaction left queued
    ioc_.restart();
    ioc_.run_for(100ms);

    // The client is still usable afterwards
    FakeResponder second([](const stun::Message& request) {
        return mapped_reply(request.header.transaction_id);
    });
    StunClient again(ioc_, local_config(second.port()));
    auto mapped = again.query_mapped_address_sync();
    ASSERT_TRUE(mapped.has_value()) << error_code_to_string(mapped.error());
}

TEST_F(StunClientTest, RejectsTransactionMismatch) {
    FakeResponder responder([](const stun::Message& request) {
        auto other = request.header.transaction_id;
        other[0] ^= 0xFF;
        return mapped_reply(other);
    });

    StunClient client(ioc_, local_config(responder.port()));
    auto result = client.query_mapped_address_sync();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::TRANSACTION_MISMATCH);
}

TEST_F(StunClientTest, RejectsInvalidCookie) {
    FakeResponder responder([](const stun::Message& request) {
        auto response = stun::Message::binding_response(
            request.header.transaction_id, net::ip::make_address("198.51.100.20"), 40000);
        response->header.magic_cookie = 0;
        return response->encode().value();
    });

    StunClient client(ioc_, local_config(responder.port()));
    auto result = client.query_mapped_address_sync();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::INVALID_COOKIE);
}

TEST_F(StunClientTest, MalformedResponseIsShortBuffer) {
    FakeResponder responder([](const stun::Message&) {
        return std::vector<uint8_t>{0x01, 0x01, 0x00, 0x00, 0x21};
    });

    StunClient client(ioc_, local_config(responder.port()));
    auto result = client.query_mapped_address_sync();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::SHORT_BUFFER);
}

TEST_F(StunClientTest, BindingResponseWithoutAddress) {
    FakeResponder responder([](const stun::Message& request) {
        stun::Message response;
        response.header.type = static_cast<uint16_t>(stun::MessageType::BINDING_RESPONSE);
        response.header.transaction_id = request.header.transaction_id;
        return response.encode().value();
    });

    StunClient client(ioc_, local_config(responder.port()));
    auto result = client.query_mapped_address_sync();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ATTRIBUTE_NOT_FOUND);
}

TEST_F(StunClientTest, UnresolvableHost) {
    ClientConfig config;
    config.server_host = "stunlink-test.invalid";
    config.timeout = 500ms;

    StunClient client(ioc_, config);
    auto result = client.query_mapped_address_sync();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::ADDRESS_RESOLUTION_FAILURE);
}
