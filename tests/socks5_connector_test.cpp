#include <array>
#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <expected>

#include <gtest/gtest.h>
#include <boost/asio.hpp>

#include "config.h"
#include "protocol.h"
#include "test_util.h"
#include "pipe_error.h"
#include "log_context.h"
#include "socks5_connector.h"

namespace sockspipe
{

namespace
{

using tunnel_result = std::expected<boost::asio::ip::tcp::socket, pipe_error>;

struct mock_proxy
{
    std::vector<std::uint8_t> method_reply = {0x05, 0x00};
    std::vector<std::uint8_t> connect_reply = {0x05, 0x00, 0x00, 0x01, 127, 0, 0, 1, 0x1F, 0x90};
    std::vector<std::uint8_t> payload;
    // stop after the method reply and record whatever the client sends next
    bool stop_after_method = false;
    // accept and read the greeting, then never answer
    bool silent = false;

    bool accepted = false;
    std::vector<std::uint8_t> greeting;
    std::vector<std::uint8_t> request;
    std::vector<std::uint8_t> after_method;
};

boost::asio::awaitable<void> drain_until_eof(boost::asio::ip::tcp::socket& socket, std::vector<std::uint8_t>& out)
{
    std::array<std::uint8_t, 512> buf{};
    for (;;)
    {
        boost::system::error_code ec;
        const auto n = co_await socket.async_read_some(boost::asio::buffer(buf), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            co_return;
        }
        out.insert(out.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
    }
}

boost::asio::awaitable<void> run_mock_proxy(boost::asio::ip::tcp::acceptor& acceptor, mock_proxy& mock)
{
    boost::system::error_code ec;
    auto socket = co_await acceptor.async_accept(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
    {
        co_return;
    }
    mock.accepted = true;

    mock.greeting.resize(3);
    co_await boost::asio::async_read(socket, boost::asio::buffer(mock.greeting), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
    {
        co_return;
    }
    if (mock.silent)
    {
        std::vector<std::uint8_t> ignored;
        co_await drain_until_eof(socket, ignored);
        co_return;
    }

    co_await boost::asio::async_write(socket, boost::asio::buffer(mock.method_reply), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (mock.stop_after_method)
    {
        boost::system::error_code ignore;
        ignore = socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignore);
        co_await drain_until_eof(socket, mock.after_method);
        co_return;
    }

    std::array<std::uint8_t, 5> head{};
    co_await boost::asio::async_read(socket, boost::asio::buffer(head), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
    {
        co_return;
    }
    std::vector<std::uint8_t> rest(static_cast<std::size_t>(head[4]) + 2);
    co_await boost::asio::async_read(socket, boost::asio::buffer(rest), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
    {
        co_return;
    }
    mock.request.assign(head.begin(), head.end());
    mock.request.insert(mock.request.end(), rest.begin(), rest.end());

    co_await boost::asio::async_write(socket, boost::asio::buffer(mock.connect_reply), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (!mock.payload.empty())
    {
        co_await boost::asio::async_write(socket, boost::asio::buffer(mock.payload), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

config make_config(const std::uint16_t proxy_port, const std::uint32_t handshake_timeout = 0)
{
    config cfg;
    cfg.proxy.host = "127.0.0.1";
    cfg.proxy.port = proxy_port;
    cfg.timeout.handshake = handshake_timeout;
    return cfg;
}

class Socks5ConnectorTest : public ::testing::Test
{
   protected:
    void SetUp() override { ASSERT_TRUE(test::open_ephemeral_tcp_acceptor(acceptor_)); }

    [[nodiscard]] std::uint16_t proxy_port() const { return acceptor_.local_endpoint().port(); }

    tunnel_result establish(mock_proxy& mock, const std::string& host, const std::uint16_t port, const std::uint32_t handshake_timeout = 0)
    {
        boost::asio::co_spawn(ctx_, run_mock_proxy(acceptor_, mock), boost::asio::detached);
        socks5_connector connector(ctx_, make_config(proxy_port(), handshake_timeout), log_ctx_);
        auto result = test::run_awaitable(ctx_, connector.establish_tunnel(host, port));
        if (!result.has_value())
        {
            return std::unexpected(make_pipe_error(error_kind::kProtocol, "did not complete"));
        }
        return std::move(*result);
    }

    boost::asio::io_context ctx_;
    boost::asio::ip::tcp::acceptor acceptor_{ctx_};
    connection_context log_ctx_;
};

}    // namespace

TEST_F(Socks5ConnectorTest, SendsExactHandshakeBytes)
{
    mock_proxy mock;
    auto result = establish(mock, "github.com", 22);
    ASSERT_TRUE(result.has_value()) << describe_error(result.error());

    const std::vector<std::uint8_t> greeting = {0x05, 0x01, 0x00};
    EXPECT_EQ(mock.greeting, greeting);
    const std::vector<std::uint8_t> request = {0x05, 0x01, 0x00, 0x03, 0x0A, 'g', 'i', 't', 'h', 'u', 'b', '.', 'c', 'o', 'm', 0x00, 0x16};
    EXPECT_EQ(mock.request, request);
    EXPECT_TRUE(result->is_open());
}

TEST_F(Socks5ConnectorTest, TunnelCarriesBytesAfterIpv4Reply)
{
    mock_proxy mock;
    mock.payload = {'S', 'S', 'H', '-', '2', '.', '0'};
    auto result = establish(mock, "example.com", 443);
    ASSERT_TRUE(result.has_value()) << describe_error(result.error());

    std::vector<std::uint8_t> got(mock.payload.size());
    boost::asio::read(*result, boost::asio::buffer(got));
    EXPECT_EQ(got, mock.payload);
}

TEST_F(Socks5ConnectorTest, Ipv6BoundAddressIsDrained)
{
    mock_proxy mock;
    mock.connect_reply = {0x05, 0x00, 0x00, 0x04, 0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x01, 0x1F, 0x90};
    mock.payload = {0xAB, 0xCD, 0xEF};
    auto result = establish(mock, "example.com", 80);
    ASSERT_TRUE(result.has_value()) << describe_error(result.error());

    std::vector<std::uint8_t> got(mock.payload.size());
    boost::asio::read(*result, boost::asio::buffer(got));
    EXPECT_EQ(got, mock.payload);
}

TEST_F(Socks5ConnectorTest, DomainBoundAddressIsDrained)
{
    mock_proxy mock;
    mock.connect_reply = {0x05, 0x00, 0x00, 0x03, 0x0B, 'e', 'x', 'a', 'm', 'p', 'l', 'e', '.', 'o', 'r', 'g', 0x00, 0x50};
    mock.payload = {0x42};
    auto result = establish(mock, "example.org", 80);
    ASSERT_TRUE(result.has_value()) << describe_error(result.error());

    std::vector<std::uint8_t> got(1);
    boost::asio::read(*result, boost::asio::buffer(got));
    EXPECT_EQ(got, mock.payload);
}

TEST_F(Socks5ConnectorTest, NoAcceptableMethodStopsBeforeConnect)
{
    mock_proxy mock;
    mock.method_reply = {0x05, 0xFF};
    mock.stop_after_method = true;
    auto result = establish(mock, "example.com", 80);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kProxyAuthRejected);
    EXPECT_TRUE(mock.after_method.empty());
}

TEST_F(Socks5ConnectorTest, MethodReplyWrongVersionIsAuthRejected)
{
    mock_proxy mock;
    mock.method_reply = {0x04, 0x00};
    mock.stop_after_method = true;
    auto result = establish(mock, "example.com", 80);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kProxyAuthRejected);
    EXPECT_TRUE(mock.after_method.empty());
}

TEST_F(Socks5ConnectorTest, ShortMethodReplyIsAuthRejected)
{
    mock_proxy mock;
    mock.method_reply = {0x05};
    mock.stop_after_method = true;
    auto result = establish(mock, "example.com", 80);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kProxyAuthRejected);
    EXPECT_TRUE(mock.after_method.empty());
}

TEST_F(Socks5ConnectorTest, ConnectRejectedCarriesStatus)
{
    mock_proxy mock;
    mock.connect_reply = {0x05, 0x05, 0x00, 0x01, 0, 0, 0, 0, 0, 0};
    auto result = establish(mock, "example.com", 80);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kConnectRejected);
    EXPECT_EQ(result.error().status, 5);
    EXPECT_NE(describe_error(result.error()).find("connection refused"), std::string::npos);
}

TEST_F(Socks5ConnectorTest, ConnectReplyWrongVersionIsProtocolError)
{
    mock_proxy mock;
    mock.connect_reply = {0x04, 0x00, 0x00, 0x01, 0, 0, 0, 0, 0, 0};
    auto result = establish(mock, "example.com", 80);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kProtocol);
}

TEST_F(Socks5ConnectorTest, ShortConnectReplyIsProtocolError)
{
    mock_proxy mock;
    mock.connect_reply = {0x05, 0x00, 0x00, 0x01, 0x7F};
    auto result = establish(mock, "example.com", 80);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kProtocol);
}

TEST_F(Socks5ConnectorTest, UnknownBoundAddressTypeIsProtocolError)
{
    mock_proxy mock;
    mock.connect_reply = {0x05, 0x00, 0x00, 0x07, 0, 0, 0, 0, 0, 0};
    auto result = establish(mock, "example.com", 80);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kProtocol);
}

TEST_F(Socks5ConnectorTest, OversizedHostFailsBeforeConnecting)
{
    socks5_connector connector(ctx_, make_config(proxy_port()), log_ctx_);
    auto result = test::run_awaitable(ctx_, connector.establish_tunnel(std::string(256, 'a'), 80));
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().kind, error_kind::kProtocol);

    boost::system::error_code ec;
    ec = acceptor_.non_blocking(true, ec);
    ASSERT_FALSE(ec);
    boost::asio::ip::tcp::socket peer(ctx_);
    ec = acceptor_.accept(peer, ec);
    EXPECT_EQ(ec, boost::asio::error::would_block);
}

TEST_F(Socks5ConnectorTest, EmptyHostFailsBeforeConnecting)
{
    socks5_connector connector(ctx_, make_config(proxy_port()), log_ctx_);
    auto result = test::run_awaitable(ctx_, connector.establish_tunnel("", 80));
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().kind, error_kind::kProtocol);
}

TEST_F(Socks5ConnectorTest, MaximumHostLengthIsAccepted)
{
    mock_proxy mock;
    const std::string host(255, 'h');
    auto result = establish(mock, host, 80);
    ASSERT_TRUE(result.has_value()) << describe_error(result.error());
    ASSERT_EQ(mock.request.size(), 4U + 1U + 255U + 2U);
    EXPECT_EQ(mock.request[4], 255);
}

TEST(Socks5ConnectorUnreachableTest, ClosedProxyPortIsUnreachable)
{
    const auto port = test::reserve_closed_port();
    ASSERT_NE(port, 0);

    boost::asio::io_context ctx;
    connection_context log_ctx;
    socks5_connector connector(ctx, make_config(port), log_ctx);
    auto result = test::run_awaitable(ctx, connector.establish_tunnel("example.com", 80));
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().kind, error_kind::kProxyUnreachable);
    EXPECT_TRUE(result->error().ec);
}

TEST_F(Socks5ConnectorTest, SilentProxyTimesOut)
{
    mock_proxy mock;
    mock.silent = true;
    const auto start = std::chrono::steady_clock::now();
    auto result = establish(mock, "example.com", 80, 1);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kProxyAuthRejected);
    EXPECT_EQ(result.error().ec, boost::asio::error::timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(Socks5ConnectorTest, CancelAbortsPendingHandshake)
{
    mock_proxy mock;
    mock.silent = true;
    boost::asio::co_spawn(ctx_, run_mock_proxy(acceptor_, mock), boost::asio::detached);

    socks5_connector connector(ctx_, make_config(proxy_port()), log_ctx_);
    boost::asio::steady_timer timer(ctx_);
    timer.expires_after(std::chrono::milliseconds(50));
    timer.async_wait(
        [&connector](const boost::system::error_code& ec)
        {
            if (!ec)
            {
                connector.cancel();
            }
        });

    auto result = test::run_awaitable(ctx_, connector.establish_tunnel("example.com", 80));
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().ec, boost::asio::error::operation_aborted);
}

TEST_F(Socks5ConnectorTest, CancelBeforeProxySocketOpensSkipsConnect)
{
    socks5_connector connector(ctx_, make_config(proxy_port()), log_ctx_);
    connector.cancel();

    auto result = test::run_awaitable(ctx_, connector.establish_tunnel("example.com", 80));
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().kind, error_kind::kProxyUnreachable);
    EXPECT_EQ(result->error().ec, boost::asio::error::operation_aborted);

    boost::system::error_code ec;
    ec = acceptor_.non_blocking(true, ec);
    ASSERT_FALSE(ec);
    boost::asio::ip::tcp::socket peer(ctx_);
    ec = acceptor_.accept(peer, ec);
    EXPECT_EQ(ec, boost::asio::error::would_block);
}

}    // namespace sockspipe
