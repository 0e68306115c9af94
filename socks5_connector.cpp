#include <array>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <expected>

#include <boost/asio/error.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "config.h"
#include "protocol.h"
#include "pipe_error.h"
#include "timeout_io.h"
#include "log_context.h"
#include "socks5_connector.h"

namespace sockspipe
{

namespace
{

constexpr const char* kScope = "socks5 connector";

}    // namespace

socks5_connector::socks5_connector(boost::asio::io_context& io_context, const config& cfg, connection_context& ctx)
    : proxy_(cfg.proxy), timeout_(cfg.timeout), ctx_(ctx), socket_(io_context), resolver_(io_context)
{
    ctx_.set_proxy(proxy_.host, proxy_.port);
}

boost::asio::awaitable<std::expected<boost::asio::ip::tcp::socket, pipe_error>> socks5_connector::establish_tunnel(const std::string& target_host,
                                                                                                                   const std::uint16_t target_port)
{
    ctx_.set_target(target_host, target_port);

    std::vector<std::uint8_t> request;
    if (!socks_codec::encode_connect_request(target_host, target_port, request))
    {
        LOG_CTX_DEBUG(ctx_, "{} invalid target host length {}", log_event::SOCKS, target_host.size());
        co_return std::unexpected(make_pipe_error(
            error_kind::kProtocol, "target host must be 1-255 bytes without nul, got " + std::to_string(target_host.size()) + " bytes"));
    }

    if (auto connected = co_await connect_proxy(); !connected)
    {
        close_socket();
        co_return std::unexpected(connected.error());
    }

    if (auto negotiated = co_await negotiate_method(); !negotiated)
    {
        close_socket();
        co_return std::unexpected(negotiated.error());
    }

    if (auto accepted = co_await request_connect(request); !accepted)
    {
        close_socket();
        co_return std::unexpected(accepted.error());
    }

    boost::system::error_code ec;
    ec = socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec)
    {
        LOG_CTX_WARN(ctx_, "{} set no delay failed {}", log_event::SOCKS, ec.message());
    }

    LOG_CTX_INFO(ctx_, "{} tunnel open {} via {}", log_event::CONN_ESTABLISHED, ctx_.target_info(), ctx_.proxy_info());
    co_return std::move(socket_);
}

void socks5_connector::cancel()
{
    cancelled_ = true;
    resolver_.cancel();
    boost::system::error_code ec;
    ec = socket_.cancel(ec);
    if (ec && ec != boost::asio::error::bad_descriptor)
    {
        LOG_CTX_WARN(ctx_, "{} cancel failed {}", log_event::SOCKS, ec.message());
    }
}

boost::asio::awaitable<std::expected<void, pipe_error>> socks5_connector::connect_proxy()
{
    LOG_CTX_DEBUG(ctx_, "{} resolving proxy {}", log_event::CONN_INIT, ctx_.proxy_info());
    const auto resolved = co_await timeout_io::async_resolve_with_timeout(resolver_, proxy_.host, std::to_string(proxy_.port), timeout_.connect, kScope);
    if (!resolved.ok)
    {
        LOG_CTX_DEBUG(ctx_, "{} resolve proxy failed {}", log_event::CONN_INIT, resolved.ec.message());
        co_return std::unexpected(make_pipe_error(error_kind::kProxyUnreachable, "resolve " + ctx_.proxy_info() + " failed", resolved.ec));
    }

    boost::system::error_code last_ec = boost::asio::error::host_not_found;
    for (const auto& entry : resolved.endpoints)
    {
        // a cancel that landed while no socket was open
        if (cancelled_)
        {
            last_ec = boost::asio::error::operation_aborted;
            break;
        }
        const auto endpoint = entry.endpoint();
        if (socket_.is_open())
        {
            boost::system::error_code close_ec;
            close_ec = socket_.close(close_ec);
        }

        boost::system::error_code open_ec;
        open_ec = socket_.open(endpoint.protocol(), open_ec);
        if (open_ec)
        {
            last_ec = open_ec;
            continue;
        }

        const auto connected = co_await timeout_io::async_connect_with_timeout(socket_, endpoint, timeout_.connect, kScope);
        if (connected.ok)
        {
            LOG_CTX_DEBUG(ctx_, "{} connected proxy {}", log_event::CONN_INIT, ctx_.proxy_info());
            co_return std::expected<void, pipe_error>{};
        }
        last_ec = connected.ec;
        LOG_CTX_DEBUG(ctx_, "{} connect proxy endpoint failed {}", log_event::CONN_INIT, connected.ec.message());
        if (connected.ec == boost::asio::error::operation_aborted)
        {
            break;
        }
    }

    co_return std::unexpected(make_pipe_error(error_kind::kProxyUnreachable, "connect " + ctx_.proxy_info() + " failed", last_ec));
}

boost::asio::awaitable<std::expected<void, pipe_error>> socks5_connector::negotiate_method()
{
    if (cancelled_)
    {
        co_return std::unexpected(make_pipe_error(error_kind::kProxyAuthRejected, "handshake cancelled", boost::asio::error::operation_aborted));
    }
    const auto greeting = socks_codec::encode_method_request();
    const auto sent = co_await timeout_io::async_write_with_timeout(socket_, boost::asio::buffer(greeting), timeout_.handshake, kScope);
    if (!sent.ok)
    {
        co_return std::unexpected(make_pipe_error(error_kind::kProxyAuthRejected, "send method request failed", sent.ec));
    }

    std::array<std::uint8_t, socks::kMethodReplyLen> reply_buf{};
    const auto received = co_await timeout_io::async_read_with_timeout(socket_, boost::asio::buffer(reply_buf), timeout_.handshake, kScope);
    if (!received.ok)
    {
        LOG_CTX_DEBUG(ctx_, "{} method reply short read {} bytes", log_event::HANDSHAKE, received.read_size);
        co_return std::unexpected(make_pipe_error(error_kind::kProxyAuthRejected, "read method reply failed", received.ec));
    }

    socks5_method_reply reply;
    if (!socks_codec::decode_method_reply(reply_buf.data(), reply_buf.size(), reply))
    {
        co_return std::unexpected(
            make_pipe_error(error_kind::kProxyAuthRejected, "unexpected method reply version " + std::to_string(static_cast<unsigned int>(reply.ver))));
    }
    if (reply.method != socks::kMethodNoAuth)
    {
        co_return std::unexpected(make_pipe_error(error_kind::kProxyAuthRejected,
                                                  "proxy selected method " + std::to_string(static_cast<unsigned int>(reply.method))));
    }

    LOG_CTX_DEBUG(ctx_, "{} no auth accepted", log_event::HANDSHAKE);
    co_return std::expected<void, pipe_error>{};
}

boost::asio::awaitable<std::expected<void, pipe_error>> socks5_connector::request_connect(const std::vector<std::uint8_t>& request)
{
    if (cancelled_)
    {
        co_return std::unexpected(make_pipe_error(error_kind::kProtocol, "handshake cancelled", boost::asio::error::operation_aborted));
    }
    const auto sent = co_await timeout_io::async_write_with_timeout(socket_, boost::asio::buffer(request), timeout_.handshake, kScope);
    if (!sent.ok)
    {
        co_return std::unexpected(make_pipe_error(error_kind::kProtocol, "send connect request failed", sent.ec));
    }

    std::array<std::uint8_t, socks::kConnectReplyLen> reply_buf{};
    const auto received = co_await timeout_io::async_read_with_timeout(socket_, boost::asio::buffer(reply_buf), timeout_.handshake, kScope);
    if (!received.ok)
    {
        LOG_CTX_DEBUG(ctx_, "{} connect reply short read {} bytes", log_event::HANDSHAKE, received.read_size);
        co_return std::unexpected(make_pipe_error(error_kind::kProtocol, "read connect reply failed", received.ec));
    }

    socks5_connect_reply reply;
    if (!socks_codec::decode_connect_reply(reply_buf.data(), reply_buf.size(), reply))
    {
        co_return std::unexpected(
            make_pipe_error(error_kind::kProtocol, "unexpected connect reply version " + std::to_string(static_cast<unsigned int>(reply.ver))));
    }
    if (reply.rep != socks::kRepSuccess)
    {
        LOG_CTX_DEBUG(ctx_, "{} connect rejected rep {}", log_event::HANDSHAKE, static_cast<unsigned int>(reply.rep));
        co_return std::unexpected(make_connect_rejected(reply.rep));
    }

    const auto tail_len = socks_codec::connect_reply_tail_len(reply);
    if (!tail_len.has_value())
    {
        co_return std::unexpected(make_pipe_error(
            error_kind::kProtocol, "unsupported bound address type " + std::to_string(static_cast<unsigned int>(reply.atyp))));
    }
    co_return co_await drain_bound_address(*tail_len);
}

boost::asio::awaitable<std::expected<void, pipe_error>> socks5_connector::drain_bound_address(const std::size_t tail_len)
{
    if (tail_len == 0)
    {
        co_return std::expected<void, pipe_error>{};
    }

    std::vector<std::uint8_t> tail(tail_len);
    const auto received = co_await timeout_io::async_read_with_timeout(socket_, boost::asio::buffer(tail), timeout_.handshake, kScope);
    if (!received.ok)
    {
        co_return std::unexpected(make_pipe_error(error_kind::kProtocol, "read bound address failed", received.ec));
    }
    LOG_CTX_TRACE(ctx_, "{} drained {} bound address bytes", log_event::HANDSHAKE, tail_len);
    co_return std::expected<void, pipe_error>{};
}

void socks5_connector::close_socket()
{
    boost::system::error_code ec;
    ec = socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected && ec != boost::asio::error::bad_descriptor)
    {
        LOG_CTX_DEBUG(ctx_, "{} shutdown proxy socket failed {}", log_event::SOCKS, ec.message());
    }
    ec = socket_.close(ec);
    if (ec && ec != boost::asio::error::bad_descriptor)
    {
        LOG_CTX_WARN(ctx_, "{} close proxy socket failed {}", log_event::SOCKS, ec.message());
    }
}

}    // namespace sockspipe
