#ifndef SOCKS5_CONNECTOR_H
#define SOCKS5_CONNECTOR_H

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <expected>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "config.h"
#include "pipe_error.h"
#include "log_context.h"

namespace sockspipe
{

// Negotiates a SOCKS5 CONNECT through the configured proxy. No authentication,
// domain-name addressing only. The returned socket is a transparent pipe to the target.
class socks5_connector
{
   public:
    socks5_connector(boost::asio::io_context& io_context, const config& cfg, connection_context& ctx);

    [[nodiscard]] boost::asio::awaitable<std::expected<boost::asio::ip::tcp::socket, pipe_error>> establish_tunnel(const std::string& target_host,
                                                                                                                   std::uint16_t target_port);

    // aborts a handshake in flight; the pending step fails with operation_aborted
    void cancel();

   private:
    [[nodiscard]] boost::asio::awaitable<std::expected<void, pipe_error>> connect_proxy();

    [[nodiscard]] boost::asio::awaitable<std::expected<void, pipe_error>> negotiate_method();

    [[nodiscard]] boost::asio::awaitable<std::expected<void, pipe_error>> request_connect(const std::vector<std::uint8_t>& request);

    [[nodiscard]] boost::asio::awaitable<std::expected<void, pipe_error>> drain_bound_address(std::size_t tail_len);

    void close_socket();

   private:
    config::proxy_t proxy_;
    config::timeout_t timeout_;
    connection_context& ctx_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::ip::tcp::resolver resolver_;
    bool cancelled_ = false;
};

}    // namespace sockspipe

#endif
