#ifndef PIPE_CLIENT_H
#define PIPE_CLIENT_H

#include <memory>
#include <string>
#include <cstdint>
#include <expected>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "config.h"
#include "forwarder.h"
#include "pipe_error.h"
#include "log_context.h"
#include "socks5_connector.h"

namespace sockspipe
{

// One invocation: handshake to completion, then forwarding until either side ends.
class pipe_client
{
   public:
    pipe_client(boost::asio::io_context& io_context, const config& cfg, int input_fd, int output_fd);

    [[nodiscard]] boost::asio::awaitable<std::expected<void, pipe_error>> run(std::string target_host, std::uint16_t target_port);

    // safe from a signal handler callback; the session ends with an interrupted error
    void stop();

    [[nodiscard]] const connection_context& context() const { return ctx_; }

   private:
    boost::asio::io_context& io_context_;
    std::uint32_t buffer_size_;
    int input_fd_;
    int output_fd_;
    bool stopped_ = false;
    connection_context ctx_;
    socks5_connector connector_;
    std::shared_ptr<forwarder> forwarder_;
};

}    // namespace sockspipe

#endif
