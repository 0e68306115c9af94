#ifndef FORWARDER_H
#define FORWARDER_H

#include <memory>
#include <cstdint>
#include <optional>
#include <expected>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "pipe_error.h"
#include "log_context.h"

namespace sockspipe
{

// Relays an open tunnel against a pair of process descriptors. The first direction
// to end (eof or error) stops both; the descriptors are handed back, never closed.
class forwarder : public std::enable_shared_from_this<forwarder>
{
   public:
    forwarder(boost::asio::io_context& io_context,
              boost::asio::ip::tcp::socket tunnel,
              int input_fd,
              int output_fd,
              std::uint32_t buffer_size,
              connection_context& ctx);

    ~forwarder();

    forwarder(const forwarder&) = delete;
    forwarder& operator=(const forwarder&) = delete;

    // completes once both directions have exited
    [[nodiscard]] boost::asio::awaitable<std::expected<void, pipe_error>> run();

    void cancel(pipe_error reason);

   private:
    static boost::asio::awaitable<void> tunnel_to_output_detached(std::shared_ptr<forwarder> self);

    static boost::asio::awaitable<void> input_to_tunnel_detached(std::shared_ptr<forwarder> self);

    boost::asio::awaitable<void> tunnel_to_output();

    boost::asio::awaitable<void> input_to_tunnel();

    void finish_direction(std::optional<pipe_error> outcome);

    void direction_exited();

    void stop();

    void release_descriptors();

    [[nodiscard]] std::expected<void, pipe_error> outcome() const;

   private:
    boost::asio::ip::tcp::socket tunnel_;
    boost::asio::posix::stream_descriptor input_;
    boost::asio::posix::stream_descriptor output_;
    int input_fd_;
    int output_fd_;
    int input_flags_ = -1;
    int output_flags_ = -1;
    std::uint32_t buffer_size_;
    connection_context& ctx_;
    boost::asio::steady_timer done_timer_;
    int pending_ = 0;
    bool finished_ = false;
    std::optional<pipe_error> outcome_;
    bool stopped_ = false;
};

}    // namespace sockspipe

#endif
