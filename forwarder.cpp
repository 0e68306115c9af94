#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <optional>
#include <expected>

#include <fcntl.h>

#include <boost/asio/read.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "forwarder.h"
#include "pipe_error.h"
#include "log_context.h"

namespace sockspipe
{

namespace
{

[[nodiscard]] bool is_stop_error(const boost::system::error_code& ec)
{
    return ec == boost::asio::error::operation_aborted || ec == boost::asio::error::bad_descriptor;
}

int save_flags(const int fd) { return ::fcntl(fd, F_GETFL); }

void restore_flags(const int fd, const int flags, const connection_context& ctx)
{
    if (flags < 0)
    {
        return;
    }
    if (::fcntl(fd, F_SETFL, flags) != 0)
    {
        LOG_CTX_DEBUG(ctx, "{} restore flags on fd {} failed", log_event::CONN_CLOSE, fd);
    }
}

}    // namespace

forwarder::forwarder(boost::asio::io_context& io_context,
                     boost::asio::ip::tcp::socket tunnel,
                     const int input_fd,
                     const int output_fd,
                     const std::uint32_t buffer_size,
                     connection_context& ctx)
    : tunnel_(std::move(tunnel)),
      input_(io_context),
      output_(io_context),
      input_fd_(input_fd),
      output_fd_(output_fd),
      buffer_size_(buffer_size),
      ctx_(ctx),
      done_timer_(io_context)
{
}

forwarder::~forwarder() { release_descriptors(); }

boost::asio::awaitable<std::expected<void, pipe_error>> forwarder::run()
{
    if (finished_)
    {
        co_return outcome();
    }

    input_flags_ = save_flags(input_fd_);
    output_flags_ = save_flags(output_fd_);

    boost::system::error_code ec;
    ec = input_.assign(input_fd_, ec);
    if (ec)
    {
        stop();
        co_return std::unexpected(make_pipe_error(error_kind::kForwarding, "attach standard input failed", ec));
    }
    ec = output_.assign(output_fd_, ec);
    if (ec)
    {
        stop();
        release_descriptors();
        co_return std::unexpected(make_pipe_error(error_kind::kForwarding, "attach standard output failed", ec));
    }

    LOG_CTX_DEBUG(ctx_, "{} forwarding started buffer {}", log_event::CONN_ESTABLISHED, buffer_size_);

    pending_ = 2;
    const auto executor = tunnel_.get_executor();
    boost::asio::co_spawn(executor, tunnel_to_output_detached(shared_from_this()), boost::asio::detached);
    boost::asio::co_spawn(executor, input_to_tunnel_detached(shared_from_this()), boost::asio::detached);

    done_timer_.expires_at(boost::asio::steady_timer::time_point::max());
    boost::system::error_code wait_ec;
    co_await done_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_ec));

    release_descriptors();
    LOG_CTX_INFO(ctx_, "{} {}", log_event::CONN_CLOSE, ctx_.stats_summary());
    co_return outcome();
}

void forwarder::cancel(pipe_error reason)
{
    LOG_CTX_DEBUG(ctx_, "{} forwarding cancelled {}", log_event::CONN_CLOSE, reason.reason);
    finish_direction(std::move(reason));
}

boost::asio::awaitable<void> forwarder::tunnel_to_output_detached(std::shared_ptr<forwarder> self)
{
    co_await self->tunnel_to_output();
    self->direction_exited();
}

boost::asio::awaitable<void> forwarder::input_to_tunnel_detached(std::shared_ptr<forwarder> self)
{
    co_await self->input_to_tunnel();
    self->direction_exited();
}

boost::asio::awaitable<void> forwarder::tunnel_to_output()
{
    std::vector<std::uint8_t> buf(buffer_size_);
    for (;;)
    {
        boost::system::error_code ec;
        const std::size_t n = co_await tunnel_.async_read_some(boost::asio::buffer(buf), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            if (ec == boost::asio::error::eof)
            {
                LOG_CTX_DEBUG(ctx_, "{} tunnel closed by peer", log_event::DATA_RECV);
                finish_direction(std::nullopt);
            }
            else if (stopped_ && is_stop_error(ec))
            {
                finish_direction(std::nullopt);
            }
            else
            {
                LOG_CTX_DEBUG(ctx_, "{} read tunnel failed {}", log_event::DATA_RECV, ec.message());
                finish_direction(make_pipe_error(error_kind::kForwarding, "read tunnel failed", ec));
            }
            co_return;
        }

        co_await boost::asio::async_write(output_, boost::asio::buffer(buf.data(), n), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            if (stopped_ && is_stop_error(ec))
            {
                finish_direction(std::nullopt);
            }
            else
            {
                LOG_CTX_DEBUG(ctx_, "{} write standard output failed {}", log_event::DATA_RECV, ec.message());
                finish_direction(make_pipe_error(error_kind::kForwarding, "write standard output failed", ec));
            }
            co_return;
        }
        ctx_.add_rx_bytes(n);
        LOG_CTX_TRACE(ctx_, "{} {} bytes to output", log_event::DATA_RECV, n);
    }
}

boost::asio::awaitable<void> forwarder::input_to_tunnel()
{
    std::vector<std::uint8_t> buf(buffer_size_);
    for (;;)
    {
        boost::system::error_code ec;
        const std::size_t n = co_await input_.async_read_some(boost::asio::buffer(buf), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            if (ec == boost::asio::error::eof)
            {
                LOG_CTX_DEBUG(ctx_, "{} standard input closed", log_event::DATA_SEND);
                finish_direction(std::nullopt);
            }
            else if (stopped_ && is_stop_error(ec))
            {
                finish_direction(std::nullopt);
            }
            else
            {
                LOG_CTX_DEBUG(ctx_, "{} read standard input failed {}", log_event::DATA_SEND, ec.message());
                finish_direction(make_pipe_error(error_kind::kForwarding, "read standard input failed", ec));
            }
            co_return;
        }

        co_await boost::asio::async_write(tunnel_, boost::asio::buffer(buf.data(), n), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            if (stopped_ && is_stop_error(ec))
            {
                finish_direction(std::nullopt);
            }
            else
            {
                LOG_CTX_DEBUG(ctx_, "{} write tunnel failed {}", log_event::DATA_SEND, ec.message());
                finish_direction(make_pipe_error(error_kind::kForwarding, "write tunnel failed", ec));
            }
            co_return;
        }
        ctx_.add_tx_bytes(n);
        LOG_CTX_TRACE(ctx_, "{} {} bytes to tunnel", log_event::DATA_SEND, n);
    }
}

void forwarder::finish_direction(std::optional<pipe_error> outcome)
{
    if (!finished_)
    {
        finished_ = true;
        outcome_ = std::move(outcome);
    }
    stop();
}

void forwarder::direction_exited()
{
    if (pending_ > 0 && --pending_ == 0)
    {
        done_timer_.cancel();
    }
}

void forwarder::stop()
{
    if (stopped_)
    {
        return;
    }
    stopped_ = true;

    boost::system::error_code ec;
    ec = tunnel_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected && ec != boost::asio::error::bad_descriptor)
    {
        LOG_CTX_DEBUG(ctx_, "{} shutdown tunnel failed {}", log_event::CONN_CLOSE, ec.message());
    }
    ec = tunnel_.close(ec);
    if (ec && ec != boost::asio::error::bad_descriptor)
    {
        LOG_CTX_WARN(ctx_, "{} close tunnel failed {}", log_event::CONN_CLOSE, ec.message());
    }

    if (input_.is_open())
    {
        ec = input_.cancel(ec);
    }
    if (output_.is_open())
    {
        ec = output_.cancel(ec);
    }
}

void forwarder::release_descriptors()
{
    if (input_.is_open())
    {
        (void)input_.release();
        restore_flags(input_fd_, input_flags_, ctx_);
    }
    if (output_.is_open())
    {
        (void)output_.release();
        restore_flags(output_fd_, output_flags_, ctx_);
    }
}

std::expected<void, pipe_error> forwarder::outcome() const
{
    if (outcome_.has_value())
    {
        return std::unexpected(*outcome_);
    }
    return {};
}

}    // namespace sockspipe
