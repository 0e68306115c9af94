#include <memory>
#include <string>
#include <cstdint>
#include <utility>
#include <expected>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "config.h"
#include "forwarder.h"
#include "pipe_error.h"
#include "pipe_client.h"
#include "log_context.h"

namespace sockspipe
{

namespace
{

[[nodiscard]] pipe_error interrupted_error() { return make_pipe_error(error_kind::kInterrupted, "session stopped by signal"); }

}    // namespace

pipe_client::pipe_client(boost::asio::io_context& io_context, const config& cfg, const int input_fd, const int output_fd)
    : io_context_(io_context),
      buffer_size_(cfg.relay.buffer_size),
      input_fd_(input_fd),
      output_fd_(output_fd),
      connector_(io_context, cfg, ctx_)
{
    ctx_.new_trace_id();
}

boost::asio::awaitable<std::expected<void, pipe_error>> pipe_client::run(std::string target_host, const std::uint16_t target_port)
{
    if (stopped_)
    {
        co_return std::unexpected(interrupted_error());
    }

    LOG_CTX_DEBUG(ctx_, "{} target {}:{}", log_event::CONN_INIT, target_host, target_port);
    auto tunnel = co_await connector_.establish_tunnel(target_host, target_port);
    if (!tunnel)
    {
        if (stopped_)
        {
            co_return std::unexpected(interrupted_error());
        }
        co_return std::unexpected(tunnel.error());
    }

    if (stopped_)
    {
        boost::system::error_code ec;
        ec = tunnel->close(ec);
        co_return std::unexpected(interrupted_error());
    }

    forwarder_ = std::make_shared<forwarder>(io_context_, std::move(*tunnel), input_fd_, output_fd_, buffer_size_, ctx_);
    const auto forwarded = co_await forwarder_->run();
    forwarder_.reset();
    co_return forwarded;
}

void pipe_client::stop()
{
    if (stopped_)
    {
        return;
    }
    stopped_ = true;
    LOG_CTX_DEBUG(ctx_, "{} stopping session", log_event::SIGNAL);
    if (forwarder_ != nullptr)
    {
        forwarder_->cancel(interrupted_error());
        return;
    }
    connector_.cancel();
}

}    // namespace sockspipe
