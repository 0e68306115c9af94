#ifndef TIMEOUT_IO_H
#define TIMEOUT_IO_H

#include <chrono>
#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <string_view>

#include <boost/asio/read.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/system/error_code.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "log.h"
#include "log_context.h"

namespace sockspipe::timeout_io
{

struct timed_tcp_read_result
{
    bool ok = false;
    bool timed_out = false;
    std::size_t read_size = 0;
    boost::system::error_code ec;
};

struct timed_tcp_write_result
{
    bool ok = false;
    bool timed_out = false;
    std::size_t write_size = 0;
    boost::system::error_code ec;
};

struct timed_tcp_resolve_result
{
    bool ok = false;
    bool timed_out = false;
    boost::asio::ip::tcp::resolver::results_type endpoints;
    boost::system::error_code ec;
};

struct timed_tcp_connect_result
{
    bool ok = false;
    bool timed_out = false;
    boost::system::error_code ec;
};

namespace detail
{

inline void cancel_target(boost::asio::ip::tcp::socket& socket, const std::string_view scope)
{
    boost::system::error_code ec;
    ec = socket.cancel(ec);
    if (ec && ec != boost::asio::error::bad_descriptor)
    {
        LOG_WARN("{} cancel timeout socket failed {}", scope, ec.message());
    }
}

inline void cancel_target(boost::asio::ip::tcp::resolver& resolver, const std::string_view scope)
{
    (void)scope;
    resolver.cancel();
}

// Arms a timer that cancels the pending operations on target. A zero timeout arms nothing.
template <typename Target>
class deadline
{
   public:
    deadline(Target& target, const std::uint32_t timeout_sec, std::string_view scope)
        : timer_(target.get_executor()), state_(std::make_shared<state>())
    {
        if (timeout_sec == 0)
        {
            return;
        }
        timer_.expires_after(std::chrono::seconds(timeout_sec));
        timer_.async_wait(
            [&target, state = state_, scope = std::string(scope)](const boost::system::error_code& ec)
            {
                if (ec || state->finished)
                {
                    return;
                }
                state->expired = true;
                LOG_DEBUG("{} {} deadline expired", log_event::TIMEOUT, scope);
                cancel_target(target, scope);
            });
    }

    ~deadline()
    {
        state_->finished = true;
        timer_.cancel();
    }

    deadline(const deadline&) = delete;
    deadline& operator=(const deadline&) = delete;

    [[nodiscard]] bool expired() const { return state_->expired; }

   private:
    struct state
    {
        bool expired = false;
        bool finished = false;
    };

    boost::asio::steady_timer timer_;
    std::shared_ptr<state> state_;
};

}    // namespace detail

// Completes only once the whole buffer is filled; a short stream is an error.
inline boost::asio::awaitable<timed_tcp_read_result> async_read_with_timeout(boost::asio::ip::tcp::socket& socket,
                                                                             const boost::asio::mutable_buffer buffer,
                                                                             const std::uint32_t timeout_sec,
                                                                             const std::string_view scope = {})
{
    const detail::deadline<boost::asio::ip::tcp::socket> guard(socket, timeout_sec, scope);
    boost::system::error_code read_ec;
    const std::size_t read_size = co_await boost::asio::async_read(socket, buffer, boost::asio::redirect_error(boost::asio::use_awaitable, read_ec));
    if (guard.expired())
    {
        co_return timed_tcp_read_result{.ok = false, .timed_out = true, .read_size = read_size, .ec = boost::asio::error::timed_out};
    }
    if (read_ec)
    {
        co_return timed_tcp_read_result{.ok = false, .timed_out = false, .read_size = read_size, .ec = read_ec};
    }
    co_return timed_tcp_read_result{.ok = true, .timed_out = false, .read_size = read_size, .ec = {}};
}

inline boost::asio::awaitable<timed_tcp_write_result> async_write_with_timeout(boost::asio::ip::tcp::socket& socket,
                                                                               const boost::asio::const_buffer buffer,
                                                                               const std::uint32_t timeout_sec,
                                                                               const std::string_view scope = {})
{
    const detail::deadline<boost::asio::ip::tcp::socket> guard(socket, timeout_sec, scope);
    boost::system::error_code write_ec;
    const std::size_t write_size =
        co_await boost::asio::async_write(socket, buffer, boost::asio::redirect_error(boost::asio::use_awaitable, write_ec));
    if (guard.expired())
    {
        co_return timed_tcp_write_result{.ok = false, .timed_out = true, .write_size = write_size, .ec = boost::asio::error::timed_out};
    }
    if (write_ec)
    {
        co_return timed_tcp_write_result{.ok = false, .timed_out = false, .write_size = write_size, .ec = write_ec};
    }
    co_return timed_tcp_write_result{.ok = true, .timed_out = false, .write_size = write_size, .ec = {}};
}

inline boost::asio::awaitable<timed_tcp_resolve_result> async_resolve_with_timeout(boost::asio::ip::tcp::resolver& resolver,
                                                                                   const std::string& host,
                                                                                   const std::string& port,
                                                                                   const std::uint32_t timeout_sec,
                                                                                   const std::string_view scope = {})
{
    const detail::deadline<boost::asio::ip::tcp::resolver> guard(resolver, timeout_sec, scope);
    boost::system::error_code resolve_ec;
    auto endpoints = co_await resolver.async_resolve(host, port, boost::asio::redirect_error(boost::asio::use_awaitable, resolve_ec));
    if (guard.expired())
    {
        co_return timed_tcp_resolve_result{.ok = false, .timed_out = true, .endpoints = {}, .ec = boost::asio::error::timed_out};
    }
    if (resolve_ec)
    {
        co_return timed_tcp_resolve_result{.ok = false, .timed_out = false, .endpoints = {}, .ec = resolve_ec};
    }
    co_return timed_tcp_resolve_result{.ok = true, .timed_out = false, .endpoints = std::move(endpoints), .ec = {}};
}

inline boost::asio::awaitable<timed_tcp_connect_result> async_connect_with_timeout(boost::asio::ip::tcp::socket& socket,
                                                                                   const boost::asio::ip::tcp::endpoint& endpoint,
                                                                                   const std::uint32_t timeout_sec,
                                                                                   const std::string_view scope = {})
{
    const detail::deadline<boost::asio::ip::tcp::socket> guard(socket, timeout_sec, scope);
    boost::system::error_code connect_ec;
    co_await socket.async_connect(endpoint, boost::asio::redirect_error(boost::asio::use_awaitable, connect_ec));
    if (guard.expired())
    {
        co_return timed_tcp_connect_result{.ok = false, .timed_out = true, .ec = boost::asio::error::timed_out};
    }
    if (connect_ec)
    {
        co_return timed_tcp_connect_result{.ok = false, .timed_out = false, .ec = connect_ec};
    }
    co_return timed_tcp_connect_result{.ok = true, .timed_out = false, .ec = {}};
}

}    // namespace sockspipe::timeout_io

#endif
