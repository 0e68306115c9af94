#include <cstdio>
#include <string>
#include <csignal>
#include <utility>
#include <optional>
#include <expected>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/error_code.hpp>

#include "app.h"
#include "cli.h"
#include "log.h"
#include "config.h"
#include "pipe_error.h"
#include "pipe_client.h"
#include "log_context.h"

namespace sockspipe
{

namespace
{

bool register_signal(boost::asio::signal_set& signals, const int signal, const char* signal_name)
{
    boost::system::error_code ec;
    ec = signals.add(signal, ec);
    if (!ec)
    {
        return true;
    }
    LOG_ERROR("failed to register {} error {}", signal_name, ec.message());
    return false;
}

void print_usage(const char* prog, const pipe_error& error)
{
    std::fprintf(stderr, "%s\n", describe_error(error).c_str());
    std::fputs(usage_text(prog == nullptr ? "" : prog).c_str(), stderr);
}

}    // namespace

int run_app(const int argc, const char* const* argv, const stdio_handles& handles)
{
    const auto target = parse_target_arguments(argc, argv);
    if (!target)
    {
        print_usage(argc > 0 ? argv[0] : nullptr, target.error());
        return 1;
    }

    const auto cfg = load_config_from_env();
    if (!cfg)
    {
        const auto& error = cfg.error();
        std::fprintf(stderr, "parse config failed path %s reason %s\n", error.path.c_str(), error.reason.c_str());
        return 1;
    }

    init_log(cfg->log.file, cfg->log.level);

    boost::asio::io_context io_context;
    pipe_client client(io_context, *cfg, handles.input_fd, handles.output_fd);

    boost::asio::signal_set signals(io_context);
    if (!register_signal(signals, SIGINT, "sigint") || !register_signal(signals, SIGTERM, "sigterm"))
    {
        return 1;
    }
    signals.async_wait(
        [&client](const boost::system::error_code& ec, const int signal)
        {
            if (ec)
            {
                return;
            }
            LOG_CTX_WARN(client.context(), "{} received signal {} stopping", log_event::SIGNAL, signal);
            client.stop();
        });

    std::optional<std::expected<void, pipe_error>> outcome;
    boost::asio::co_spawn(
        io_context,
        [&client, &signals, &outcome, host = target->host, port = target->port]() -> boost::asio::awaitable<void>
        {
            outcome.emplace(co_await client.run(host, port));
            boost::system::error_code ec;
            ec = signals.cancel(ec);
        },
        boost::asio::detached);

    io_context.run();

    if (!outcome.has_value())
    {
        LOG_ERROR("session ended without a result");
        return 1;
    }
    if (!*outcome)
    {
        LOG_CTX_ERROR(client.context(), "{}", describe_error(outcome->error()));
        return 1;
    }
    return 0;
}

}    // namespace sockspipe
