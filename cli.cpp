#include <string>
#include <cstdint>
#include <charconv>
#include <optional>
#include <expected>
#include <string_view>
#include <system_error>

#include "cli.h"
#include "pipe_error.h"

namespace sockspipe
{

std::optional<std::uint16_t> parse_port(const std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    for (const char c : text)
    {
        if (c < '0' || c > '9')
        {
            return std::nullopt;
        }
    }

    std::uint32_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value > 65535)
    {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

std::expected<target_address, pipe_error> parse_target_arguments(const int argc, const char* const* argv)
{
    if (argc != 3)
    {
        return std::unexpected(make_pipe_error(error_kind::kUsage, "expected 2 arguments, got " + std::to_string(argc > 0 ? argc - 1 : 0)));
    }

    const auto port = parse_port(argv[2]);
    if (!port.has_value())
    {
        return std::unexpected(make_pipe_error(error_kind::kUsage, std::string("invalid port ") + argv[2]));
    }

    target_address target;
    target.host = argv[1];
    target.port = *port;
    return target;
}

std::string usage_text(const std::string_view program)
{
    std::string out = "Usage: ";
    out += program.empty() ? std::string_view("sockspipe") : program;
    out += " <host> <port>\n";
    out += "  relays stdin/stdout through a SOCKS5 CONNECT tunnel\n";
    out += "  SOCKSPIPE_CONFIG=<file> selects a JSON configuration\n";
    return out;
}

}    // namespace sockspipe
