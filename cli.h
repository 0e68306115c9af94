#ifndef CLI_H
#define CLI_H

#include <string>
#include <cstdint>
#include <optional>
#include <expected>
#include <string_view>

#include "pipe_error.h"

namespace sockspipe
{

struct target_address
{
    std::string host;
    std::uint16_t port = 0;
};

// base-10 digits only, 0-65535
[[nodiscard]] std::optional<std::uint16_t> parse_port(std::string_view text);

[[nodiscard]] std::expected<target_address, pipe_error> parse_target_arguments(int argc, const char* const* argv);

[[nodiscard]] std::string usage_text(std::string_view program);

}    // namespace sockspipe

#endif
