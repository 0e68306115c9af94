#ifndef PIPE_ERROR_H
#define PIPE_ERROR_H

#include <string>
#include <cstdint>

#include <boost/system/error_code.hpp>

namespace sockspipe
{

enum class error_kind : std::uint8_t
{
    kUsage,
    kConfig,
    kProxyUnreachable,
    kProxyAuthRejected,
    kConnectRejected,
    kProtocol,
    kForwarding,
    kInterrupted,
};

struct pipe_error
{
    error_kind kind = error_kind::kProtocol;
    // reply code of a rejected CONNECT, zero otherwise
    std::uint8_t status = 0;
    boost::system::error_code ec;
    std::string reason;
};

[[nodiscard]] pipe_error make_pipe_error(error_kind kind, std::string reason, boost::system::error_code ec = {});

[[nodiscard]] pipe_error make_connect_rejected(std::uint8_t status);

[[nodiscard]] const char* error_kind_name(error_kind kind);

[[nodiscard]] std::string describe_error(const pipe_error& error);

}    // namespace sockspipe

#endif
