#include <string>
#include <cstdint>
#include <utility>

#include <boost/system/error_code.hpp>

#include "protocol.h"
#include "pipe_error.h"

namespace sockspipe
{

pipe_error make_pipe_error(const error_kind kind, std::string reason, const boost::system::error_code ec)
{
    pipe_error error;
    error.kind = kind;
    error.reason = std::move(reason);
    error.ec = ec;
    return error;
}

pipe_error make_connect_rejected(const std::uint8_t status)
{
    pipe_error error;
    error.kind = error_kind::kConnectRejected;
    error.status = status;
    error.reason = "proxy rejected connect request";
    return error;
}

const char* error_kind_name(const error_kind kind)
{
    switch (kind)
    {
        case error_kind::kUsage:
            return "usage error";
        case error_kind::kConfig:
            return "config error";
        case error_kind::kProxyUnreachable:
            return "proxy unreachable";
        case error_kind::kProxyAuthRejected:
            return "proxy auth rejected";
        case error_kind::kConnectRejected:
            return "connect rejected";
        case error_kind::kProtocol:
            return "protocol error";
        case error_kind::kForwarding:
            return "forwarding error";
        case error_kind::kInterrupted:
            return "interrupted";
    }
    return "unknown error";
}

std::string describe_error(const pipe_error& error)
{
    std::string out = error_kind_name(error.kind);
    if (!error.reason.empty())
    {
        out += ": ";
        out += error.reason;
    }
    if (error.kind == error_kind::kConnectRejected)
    {
        out += " status=";
        out += std::to_string(static_cast<unsigned int>(error.status));
        out += " (";
        out += socks_codec::reply_message(error.status);
        out += ")";
    }
    if (error.ec)
    {
        out += " (";
        out += error.ec.message();
        out += ")";
    }
    return out;
}

}    // namespace sockspipe
