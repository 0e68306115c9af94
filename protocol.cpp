#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <algorithm>

#include "protocol.h"

namespace
{

constexpr std::size_t kReplyHeaderLen = 4;
constexpr std::size_t kPortLen = 2;
constexpr std::size_t kIpv6AddrLen = 16;

void append_port(std::vector<std::uint8_t>& buf, const std::uint16_t port)
{
    buf.push_back(static_cast<std::uint8_t>((port >> 8) & 0xFF));
    buf.push_back(static_cast<std::uint8_t>(port & 0xFF));
}

}    // namespace

std::vector<std::uint8_t> socks_codec::encode_method_request() { return {socks::kVer, 0x01, socks::kMethodNoAuth}; }

bool socks_codec::valid_target_host(const std::string& host)
{
    if (host.empty() || host.size() > socks::kMaxDomainLen)
    {
        return false;
    }
    return std::find(host.begin(), host.end(), '\0') == host.end();
}

bool socks_codec::encode_connect_request(const std::string& host, const std::uint16_t port, std::vector<std::uint8_t>& out)
{
    if (!valid_target_host(host))
    {
        return false;
    }

    std::vector<std::uint8_t> buf;
    buf.reserve(kReplyHeaderLen + 1 + host.size() + kPortLen);
    buf.push_back(socks::kVer);
    buf.push_back(socks::kCmdConnect);
    buf.push_back(0x00);
    buf.push_back(socks::kAtypDomain);
    buf.push_back(static_cast<std::uint8_t>(host.size()));
    buf.insert(buf.end(), host.begin(), host.end());
    append_port(buf, port);
    out = std::move(buf);
    return true;
}

bool socks_codec::decode_method_reply(const std::uint8_t* data, const std::size_t len, socks5_method_reply& out)
{
    if (len < socks::kMethodReplyLen)
    {
        return false;
    }
    out.ver = data[0];
    out.method = data[1];
    return out.ver == socks::kVer;
}

bool socks_codec::decode_connect_reply(const std::uint8_t* data, const std::size_t len, socks5_connect_reply& out)
{
    if (len < socks::kConnectReplyLen)
    {
        return false;
    }
    out.ver = data[0];
    out.rep = data[1];
    out.rsv = data[2];
    out.atyp = data[3];
    out.addr_first = data[4];
    return out.ver == socks::kVer;
}

std::optional<std::size_t> socks_codec::connect_reply_tail_len(const socks5_connect_reply& reply)
{
    std::size_t total = 0;
    if (reply.atyp == socks::kAtypIpv4)
    {
        total = socks::kConnectReplyLen;
    }
    else if (reply.atyp == socks::kAtypIpv6)
    {
        total = kReplyHeaderLen + kIpv6AddrLen + kPortLen;
    }
    else if (reply.atyp == socks::kAtypDomain)
    {
        total = kReplyHeaderLen + 1 + reply.addr_first + kPortLen;
    }
    else
    {
        return std::nullopt;
    }

    if (total < socks::kConnectReplyLen)
    {
        return std::nullopt;
    }
    return total - socks::kConnectReplyLen;
}

const char* socks_codec::reply_message(const std::uint8_t rep)
{
    switch (rep)
    {
        case socks::kRepSuccess:
            return "succeeded";
        case socks::kRepGenFail:
            return "general SOCKS server failure";
        case socks::kRepNotAllowed:
            return "connection not allowed by ruleset";
        case socks::kRepNetUnreach:
            return "network unreachable";
        case socks::kRepHostUnreach:
            return "host unreachable";
        case socks::kRepConnRefused:
            return "connection refused";
        case socks::kRepTtlExpired:
            return "TTL expired";
        case socks::kRepCmdNotSupported:
            return "command not supported";
        case socks::kRepAddrTypeNotSupported:
            return "address type not supported";
        default:
            return "unassigned";
    }
}
