#ifndef PROTOCOL_H
#define PROTOCOL_H

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace socks
{
constexpr std::uint8_t kVer = 0x05;
constexpr std::uint8_t kMethodNoAuth = 0x00;
constexpr std::uint8_t kMethodNoAcceptable = 0xFF;

constexpr std::uint8_t kCmdConnect = 0x01;

constexpr std::uint8_t kAtypIpv4 = 0x01;
constexpr std::uint8_t kAtypDomain = 0x03;
constexpr std::uint8_t kAtypIpv6 = 0x04;

constexpr std::uint8_t kRepSuccess = 0x00;
constexpr std::uint8_t kRepGenFail = 0x01;
constexpr std::uint8_t kRepNotAllowed = 0x02;
constexpr std::uint8_t kRepNetUnreach = 0x03;
constexpr std::uint8_t kRepHostUnreach = 0x04;
constexpr std::uint8_t kRepConnRefused = 0x05;
constexpr std::uint8_t kRepTtlExpired = 0x06;
constexpr std::uint8_t kRepCmdNotSupported = 0x07;
constexpr std::uint8_t kRepAddrTypeNotSupported = 0x08;

constexpr std::size_t kMaxDomainLen = 255;
constexpr std::size_t kMethodReplyLen = 2;
// a CONNECT reply carrying an IPv4 bound address
constexpr std::size_t kConnectReplyLen = 10;
}    // namespace socks

struct socks5_method_reply
{
    std::uint8_t ver = 0;
    std::uint8_t method = socks::kMethodNoAcceptable;
};

struct socks5_connect_reply
{
    std::uint8_t ver = 0;
    std::uint8_t rep = socks::kRepGenFail;
    std::uint8_t rsv = 0;
    std::uint8_t atyp = 0;
    // first byte of the bound address; the domain length when atyp is a domain
    std::uint8_t addr_first = 0;
};

class socks_codec
{
   public:
    [[nodiscard]] static std::vector<std::uint8_t> encode_method_request();

    [[nodiscard]] static bool valid_target_host(const std::string& host);

    // false when host is not 1..255 bytes; out is left untouched then
    [[nodiscard]] static bool encode_connect_request(const std::string& host, std::uint16_t port, std::vector<std::uint8_t>& out);

    [[nodiscard]] static bool decode_method_reply(const std::uint8_t* data, std::size_t len, socks5_method_reply& out);

    // only checks the fixed 10-byte frame and the version; rep is left to the caller
    [[nodiscard]] static bool decode_connect_reply(const std::uint8_t* data, std::size_t len, socks5_connect_reply& out);

    // bytes of the reply still unread after the fixed 10-byte frame, nullopt if the frame cannot be completed
    [[nodiscard]] static std::optional<std::size_t> connect_reply_tail_len(const socks5_connect_reply& reply);

    [[nodiscard]] static const char* reply_message(std::uint8_t rep);
};

#endif
