#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <cstdint>
#include <expected>

namespace sockspipe
{

inline constexpr const char* kConfigEnv = "SOCKSPIPE_CONFIG";

struct config
{
    struct log_t
    {
        std::string level = "warn";
        // empty keeps logging on stderr only
        std::string file;
    } log;

    struct proxy_t
    {
        std::string host = "127.0.0.1";
        std::uint16_t port = 10828;
    } proxy;

    // seconds, 0 waits forever
    struct timeout_t
    {
        std::uint32_t connect = 0;
        std::uint32_t handshake = 0;
    } timeout;

    struct relay_t
    {
        std::uint32_t buffer_size = 8192;
    } relay;
};

struct config_error
{
    std::string path = "/";
    std::string reason;
};

inline constexpr std::uint32_t kMinRelayBufferSize = 512;
inline constexpr std::uint32_t kMaxRelayBufferSize = 1024 * 1024;

[[nodiscard]] std::expected<config, config_error> parse_config_with_error(const std::string& filename);
[[nodiscard]] std::expected<config, config_error> parse_config_text(const std::string& text);
// defaults unless SOCKSPIPE_CONFIG names a file
[[nodiscard]] std::expected<config, config_error> load_config_from_env();
[[nodiscard]] std::string dump_config(const config& cfg);

}    // namespace sockspipe

#endif
