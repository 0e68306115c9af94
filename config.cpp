#include <cerrno>
#include <cstdio>
#include <string>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <expected>

#include "log.h"
#include "config.h"
#include "reflect.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/error/error.h"

namespace reflect
{

template <typename Vis>
void reflect(Vis& vis, sockspipe::config::log_t& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(level);
    REFLECT_MEMBER(file);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, sockspipe::config::proxy_t& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(host);
    REFLECT_MEMBER(port);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, sockspipe::config::timeout_t& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(connect);
    REFLECT_MEMBER(handshake);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, sockspipe::config::relay_t& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(buffer_size);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, sockspipe::config& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(log);
    REFLECT_MEMBER(proxy);
    REFLECT_MEMBER(timeout);
    REFLECT_MEMBER(relay);
    reflectMemberEnd(vis);
}

}    // namespace reflect

namespace sockspipe
{

namespace
{

[[nodiscard]] config_error make_config_error(std::string path, std::string reason)
{
    config_error error;
    error.path = std::move(path);
    error.reason = std::move(reason);
    return error;
}

[[nodiscard]] std::expected<void, config_error> validate_log_config(const config::log_t& log)
{
    if (!is_known_level(log.level))
    {
        return std::unexpected(make_config_error("/log/level", "must be trace/debug/info/warn/warning/err/error"));
    }
    if (log.file.find('\0') != std::string::npos)
    {
        return std::unexpected(make_config_error("/log/file", "must not contain nul"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_proxy_config(const config::proxy_t& proxy)
{
    if (proxy.host.empty())
    {
        return std::unexpected(make_config_error("/proxy/host", "must be non-empty"));
    }
    if (proxy.host.find('\0') != std::string::npos)
    {
        return std::unexpected(make_config_error("/proxy/host", "must not contain nul"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_relay_config(const config::relay_t& relay)
{
    if (relay.buffer_size < kMinRelayBufferSize || relay.buffer_size > kMaxRelayBufferSize)
    {
        return std::unexpected(make_config_error("/relay/buffer_size", "must be between 512 and 1048576"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_config(const config& cfg)
{
    if (const auto log_result = validate_log_config(cfg.log); !log_result)
    {
        return std::unexpected(log_result.error());
    }
    if (const auto proxy_result = validate_proxy_config(cfg.proxy); !proxy_result)
    {
        return std::unexpected(proxy_result.error());
    }
    if (const auto relay_result = validate_relay_config(cfg.relay); !relay_result)
    {
        return std::unexpected(relay_result.error());
    }
    return {};
}

[[nodiscard]] std::expected<std::string, config_error> read_file(const std::string& filename)
{
    char buf[64 * 1024];
    std::string result;
    FILE* f = std::fopen(filename.c_str(), "rb");
    if (f == nullptr)
    {
        return std::unexpected(make_config_error("/", std::string("open file failed: ") + std::strerror(errno)));
    }
    for (;;)
    {
        const std::size_t n = std::fread(buf, 1, sizeof buf, f);
        if (n > 0)
        {
            result.append(buf, n);
        }
        if (n < sizeof buf)
        {
            if (std::ferror(f) != 0)
            {
                std::fclose(f);
                return std::unexpected(make_config_error("/", std::string("read file failed: ") + std::strerror(errno)));
            }
            break;
        }
    }
    std::fclose(f);
    return result;
}

}    // namespace

std::expected<config, config_error> parse_config_text(const std::string& text)
{
    if (const auto nul_pos = text.find('\0'); nul_pos != std::string::npos)
    {
        return std::unexpected(make_config_error("/", "json parse error at offset " + std::to_string(nul_pos) + ": embedded nul byte"));
    }
    rapidjson::Document reader;
    const rapidjson::ParseResult parse_result = reader.Parse(text.data(), text.size());
    if (parse_result.IsError())
    {
        return std::unexpected(make_config_error(
            "/", "json parse error at offset " + std::to_string(parse_result.Offset()) + ": " + rapidjson::GetParseError_En(parse_result.Code())));
    }

    config cfg;
    reflect::JsonReader json_reader{&reader};
    reflect::reflect(json_reader, cfg);
    if (!json_reader.ok())
    {
        return std::unexpected(make_config_error(json_reader.getPath(), "invalid type or value"));
    }

    if (const auto validate_result = validate_config(cfg); !validate_result)
    {
        return std::unexpected(validate_result.error());
    }
    return cfg;
}

std::expected<config, config_error> parse_config_with_error(const std::string& filename)
{
    const auto file_content = read_file(filename);
    if (!file_content)
    {
        return std::unexpected(file_content.error());
    }
    return parse_config_text(*file_content);
}

std::expected<config, config_error> load_config_from_env()
{
    const char* path = std::getenv(kConfigEnv);
    if (path == nullptr || *path == '\0')
    {
        return config{};
    }
    return parse_config_with_error(path);
}

std::string dump_config(const config& cfg) { return reflect::serialize_struct(cfg); }

}    // namespace sockspipe
