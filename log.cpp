#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "log.h"

namespace sockspipe
{

namespace
{

struct level_alias
{
    const char* name;
    spdlog::level::level_enum value;
};

constexpr level_alias kLevels[] = {
    {.name = "trace", .value = spdlog::level::trace},
    {.name = "debug", .value = spdlog::level::debug},
    {.name = "info", .value = spdlog::level::info},
    {.name = "warn", .value = spdlog::level::warn},
    {.name = "warning", .value = spdlog::level::warn},
    {.name = "err", .value = spdlog::level::err},
    {.name = "error", .value = spdlog::level::err},
};

std::uint32_t get_log_file_size()
{
    constexpr auto kFileSize = 50 * 1024 * 1024;
    const char* file_size = std::getenv("kLogFileSize");
    if (file_size != nullptr)
    {
        return static_cast<std::uint32_t>(std::atoi(file_size));
    }
    return kFileSize;
}

std::uint32_t get_log_file_count()
{
    constexpr auto kFileCount = 5;
    const char* file_count = std::getenv("kLogFileCount");
    if (file_count != nullptr)
    {
        return static_cast<std::uint32_t>(std::atoi(file_count));
    }
    return kFileCount;
}

spdlog::level::level_enum parse_level_name(const std::string& level)
{
    for (const auto& entry : kLevels)
    {
        if (level == entry.name)
        {
            return entry.value;
        }
    }
    return spdlog::level::info;
}

void init_default_log(const std::string& filename)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!filename.empty())
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, get_log_file_size(), get_log_file_count()));
    }
    auto logger = std::make_shared<spdlog::logger>("", begin(sinks), end(sinks));
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
    spdlog::flush_on(spdlog::level::err);
    spdlog::set_pattern("%Y%m%d %T.%f %t %L %v %s:%#");
}

void apply_env_level()
{
    if (std::getenv("TRACE") != nullptr)
    {
        spdlog::set_level(spdlog::level::trace);
    }
    else if (std::getenv("DEBUG") != nullptr)
    {
        spdlog::set_level(spdlog::level::debug);
    }
}

}    // namespace

void init_log(const std::string& filename, const std::string& level)
{
    init_default_log(filename);

    set_level(level);
    apply_env_level();
}

void set_level(const std::string& level) { spdlog::set_level(parse_level_name(level)); }

bool is_known_level(const std::string& level)
{
    for (const auto& entry : kLevels)
    {
        if (level == entry.name)
        {
            return true;
        }
    }
    return false;
}

void shutdown_log()
{
    if (auto logger = spdlog::default_logger(); logger != nullptr)
    {
        logger->flush();
    }
    spdlog::shutdown();
}

}    // namespace sockspipe
