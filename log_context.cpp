#include <chrono>
#include <random>
#include <string>
#include <cstdint>
#include <cstdio>
#include <charconv>
#include <system_error>

#include "log_context.h"

namespace sockspipe
{

namespace
{

template <typename IntT>
void append_int(std::string& out, const IntT value)
{
    char buf[32];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc())
    {
        out.append(buf, ptr);
    }
}

std::string fixed_hex_16(const std::uint64_t value)
{
    char buf[16];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, 16);
    if (ec != std::errc())
    {
        return "0000000000000000";
    }

    const auto len = static_cast<std::size_t>(ptr - buf);
    std::string out;
    out.reserve(16);
    out.append(16 - len, '0');
    out.append(buf, len);
    return out;
}

std::string fixed_2(const double value)
{
    char buf[64];
    const int n = std::snprintf(buf, sizeof(buf), "%.2f", value);
    if (n <= 0)
    {
        return "0.00";
    }
    return std::string(buf, static_cast<std::size_t>(n));
}

void append_endpoint(std::string& out, const std::string& host, const std::uint16_t port)
{
    out += host;
    out.push_back(':');
    append_int(out, port);
}

}    // namespace

std::string generate_trace_id()
{
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    return fixed_hex_16(dist(gen));
}

std::string connection_context::prefix() const
{
    std::string out;
    out.reserve(trace_id_.size() + 2);
    out.push_back('t');
    out += trace_id_.empty() ? std::string("-") : trace_id_;
    return out;
}

std::string connection_context::proxy_info() const
{
    std::string out;
    out.reserve(proxy_host_.size() + 8);
    append_endpoint(out, proxy_host_, proxy_port_);
    return out;
}

std::string connection_context::target_info() const
{
    std::string out;
    out.reserve(target_host_.size() + 8);
    append_endpoint(out, target_host_, target_port_);
    return out;
}

double connection_context::duration_seconds() const
{
    const auto now = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    return static_cast<double>(duration.count()) / 1000.0;
}

std::string connection_context::stats_summary() const
{
    std::string out = "tx ";
    out += format_bytes(tx_bytes_);
    out += " rx ";
    out += format_bytes(rx_bytes_);
    out += " duration ";
    out += fixed_2(duration_seconds());
    out.push_back('s');
    return out;
}

std::string format_bytes(const std::uint64_t bytes)
{
    constexpr std::uint64_t kKb = 1024;
    constexpr std::uint64_t kMb = kKb * 1024;
    constexpr std::uint64_t kGb = kMb * 1024;
    if (bytes >= kGb)
    {
        return fixed_2(static_cast<double>(bytes) / static_cast<double>(kGb)) + "GB";
    }
    if (bytes >= kMb)
    {
        return fixed_2(static_cast<double>(bytes) / static_cast<double>(kMb)) + "MB";
    }
    if (bytes >= kKb)
    {
        return fixed_2(static_cast<double>(bytes) / static_cast<double>(kKb)) + "KB";
    }
    std::string out;
    append_int(out, bytes);
    out.push_back('B');
    return out;
}

}    // namespace sockspipe
