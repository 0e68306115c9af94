#ifndef LOG_CONTEXT_H
#define LOG_CONTEXT_H

#include <chrono>
#include <string>
#include <cstdint>

namespace sockspipe
{

namespace log_event
{
constexpr const char* CONN_INIT = "conn_init";
constexpr const char* CONN_ESTABLISHED = "conn_established";
constexpr const char* CONN_CLOSE = "conn_close";
constexpr const char* HANDSHAKE = "handshake";
constexpr const char* DATA_SEND = "data_send";
constexpr const char* DATA_RECV = "data_recv";
constexpr const char* SOCKS = "socks";
constexpr const char* TIMEOUT = "timeout";
constexpr const char* SIGNAL = "signal";
}    // namespace log_event

[[nodiscard]] std::string generate_trace_id();

class connection_context
{
   public:
    [[nodiscard]] std::string prefix() const;

    [[nodiscard]] std::string proxy_info() const;

    [[nodiscard]] std::string target_info() const;

    [[nodiscard]] double duration_seconds() const;

    [[nodiscard]] std::string stats_summary() const;

    void new_trace_id() { trace_id_ = generate_trace_id(); }

    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }

    void set_proxy(const std::string& host, const std::uint16_t port)
    {
        proxy_host_ = host;
        proxy_port_ = port;
    }

    void set_target(const std::string& host, const std::uint16_t port)
    {
        target_host_ = host;
        target_port_ = port;
    }

    void add_tx_bytes(const std::uint64_t n) { tx_bytes_ += n; }
    void add_rx_bytes(const std::uint64_t n) { rx_bytes_ += n; }

    [[nodiscard]] std::uint64_t tx_bytes() const { return tx_bytes_; }
    [[nodiscard]] std::uint64_t rx_bytes() const { return rx_bytes_; }

   private:
    std::string trace_id_;
    std::string proxy_host_;
    std::uint16_t proxy_port_ = 0;
    std::string target_host_;
    std::uint16_t target_port_ = 0;
    std::uint64_t tx_bytes_ = 0;
    std::uint64_t rx_bytes_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

}    // namespace sockspipe

#endif
