#pragma once

#include <speedline/core/size_policy.hpp>
#include <speedline/logger.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace speedline
{

inline constexpr std::uint64_t default_download_size_fallback = 10 * 1024 * 1024;  // 10MB
inline constexpr std::uint64_t max_download_size_fallback = 100 * 1024 * 1024;     // 100MB
inline constexpr std::uint64_t max_upload_size_fallback = 100 * 1024 * 1024;       // 100MB
inline constexpr std::size_t download_chunk_size = 64 * 1024;

// ============================================================================
// Transfer Limits
// ============================================================================

struct transfer_limits
{
    std::uint64_t default_download_size{default_download_size_fallback};
    std::uint64_t max_download_size{max_download_size_fallback};
    std::uint64_t max_upload_size{max_upload_size_fallback};

    size_policy download_policy() const
    {
        return {default_download_size, max_download_size};
    }
};

// ============================================================================
// Flow Control
// ============================================================================

struct flow_config
{
    std::size_t chunk_size{download_chunk_size};
    std::size_t receive_buf_size{64 * 1024};

    // Send buffer saturation thresholds
    std::size_t send_low_watermark{512 * 1024};
    std::size_t send_high_watermark{1024 * 1024};

    // TCP keep-alive probe delay for accepted sockets
    int keepalive_idle_seconds{60};
};

// ============================================================================
// Rate Limiting
// ============================================================================

inline constexpr std::chrono::milliseconds max_rate_limit_window{std::chrono::hours{24}};

struct rate_limit_config
{
    std::uint32_t max_requests{10};
    std::chrono::milliseconds window{60 * 1000};
};

// ============================================================================
// Server Configuration
// ============================================================================

struct server_config
{
    using env_lookup = std::function<std::optional<std::string>(std::string_view)>;

    transfer_limits limits;
    flow_config flow;
    rate_limit_config rate_limit;

    std::string listen_address{"0.0.0.0"};
    std::uint16_t listen_port{8080};
    std::string base_path;
    std::size_t threads{1};

    LogLevel log_level{LogLevel::Info};
    std::string metrics_address;

    // Resolved once at start-up. Unset, non-numeric, zero or negative integer
    // values fall back to the defaults above.
    static server_config from_environment();
    static server_config from_environment(const env_lookup& lookup);

    bool is_valid() const
    {
        return limits.default_download_size > 0 &&
               limits.max_download_size > 0 &&
               limits.max_upload_size > 0 &&
               flow.chunk_size > 0 &&
               flow.receive_buf_size > 0 &&
               flow.send_low_watermark > 0 &&
               flow.send_low_watermark <= flow.send_high_watermark &&
               rate_limit.max_requests > 0 &&
               rate_limit.window.count() > 0 &&
               rate_limit.window <= max_rate_limit_window &&
               threads > 0 &&
               (base_path.empty() || (base_path.front() == '/' && base_path.back() != '/'));
    }
};

// Reads an integer variable with the fallback rule above.
std::uint64_t env_positive_integer(const server_config::env_lookup& lookup,
                                   std::string_view name,
                                   std::uint64_t fallback);

} // namespace speedline
