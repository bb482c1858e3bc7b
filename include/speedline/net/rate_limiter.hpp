#pragma once

#include <speedline/core/config.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace speedline::net
{

struct rate_limit_decision
{
    bool allowed{true};
    std::uint32_t limit{0};
    std::uint32_t remaining{0};
    std::chrono::seconds reset{0};    // until the client's window rolls over
    std::chrono::seconds window{0};
};

// ============================================================================
// Rate Limiter
// ============================================================================

// Fixed window per client key. Shared by all connections.
class rate_limiter
{
public:
    using clock = std::chrono::steady_clock;

    explicit rate_limiter(rate_limit_config config);

    rate_limiter(const rate_limiter&) = delete;
    rate_limiter& operator=(const rate_limiter&) = delete;

    // Counts one request for `key`.
    rate_limit_decision consume(const std::string& key, clock::time_point now = clock::now());

    std::size_t tracked_clients() const;
    const rate_limit_config& config() const { return config_; }

private:
    struct window_state
    {
        clock::time_point reset_at;
        std::uint32_t hits{0};
    };

    void sweep(clock::time_point now);

    rate_limit_config config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, window_state> clients_;
    clock::time_point next_sweep_{};
};

} // namespace speedline::net
