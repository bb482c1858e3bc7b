#include <speedline/net/rate_limiter.hpp>

#include <algorithm>

namespace speedline::net
{

namespace
{

std::chrono::seconds ceil_seconds(std::chrono::steady_clock::duration d)
{
    auto secs = std::chrono::ceil<std::chrono::seconds>(d);
    return std::max(secs, std::chrono::seconds{0});
}

} // namespace

rate_limiter::rate_limiter(rate_limit_config config)
  : config_(config)
{
    // Keeps `now + window` within the clock's range.
    config_.window = std::min(config_.window, max_rate_limit_window);
}

rate_limit_decision rate_limiter::consume(const std::string& key, clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (now >= next_sweep_)
        sweep(now);

    auto [it, inserted] = clients_.try_emplace(key);
    auto& state = it->second;
    if (inserted || now >= state.reset_at)
    {
        state.hits = 0;
        state.reset_at = now + config_.window;
    }

    rate_limit_decision decision;
    decision.allowed = state.hits < config_.max_requests;
    if (decision.allowed)
        ++state.hits;

    decision.limit = config_.max_requests;
    decision.remaining = decision.allowed ? config_.max_requests - state.hits : 0;
    decision.reset = ceil_seconds(state.reset_at - now);
    decision.window = ceil_seconds(config_.window);
    return decision;
}

std::size_t rate_limiter::tracked_clients() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

void rate_limiter::sweep(clock::time_point now)
{
    for (auto it = clients_.begin(); it != clients_.end();)
    {
        if (now >= it->second.reset_at)
            it = clients_.erase(it);
        else
            ++it;
    }
    next_sweep_ = now + config_.window;
}

} // namespace speedline::net
