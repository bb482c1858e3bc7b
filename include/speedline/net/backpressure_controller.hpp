#pragma once

#include <cstddef>

namespace speedline::net
{

// ============================================================================
// Backpressure Controller
// ============================================================================

// Hysteresis over the number of buffered bytes: saturates above the high
// watermark and drains only once the buffer falls below the low watermark.
class backpressure_controller
{
public:
    enum class transition
    {
        none,
        saturated,
        drained
    };

private:
    std::size_t low_watermark_;
    std::size_t high_watermark_;
    bool saturated_{false};

public:
    backpressure_controller(std::size_t low, std::size_t high)
        : low_watermark_(low), high_watermark_(high) {}

    transition update(std::size_t buffered)
    {
        if (!saturated_ && buffered > high_watermark_)
        {
            saturated_ = true;
            return transition::saturated;
        }

        if (saturated_ && buffered < low_watermark_)
        {
            saturated_ = false;
            return transition::drained;
        }

        return transition::none;
    }

    bool is_saturated() const { return saturated_; }

    void reset()
    {
        saturated_ = false;
    }

    std::size_t low_watermark() const { return low_watermark_; }
    std::size_t high_watermark() const { return high_watermark_; }
};

} // namespace speedline::net
