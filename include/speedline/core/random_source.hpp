#pragma once

#include <cstdint>
#include <span>

namespace speedline
{

// ============================================================================
// Random Source
// ============================================================================

class random_source
{
public:
    virtual ~random_source() = default;

    // Fills the whole span or throws.
    virtual void fill(std::span<std::uint8_t> out) = 0;
};

// Kernel CSPRNG (getrandom, then /dev/urandom). Throws std::system_error
// when neither yields enough bytes.
class system_random_source : public random_source
{
public:
    void fill(std::span<std::uint8_t> out) override;
};

} // namespace speedline
