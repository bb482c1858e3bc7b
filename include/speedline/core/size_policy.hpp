#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace speedline
{

// ============================================================================
// Size Policy
// ============================================================================

// Leading-integer parse: skips leading whitespace, accepts one sign, stops at
// the first non-digit. Out-of-range values saturate. Empty when no digit is
// found.
std::optional<std::int64_t> parse_leading_integer(std::string_view text) noexcept;

struct size_policy
{
    std::uint64_t default_size;
    std::uint64_t hard_maximum;

    // Effective size for a download request, always in [1, hard_maximum].
    std::uint64_t resolve(std::optional<std::string_view> requested) const noexcept;
};

std::uint64_t resolve_download_size(std::optional<std::string_view> requested,
                                    std::uint64_t default_size,
                                    std::uint64_t hard_maximum) noexcept;

} // namespace speedline
