#include <speedline/core/size_policy.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace speedline
{

std::optional<std::int64_t> parse_leading_integer(std::string_view text) noexcept
{
    std::size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
        ++pos;

    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    {
        negative = text[pos] == '-';
        ++pos;
    }

    auto digits_begin = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        ++pos;

    if (pos == digits_begin)
        return std::nullopt;

    std::uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(text.data() + digits_begin, text.data() + pos, magnitude);
    if (ec == std::errc::result_out_of_range)
        magnitude = std::numeric_limits<std::uint64_t>::max();
    else if (ec != std::errc{})
        return std::nullopt;

    constexpr auto max_magnitude = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (magnitude > max_magnitude)
        return negative ? std::numeric_limits<std::int64_t>::min() : std::numeric_limits<std::int64_t>::max();

    auto value = static_cast<std::int64_t>(magnitude);
    return negative ? -value : value;
}

std::uint64_t size_policy::resolve(std::optional<std::string_view> requested) const noexcept
{
    return resolve_download_size(requested, default_size, hard_maximum);
}

std::uint64_t resolve_download_size(std::optional<std::string_view> requested,
                                    std::uint64_t default_size,
                                    std::uint64_t hard_maximum) noexcept
{
    std::uint64_t size = default_size;
    if (requested)
    {
        if (auto parsed = parse_leading_integer(*requested); parsed && *parsed > 0)
            size = static_cast<std::uint64_t>(*parsed);
    }

    size = std::min(size, hard_maximum);
    return std::max<std::uint64_t>(size, 1);
}

} // namespace speedline
