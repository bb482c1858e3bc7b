#include <speedline/net/request_target.hpp>

#include <boost/url/parse.hpp>

namespace speedline::net
{

request_target request_target::parse(std::string_view target) noexcept
{
    request_target result;

    auto parsed = boost::urls::parse_origin_form(target);
    if (!parsed)
    {
        result.path_ = target.substr(0, target.find('?'));
        return result;
    }

    result.url_ = *parsed;
    result.path_ = result.url_.encoded_path();
    result.valid_ = true;
    return result;
}

std::optional<std::string> request_target::param(std::string_view name) const
{
    if (!valid_)
        return std::nullopt;

    auto params = url_.params();
    auto it = params.find(name);
    if (it == params.end())
        return std::nullopt;

    auto p = *it;
    return p.has_value ? p.value : std::string{};
}

} // namespace speedline::net
