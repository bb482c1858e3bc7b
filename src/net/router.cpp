#include <speedline/net/router.hpp>
#include <speedline/net/request_target.hpp>

namespace speedline::net
{

namespace http = boost::beast::http;

namespace
{

constexpr std::string_view download_allow = "GET, OPTIONS";
constexpr std::string_view upload_allow = "POST, OPTIONS";

// Express-style matching tolerates a single trailing slash.
bool path_equals(std::string_view path, std::string_view route)
{
    if (path.size() == route.size() + 1 && path.back() == '/')
        path.remove_suffix(1);
    return path == route;
}

} // namespace

router::router(std::string base_path)
  : download_path_(base_path + "/download")
  , upload_path_(base_path + "/upload")
{
}

route_match router::match(http::verb method, std::string_view target) const
{
    auto parsed = request_target::parse(target);
    route_match result;

    if (path_equals(parsed.path(), download_path_))
    {
        result.allow = download_allow;
        switch (method)
        {
            case http::verb::get:
                result.kind = route_kind::download;
                result.size = parsed.param("size");
                break;
            case http::verb::options:
                result.kind = route_kind::preflight;
                break;
            default:
                result.kind = route_kind::method_not_allowed;
                break;
        }
        return result;
    }

    if (path_equals(parsed.path(), upload_path_))
    {
        result.allow = upload_allow;
        switch (method)
        {
            case http::verb::post:
                result.kind = route_kind::upload;
                break;
            case http::verb::options:
                result.kind = route_kind::preflight;
                break;
            default:
                result.kind = route_kind::method_not_allowed;
                break;
        }
        return result;
    }

    return result;
}

} // namespace speedline::net
