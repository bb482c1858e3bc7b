#pragma once

#include <boost/beast/http/verb.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace speedline::net
{

enum class route_kind
{
    download,
    upload,
    preflight,
    not_found,
    method_not_allowed
};

struct route_match
{
    route_kind kind{route_kind::not_found};
    std::optional<std::string> size;   // raw `size` query value for downloads
    std::string_view allow;            // Allow header for 405 and pre-flight
};

// ============================================================================
// Router
// ============================================================================

// Maps method and target onto the transfer endpoints mounted under a base
// path: GET|OPTIONS <base>/download and POST|OPTIONS <base>/upload.
class router
{
public:
    explicit router(std::string base_path = {});

    route_match match(boost::beast::http::verb method, std::string_view target) const;

    const std::string& download_path() const { return download_path_; }
    const std::string& upload_path() const { return upload_path_; }

private:
    std::string download_path_;
    std::string upload_path_;
};

} // namespace speedline::net
