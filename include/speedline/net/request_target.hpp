#pragma once

#include <boost/url/url_view.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace speedline::net
{

// origin-form request target, e.g. "/download?size=1024". Views into the
// target string, which must outlive this object.
class request_target
{
public:
    // A target that is not valid origin-form keeps everything before '?'
    // as its path and exposes no parameters.
    static request_target parse(std::string_view target) noexcept;

    bool valid() const noexcept { return valid_; }
    std::string_view path() const noexcept { return path_; }

    // First occurrence of `name`, percent-decoded ('+' is a space). A key
    // without '=' yields an empty value.
    std::optional<std::string> param(std::string_view name) const;

private:
    boost::urls::url_view url_;
    std::string_view path_;
    bool valid_{false};
};

} // namespace speedline::net
