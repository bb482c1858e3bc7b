#pragma once

#include <speedline/core/byte_sink.hpp>
#include <speedline/core/upload_accountant.hpp>
#include <speedline/net/rate_limiter.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace speedline::net
{

namespace http = boost::beast::http;

using string_response = http::response<http::string_body>;
using head_response = http::response<http::empty_body>;

// ============================================================================
// Response Builders
// ============================================================================

string_response json_response(http::status status,
                              const nlohmann::ordered_json& body,
                              unsigned version,
                              bool keep_alive);

head_response empty_response(http::status status, unsigned version, bool keep_alive);

// Header of a download stream; Content-Length is the declared size.
head_response stream_response(const stream_head& head, unsigned version, bool keep_alive);

// 200 {bytes, millis}, 413 {message, max} or 500 {message}.
string_response upload_response(const upload_report& report, unsigned version, bool keep_alive);

string_response error_response(http::status status, std::string_view message,
                               unsigned version, bool keep_alive);

void apply_cors(http::fields& fields, std::string_view preflight_methods = {});
void apply_rate_limit(http::fields& fields, const rate_limit_decision& decision);

// ============================================================================
// Serialization
// ============================================================================

// Serializes a complete message (start line, fields and body) into bytes.
template<typename Body, typename Fields>
std::vector<std::uint8_t> serialize(http::response<Body, Fields>& message)
{
    std::vector<std::uint8_t> out;
    http::response_serializer<Body, Fields> sr{message};

    boost::system::error_code ec;
    do
    {
        sr.next(ec, [&sr, &out](boost::system::error_code& visit_ec, const auto& buffers) {
            visit_ec = {};
            auto n = boost::asio::buffer_size(buffers);
            auto prev = out.size();
            out.resize(prev + n);
            boost::asio::buffer_copy(boost::asio::buffer(out.data() + prev, n), buffers);
            sr.consume(n);
        });
    } while (!ec && !sr.is_done());

    if (ec)
        throw boost::system::system_error{ec};
    return out;
}

} // namespace speedline::net
