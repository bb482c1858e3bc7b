#include <speedline/net/http_messages.hpp>

#include <string>

namespace speedline::net
{

namespace
{

constexpr std::string_view json_content_type = "application/json; charset=utf-8";

} // namespace

string_response json_response(http::status status,
                              const nlohmann::ordered_json& body,
                              unsigned version,
                              bool keep_alive)
{
    string_response res{status, version};
    res.set(http::field::content_type, json_content_type);
    res.keep_alive(keep_alive);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

head_response empty_response(http::status status, unsigned version, bool keep_alive)
{
    head_response res{status, version};
    res.keep_alive(keep_alive);
    if (status != http::status::no_content)
        res.content_length(0);
    return res;
}

head_response stream_response(const stream_head& head, unsigned version, bool keep_alive)
{
    head_response res{http::status::ok, version};
    res.set(http::field::content_type, head.content_type);
    if (head.no_store)
        res.set(http::field::cache_control, "no-store");
    res.keep_alive(keep_alive);
    res.content_length(head.content_length);
    return res;
}

string_response upload_response(const upload_report& report, unsigned version, bool keep_alive)
{
    switch (report.state)
    {
        case transfer_state::completed:
            return json_response(http::status::ok,
                                 {{"bytes", report.bytes}, {"millis", report.elapsed.count()}},
                                 version, keep_alive);
        case transfer_state::oversized:
            return json_response(http::status::payload_too_large,
                                 {{"message", "Payload too large"}, {"max", report.max_bytes}},
                                 version, false);
        default:
            return json_response(http::status::internal_server_error,
                                 {{"message", "Failed to receive upload"}},
                                 version, false);
    }
}

string_response error_response(http::status status, std::string_view message,
                               unsigned version, bool keep_alive)
{
    return json_response(status, {{"error", std::string{message}}}, version, keep_alive);
}

void apply_cors(http::fields& fields, std::string_view preflight_methods)
{
    fields.set(http::field::access_control_allow_origin, "*");
    if (!preflight_methods.empty())
    {
        fields.set(http::field::access_control_allow_methods, preflight_methods);
        fields.set(http::field::access_control_allow_headers, "Content-Type");
        fields.set(http::field::access_control_max_age, "600");
    }
}

void apply_rate_limit(http::fields& fields, const rate_limit_decision& decision)
{
    fields.set("RateLimit-Policy", std::to_string(decision.limit) + ";w=" + std::to_string(decision.window.count()));
    fields.set("RateLimit-Limit", std::to_string(decision.limit));
    fields.set("RateLimit-Remaining", std::to_string(decision.remaining));
    fields.set("RateLimit-Reset", std::to_string(decision.reset.count()));
    if (!decision.allowed)
        fields.set(http::field::retry_after, std::to_string(decision.reset.count()));
}

} // namespace speedline::net
