#include <speedline/core/config.hpp>

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace speedline
{

namespace
{

std::optional<std::string> process_env(std::string_view name)
{
    const char* value = std::getenv(std::string{name}.c_str());
    if (value == nullptr)
        return std::nullopt;
    return std::string{value};
}

std::string normalize_base_path(std::string path)
{
    while (!path.empty() && path.back() == '/')
        path.pop_back();
    if (!path.empty() && path.front() != '/')
        path.insert(path.begin(), '/');
    return path;
}

} // namespace

std::uint64_t env_positive_integer(const server_config::env_lookup& lookup,
                                   std::string_view name,
                                   std::uint64_t fallback)
{
    auto raw = lookup(name);
    if (!raw || raw->empty())
        return fallback;

    auto parsed = parse_leading_integer(*raw);
    if (!parsed || *parsed <= 0)
        return fallback;
    return static_cast<std::uint64_t>(*parsed);
}

server_config server_config::from_environment()
{
    return from_environment(process_env);
}

server_config server_config::from_environment(const env_lookup& lookup)
{
    server_config config;

    config.limits.default_download_size =
        env_positive_integer(lookup, "DEFAULT_SIZE", default_download_size_fallback);
    config.limits.max_download_size =
        env_positive_integer(lookup, "MAX_DOWNLOAD", max_download_size_fallback);
    config.limits.max_upload_size =
        env_positive_integer(lookup, "MAX_UPLOAD", max_upload_size_fallback);

    if (auto address = lookup("SPEEDLINE_ADDRESS"); address && !address->empty())
        config.listen_address = *address;

    auto port = env_positive_integer(lookup, "SPEEDLINE_PORT", config.listen_port);
    if (port <= std::numeric_limits<std::uint16_t>::max())
        config.listen_port = static_cast<std::uint16_t>(port);

    if (auto base = lookup("SPEEDLINE_BASE_PATH"))
        config.base_path = normalize_base_path(*base);

    config.threads = static_cast<std::size_t>(
        std::min<std::uint64_t>(env_positive_integer(lookup, "SPEEDLINE_THREADS", config.threads), 256));

    config.rate_limit.max_requests = static_cast<std::uint32_t>(std::min<std::uint64_t>(
        env_positive_integer(lookup, "SPEEDLINE_RATE_LIMIT_MAX", config.rate_limit.max_requests),
        std::numeric_limits<std::uint32_t>::max()));
    config.rate_limit.window = std::chrono::milliseconds{static_cast<std::int64_t>(std::min<std::uint64_t>(
        env_positive_integer(lookup, "SPEEDLINE_RATE_LIMIT_WINDOW_MS",
                             static_cast<std::uint64_t>(config.rate_limit.window.count())),
        static_cast<std::uint64_t>(max_rate_limit_window.count())))};

    if (auto level = lookup("SPEEDLINE_LOG_LEVEL"))
    {
        if (auto parsed = parse_log_level(*level))
            config.log_level = *parsed;
    }

    if (auto metrics = lookup("SPEEDLINE_METRICS_ADDRESS"))
        config.metrics_address = *metrics;

    return config;
}

} // namespace speedline
