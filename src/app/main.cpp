// Speedline server - streams random bytes for download tests and counts
// uploaded bytes for upload tests.

#include <speedline/speedline.hpp>

#ifdef SPEEDLINE_WITH_MONITORING
#include <prometheus/exposer.h>
#endif

#include <atomic>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> running{true};

void signal_handler(int)
{
    running = false;
}

// "host:port", ":port" or "port"
bool apply_bind_override(speedline::server_config& config, std::string_view bind_addr)
{
    auto colon = bind_addr.rfind(':');
    auto host = colon == std::string_view::npos ? std::string_view{} : bind_addr.substr(0, colon);
    auto port_text = colon == std::string_view::npos ? bind_addr : bind_addr.substr(colon + 1);

    auto port = speedline::parse_leading_integer(port_text);
    if (!port || *port <= 0 || *port > 65535)
        return false;

    if (!host.empty())
        config.listen_address = std::string{host};
    config.listen_port = static_cast<std::uint16_t>(*port);
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    using speedline::logger;

    try
    {
        auto config = speedline::server_config::from_environment();
        if (argc > 1 && !apply_bind_override(config, argv[1]))
        {
            std::cerr << "usage: " << argv[0] << " [host:port]" << std::endl;
            return 2;
        }

        if (!config.is_valid())
        {
            std::cerr << "invalid configuration" << std::endl;
            return 1;
        }

        logger().set_level(config.log_level);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        boost::asio::io_context io{static_cast<int>(config.threads)};

        speedline::transfer_observer* observer = nullptr;

#ifdef SPEEDLINE_WITH_MONITORING
        std::unique_ptr<prometheus::Exposer> exposer;
        std::unique_ptr<speedline::monitoring::TransferMetrics> transfer_metrics;

        if (!config.metrics_address.empty())
        {
            using speedline::monitoring::MetricsManager;
            using speedline::monitoring::HealthCheck;

            if (!MetricsManager::Init())
                logger().warn("metrics manager already initialized, reusing its registry");
            auto registry = MetricsManager::GetRegistry();
            HealthCheck::RegisterHealthMetrics(registry);
            transfer_metrics = std::make_unique<speedline::monitoring::TransferMetrics>(registry);
            observer = transfer_metrics.get();

            exposer = std::make_unique<prometheus::Exposer>(config.metrics_address);
            MetricsManager::RegisterWithExposer(*exposer);
            logger().info("metrics exposed on {}", config.metrics_address);
        }
#endif

        auto server = std::make_shared<speedline::net::server>(io, config, observer);
        server->start();

        logger().info("{} threads={} default={} maxDownload={} maxUpload={}",
                      speedline::version_full(), config.threads,
                      config.limits.default_download_size,
                      config.limits.max_download_size,
                      config.limits.max_upload_size);

        // Periodic health refresh
        auto stats_timer = std::make_shared<boost::asio::steady_timer>(io);
        auto refresh = std::make_shared<std::function<void(boost::system::error_code)>>();

        *refresh = [&server, stats_timer, refresh](boost::system::error_code ec) {
            if (ec || !running)
                return;

            auto metrics = server->get_metrics();
            logger().debug("connections={} requests={} sent={} received={}",
                           metrics.active_connections, metrics.total_requests,
                           metrics.total_bytes_sent, metrics.total_bytes_received);

#ifdef SPEEDLINE_WITH_MONITORING
            if (speedline::monitoring::HealthCheck::IsRegistered())
            {
                speedline::monitoring::HealthCheck::UpdateUptime();
                speedline::monitoring::HealthCheck::UpdateActiveConnections(metrics.active_connections);
            }
#endif

            stats_timer->expires_after(std::chrono::seconds{5});
            stats_timer->async_wait(*refresh);
        };

        stats_timer->expires_after(std::chrono::seconds{5});
        stats_timer->async_wait(*refresh);

        auto run_loop = [&io]() {
            while (running)
            {
                io.run_for(std::chrono::milliseconds{100});
            }
        };

        std::vector<std::thread> workers;
        for (std::size_t i = 1; i < config.threads; ++i)
            workers.emplace_back(run_loop);

        run_loop();

        logger().info("Shutting down...");

        for (auto& worker : workers)
            worker.join();

        stats_timer->cancel();
        server->stop();

        // Let close handlers run before the context goes away.
        io.restart();
        io.run_for(std::chrono::milliseconds{500});
        io.stop();

        // Break the self-reference held by the timer callback.
        *refresh = nullptr;

        logger().info("Server stopped");
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
