#pragma once

#include <speedline/monitoring/metrics_manager.hpp>

namespace speedline::monitoring
{

    class HealthCheck
    {
    public:
        static void
          RegisterHealthMetrics(std::shared_ptr<prometheus::Registry> registry);
        static void SetHealthy(bool healthy);
        static void UpdateUptime();
        static void UpdateActiveConnections(std::size_t count);
        [[nodiscard]] static bool IsRegistered();

        /// Drops the gauge pointers; used together with MetricsManager::Reset().
        static void Unregister();

    private:
        inline static prometheus::Gauge* health_status_      = nullptr;
        inline static prometheus::Gauge* uptime_gauge_       = nullptr;
        inline static prometheus::Gauge* active_connections_ = nullptr;
    };

} // namespace speedline::monitoring
