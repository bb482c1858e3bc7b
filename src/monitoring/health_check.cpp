#include <speedline/monitoring/health_check.hpp>

namespace speedline::monitoring
{

    namespace
    {
        void EnsureRegistered(const prometheus::Gauge* gauge)
        {
            if (!gauge)
            {
                throw std::runtime_error(
                  "Health metrics not registered. Call RegisterHealthMetrics() "
                  "first."
                );
            }
        }
    } // namespace

    void HealthCheck::RegisterHealthMetrics(
      std::shared_ptr<prometheus::Registry> registry
    )
    {
        if (!registry)
        {
            throw std::invalid_argument("Registry cannot be null");
        }

        health_status_ = &MetricsManager::CreateGauge(
          registry,
          "health_status",
          "Service health status (1=healthy, 0=unhealthy)"
        );

        uptime_gauge_ = &MetricsManager::CreateGauge(
          registry, "uptime_seconds", "Service uptime in seconds"
        );

        active_connections_ = &MetricsManager::CreateGauge(
          registry, "speedline_connections_active", "Open client connections"
        );

        health_status_->Set(1.0); // Healthy by default
        uptime_gauge_->Set(0.0);
        active_connections_->Set(0.0);
    }

    void HealthCheck::SetHealthy(bool healthy)
    {
        EnsureRegistered(health_status_);
        health_status_->Set(healthy ? 1.0 : 0.0);
    }

    void HealthCheck::UpdateUptime()
    {
        EnsureRegistered(uptime_gauge_);
        uptime_gauge_->Set(MetricsManager::GetUptimeSeconds());
    }

    void HealthCheck::UpdateActiveConnections(std::size_t count)
    {
        EnsureRegistered(active_connections_);
        active_connections_->Set(static_cast<double>(count));
    }

    bool HealthCheck::IsRegistered()
    {
        return health_status_ != nullptr && uptime_gauge_ != nullptr &&
               active_connections_ != nullptr;
    }

    void HealthCheck::Unregister()
    {
        health_status_      = nullptr;
        uptime_gauge_       = nullptr;
        active_connections_ = nullptr;
    }

} // namespace speedline::monitoring
