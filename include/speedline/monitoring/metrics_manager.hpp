// ============================================================================
// Core metrics manager
// ============================================================================
#pragma once

#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace speedline::monitoring
{

    class MetricsManager
    {
    public:
        /// Initialize the metrics manager. Must be called before any other methods.
        /// Idempotent (safe to call multiple times).
        /// @return true if initialization succeeded, false if already initialized
        [[nodiscard]] static bool Init();

        [[nodiscard]] static std::shared_ptr<prometheus::Registry> GetRegistry();

        /// Reset the metrics manager (primarily for testing).
        /// Warning: Invalidates all existing metric references.
        static void Reset();

        static void RegisterWithExposer(prometheus::Exposer& exposer);

        /// Set default labels that will be applied to all metrics.
        /// @throws std::invalid_argument if any label name is invalid
        static void SetDefaultLabels(const std::map<std::string, std::string>& labels);
        [[nodiscard]] static std::map<std::string, std::string> GetDefaultLabels();

        /// Merge default labels with provided labels.
        /// Provided labels override defaults if keys conflict.
        [[nodiscard]] static std::map<std::string, std::string>
          MergeLabels(const std::map<std::string, std::string>& labels);

        [[nodiscard]] static prometheus::Family<prometheus::Counter>& CreateCounterFamily(
          const std::shared_ptr<prometheus::Registry>& registry,
          const std::string& name,
          const std::string& help
        );

        [[nodiscard]] static prometheus::Family<prometheus::Gauge>& CreateGaugeFamily(
          const std::shared_ptr<prometheus::Registry>& registry,
          const std::string& name,
          const std::string& help
        );

        [[nodiscard]] static prometheus::Family<prometheus::Histogram>& CreateHistogramFamily(
          const std::shared_ptr<prometheus::Registry>& registry,
          const std::string& name,
          const std::string& help
        );

        /// Add a metric to a family with merged labels.
        /// @return Reference valid until family is destroyed or metric is removed
        [[nodiscard]] static prometheus::Counter& add_counter(
          prometheus::Family<prometheus::Counter>& family,
          const std::map<std::string, std::string>& labels
        );

        [[nodiscard]] static prometheus::Gauge& add_gauge(
          prometheus::Family<prometheus::Gauge>& family,
          const std::map<std::string, std::string>& labels
        );

        [[nodiscard]] static prometheus::Histogram& add_histogram(
          prometheus::Family<prometheus::Histogram>& family,
          const std::map<std::string, std::string>& labels,
          const std::vector<double>& buckets
        );

        /// Create a single unlabelled gauge in a registry.
        [[nodiscard]] static prometheus::Gauge& CreateGauge(
          const std::shared_ptr<prometheus::Registry>& registry,
          const std::string& name,
          const std::string& help,
          const std::map<std::string, std::string>& labels = {}
        );

        [[nodiscard]] static bool IsInitialized();
        [[nodiscard]] static double GetUptimeSeconds();

    private:
        static void EnsureInitialized();

        /// Must match [a-zA-Z_:][a-zA-Z0-9_:]* and not start with __
        static void ValidateMetricName(const std::string& name);
        static void ValidateLabels(const std::map<std::string, std::string>& labels);
        [[nodiscard]] static bool ValidateLabelValue(const std::string& value);

        inline static std::shared_ptr<prometheus::Registry> registry_;
        inline static std::map<std::string, std::string> default_labels_;
        inline static bool initialized_ = false;
        inline static std::chrono::steady_clock::time_point start_time_ {};
        inline static std::mutex mutex_;
    };

} // namespace speedline::monitoring
