#include <speedline/monitoring/metrics_manager.hpp>

#include <cstdlib>
#include <regex>

namespace speedline::monitoring
{

    bool MetricsManager::Init()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!registry_)
        {
            registry_    = std::make_shared<prometheus::Registry>();
            initialized_ = true;
            start_time_  = std::chrono::steady_clock::now();

            const char* container = std::getenv("CONTAINER_ID");
            if (container && ValidateLabelValue(container))
            {
                default_labels_["container_id"] = container;
            }
            return true;
        }
        return false; // Already initialized
    }

    std::shared_ptr<prometheus::Registry> MetricsManager::GetRegistry()
    {
        EnsureInitialized();
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_;
    }

    void MetricsManager::Reset()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        registry_.reset();
        default_labels_.clear();
        initialized_ = false;
        start_time_  = {};
    }

    void MetricsManager::RegisterWithExposer(prometheus::Exposer& exposer)
    {
        exposer.RegisterCollectable(GetRegistry());
    }

    void MetricsManager::SetDefaultLabels(
      const std::map<std::string, std::string>& labels
    )
    {
        ValidateLabels(labels);
        std::lock_guard<std::mutex> lock(mutex_);
        default_labels_ = labels;
    }

    std::map<std::string, std::string> MetricsManager::GetDefaultLabels()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return default_labels_;
    }

    std::map<std::string, std::string> MetricsManager::MergeLabels(
      const std::map<std::string, std::string>& labels
    )
    {
        auto merged = GetDefaultLabels();
        for (const auto& [key, value]: labels)
        {
            merged[key] = value;
        }
        return merged;
    }

    prometheus::Family<prometheus::Counter>& MetricsManager::CreateCounterFamily(
      const std::shared_ptr<prometheus::Registry>& registry,
      const std::string& name, const std::string& help
    )
    {
        if (!registry)
        {
            throw std::invalid_argument("Registry cannot be null");
        }
        ValidateMetricName(name);
        return prometheus::BuildCounter().Name(name).Help(help).Register(*registry);
    }

    prometheus::Family<prometheus::Gauge>& MetricsManager::CreateGaugeFamily(
      const std::shared_ptr<prometheus::Registry>& registry,
      const std::string& name, const std::string& help
    )
    {
        if (!registry)
        {
            throw std::invalid_argument("Registry cannot be null");
        }
        ValidateMetricName(name);
        return prometheus::BuildGauge().Name(name).Help(help).Register(*registry);
    }

    prometheus::Family<prometheus::Histogram>& MetricsManager::CreateHistogramFamily(
      const std::shared_ptr<prometheus::Registry>& registry,
      const std::string& name, const std::string& help
    )
    {
        if (!registry)
        {
            throw std::invalid_argument("Registry cannot be null");
        }
        ValidateMetricName(name);
        return prometheus::BuildHistogram().Name(name).Help(help).Register(*registry);
    }

    prometheus::Counter& MetricsManager::add_counter(
      prometheus::Family<prometheus::Counter>& family,
      const std::map<std::string, std::string>& labels
    )
    {
        ValidateLabels(labels);
        return family.Add(MergeLabels(labels));
    }

    prometheus::Gauge& MetricsManager::add_gauge(
      prometheus::Family<prometheus::Gauge>& family,
      const std::map<std::string, std::string>& labels
    )
    {
        ValidateLabels(labels);
        return family.Add(MergeLabels(labels));
    }

    prometheus::Histogram& MetricsManager::add_histogram(
      prometheus::Family<prometheus::Histogram>& family,
      const std::map<std::string, std::string>& labels,
      const std::vector<double>& buckets
    )
    {
        ValidateLabels(labels);
        return family.Add(MergeLabels(labels), buckets);
    }

    prometheus::Gauge& MetricsManager::CreateGauge(
      const std::shared_ptr<prometheus::Registry>& registry,
      const std::string& name, const std::string& help,
      const std::map<std::string, std::string>& labels
    )
    {
        auto& family = CreateGaugeFamily(registry, name, help);
        return add_gauge(family, labels);
    }

    bool MetricsManager::IsInitialized()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return initialized_;
    }

    double MetricsManager::GetUptimeSeconds()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (start_time_ == std::chrono::steady_clock::time_point {})
        {
            start_time_ = std::chrono::steady_clock::now();
        }
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    void MetricsManager::EnsureInitialized()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || !registry_)
        {
            throw std::runtime_error(
              "MetricsManager not initialized. Call MetricsManager::Init() "
              "first."
            );
        }
    }

    void MetricsManager::ValidateMetricName(const std::string& name)
    {
        if (name.empty())
        {
            throw std::invalid_argument("Metric name cannot be empty");
        }
        if (name.size() >= 2 && name[0] == '_' && name[1] == '_')
        {
            throw std::invalid_argument(
              "Metric name '" + name + "' cannot start with '__' (reserved prefix)"
            );
        }

        static const std::regex name_regex("^[a-zA-Z_:][a-zA-Z0-9_:]*$");
        if (!std::regex_match(name, name_regex))
        {
            throw std::invalid_argument(
              "Invalid metric name '" + name + "'. Must match [a-zA-Z_:][a-zA-Z0-9_:]*"
            );
        }
    }

    void MetricsManager::ValidateLabels(
      const std::map<std::string, std::string>& labels
    )
    {
        static const std::regex label_regex("^[a-zA-Z_][a-zA-Z0-9_]*$");

        for (const auto& [key, value]: labels)
        {
            if (key.empty())
            {
                throw std::invalid_argument("Label name cannot be empty");
            }
            if (key.size() >= 2 && key[0] == '_' && key[1] == '_')
            {
                throw std::invalid_argument(
                  "Label name '" + key + "' cannot start with '__' (reserved prefix)"
                );
            }
            if (!std::regex_match(key, label_regex))
            {
                throw std::invalid_argument(
                  "Invalid label name '" + key + "'. Must match [a-zA-Z_][a-zA-Z0-9_]*"
                );
            }
            if (!ValidateLabelValue(value))
            {
                throw std::invalid_argument(
                  "Label value for '" + key + "' contains invalid characters"
                );
            }
        }
    }

    bool MetricsManager::ValidateLabelValue(const std::string& value)
    {
        for (char c: value)
        {
            if (c >= 0 && c < 32 && c != '\t')
            { // Reject control chars except tab
                return false;
            }
        }
        return true;
    }

} // namespace speedline::monitoring
