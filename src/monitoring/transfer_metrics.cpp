#include <speedline/monitoring/transfer_metrics.hpp>

#include <chrono>

namespace speedline::monitoring
{

    namespace
    {
        constexpr std::array<transfer_kind, 2> kinds {
          transfer_kind::download, transfer_kind::upload
        };

        constexpr std::array<transfer_state, 4> outcomes {
          transfer_state::completed,
          transfer_state::aborted,
          transfer_state::oversized,
          transfer_state::errored
        };

        const std::vector<double>& DurationBuckets()
        {
            static const std::vector<double> buckets {
              0.01, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0
            };
            return buckets;
        }
    } // namespace

    TransferMetrics::TransferMetrics(
      const std::shared_ptr<prometheus::Registry>& registry
    )
    {
        auto& started = MetricsManager::CreateCounterFamily(
          registry, "speedline_transfers_started_total", "Transfers opened"
        );
        auto& finished = MetricsManager::CreateCounterFamily(
          registry,
          "speedline_transfers_finished_total",
          "Transfers finished, by outcome"
        );
        auto& bytes = MetricsManager::CreateCounterFamily(
          registry,
          "speedline_transfer_bytes_total",
          "Payload bytes sent (download) or received (upload)"
        );
        auto& duration = MetricsManager::CreateHistogramFamily(
          registry,
          "speedline_transfer_duration_seconds",
          "Time from transfer start to its terminal state"
        );
        auto& active = MetricsManager::CreateGaugeFamily(
          registry, "speedline_transfers_active", "Transfers in progress"
        );

        for (auto kind: kinds)
        {
            auto& s = series_[KindIndex(kind)];
            std::map<std::string, std::string> labels {{"kind", to_string(kind)}};

            s.started  = &MetricsManager::add_counter(started, labels);
            s.bytes    = &MetricsManager::add_counter(bytes, labels);
            s.active   = &MetricsManager::add_gauge(active, labels);
            s.duration = &MetricsManager::add_histogram(duration, labels, DurationBuckets());

            for (auto outcome: outcomes)
            {
                auto outcome_labels       = labels;
                outcome_labels["outcome"] = to_string(outcome);
                s.finished[OutcomeIndex(outcome)] =
                  &MetricsManager::add_counter(finished, outcome_labels);
            }
        }
    }

    void TransferMetrics::on_transfer_started(const transfer_session& session)
    {
        auto& s = series_[KindIndex(session.kind())];
        s.started->Increment();
        s.active->Increment();
    }

    void TransferMetrics::on_transfer_finished(const transfer_session& session)
    {
        auto& s = series_[KindIndex(session.kind())];
        s.active->Decrement();
        s.bytes->Increment(static_cast<double>(session.bytes()));
        s.duration->Observe(
          std::chrono::duration<double>(session.elapsed()).count()
        );
        s.finished[OutcomeIndex(session.state())]->Increment();
    }

    double TransferMetrics::Started(transfer_kind kind) const
    {
        return series_[KindIndex(kind)].started->Value();
    }

    double TransferMetrics::Finished(transfer_kind kind, transfer_state outcome) const
    {
        return series_[KindIndex(kind)].finished[OutcomeIndex(outcome)]->Value();
    }

    double TransferMetrics::Bytes(transfer_kind kind) const
    {
        return series_[KindIndex(kind)].bytes->Value();
    }

    double TransferMetrics::Active(transfer_kind kind) const
    {
        return series_[KindIndex(kind)].active->Value();
    }

    std::size_t TransferMetrics::KindIndex(transfer_kind kind)
    {
        return kind == transfer_kind::download ? 0 : 1;
    }

    std::size_t TransferMetrics::OutcomeIndex(transfer_state state)
    {
        switch (state)
        {
            case transfer_state::aborted:
                return 1;
            case transfer_state::oversized:
                return 2;
            case transfer_state::errored:
                return 3;
            default:
                return 0;
        }
    }

} // namespace speedline::monitoring
