#pragma once

#include <speedline/core/transfer_observer.hpp>
#include <speedline/core/transfer_session.hpp>
#include <speedline/monitoring/metrics_manager.hpp>

#include <array>

namespace speedline::monitoring
{

    /// Exports transfer lifecycle events as Prometheus series labelled by
    /// kind and, for finished transfers, by outcome. Every series is created
    /// up front so the hot path only touches atomics.
    class TransferMetrics : public transfer_observer
    {
    public:
        explicit TransferMetrics(const std::shared_ptr<prometheus::Registry>& registry);

        void on_transfer_started(const transfer_session& session) override;
        void on_transfer_finished(const transfer_session& session) override;

        [[nodiscard]] double Started(transfer_kind kind) const;
        [[nodiscard]] double Finished(transfer_kind kind, transfer_state outcome) const;
        [[nodiscard]] double Bytes(transfer_kind kind) const;
        [[nodiscard]] double Active(transfer_kind kind) const;

    private:
        static constexpr std::size_t kind_count    = 2;
        static constexpr std::size_t outcome_count = 4;

        static std::size_t KindIndex(transfer_kind kind);
        static std::size_t OutcomeIndex(transfer_state state);

        struct KindSeries
        {
            prometheus::Counter* started = nullptr;
            prometheus::Counter* bytes   = nullptr;
            prometheus::Gauge* active    = nullptr;
            prometheus::Histogram* duration = nullptr;
            std::array<prometheus::Counter*, outcome_count> finished {};
        };

        std::array<KindSeries, kind_count> series_ {};
    };

} // namespace speedline::monitoring
