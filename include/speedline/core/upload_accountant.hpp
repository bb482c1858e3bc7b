#pragma once

#include <speedline/core/byte_source.hpp>
#include <speedline/core/transfer_session.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>

namespace speedline
{

struct upload_report
{
    transfer_state state{transfer_state::active};
    std::uint64_t bytes{0};
    std::chrono::milliseconds elapsed{0};
    std::uint64_t max_bytes{0};
    std::error_code error;
};

// ============================================================================
// Upload Accountant
// ============================================================================

// Counts the bytes of an inbound stream and enforces a hard ceiling. The
// ceiling is checked after every fragment; on breach the source is paused,
// an oversized report is produced and the source destroyed.
//
// The reply handler receives exactly one report for completed, oversized and
// errored uploads. Aborted uploads are logged only, the peer is gone.
class upload_accountant
{
public:
    using reply_handler = std::function<void(const upload_report&)>;

    upload_accountant(byte_source& source,
                      std::uint64_t max_upload_size,
                      reply_handler reply,
                      transfer_observer* observer = nullptr);

    upload_accountant(const upload_accountant&) = delete;
    upload_accountant& operator=(const upload_accountant&) = delete;

    void start();

    // Transport notifications
    void on_data(std::span<const std::uint8_t> fragment);
    void on_end();
    void on_abort();
    void on_error(std::string_view reason);

    bool started() const { return session_.has_value(); }
    const transfer_session& session() const { return *session_; }
    bool finished() const { return session_ && session_->is_finished(); }
    std::uint64_t bytes() const { return session_ ? session_->bytes() : 0; }
    std::uint64_t max_upload_size() const { return max_upload_size_; }

private:
    upload_report make_report() const;
    void reply(const upload_report& report);

    byte_source& source_;
    std::uint64_t max_upload_size_;
    reply_handler reply_;
    transfer_observer* observer_;

    std::optional<transfer_session> session_;
};

} // namespace speedline
