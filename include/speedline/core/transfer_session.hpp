#pragma once

#include <speedline/core/error.hpp>
#include <speedline/core/transfer_observer.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace speedline
{

enum class transfer_kind
{
    download,
    upload
};

// ============================================================================
// Transfer State
// ============================================================================

enum class transfer_state
{
    active,
    completed,
    aborted,
    oversized,
    errored
};

const char* to_string(transfer_kind kind) noexcept;
const char* to_string(transfer_state state) noexcept;

inline bool is_terminal(transfer_state state) noexcept
{
    return state != transfer_state::active;
}

// Empty for active and completed transfers.
std::error_code to_error_code(transfer_state state) noexcept;

// ============================================================================
// Transfer Session
// ============================================================================

// Identity, timing, byte accounting and terminal state of one transfer.
// The state leaves `active` at most once: transition_to() only has an effect
// on its first call with a terminal state, every later call is a no-op.
// Not thread-safe; a session belongs to one connection strand.
class transfer_session
{
public:
    using clock = std::chrono::steady_clock;

    transfer_session(transfer_kind kind,
                     std::uint64_t total_bytes = 0,
                     transfer_observer* observer = nullptr);

    transfer_session(const transfer_session&) = delete;
    transfer_session& operator=(const transfer_session&) = delete;

    const std::string& id() const { return id_; }
    transfer_kind kind() const { return kind_; }
    clock::time_point start_time() const { return start_time_; }

    // Declared size of a download, zero for uploads.
    std::uint64_t total_bytes() const { return total_bytes_; }

    // Bytes handed to the consumer (download) or received (upload).
    std::uint64_t bytes() const { return bytes_; }
    void add_bytes(std::uint64_t n) { bytes_ += n; }

    transfer_state state() const { return state_; }
    bool is_finished() const { return is_terminal(state_); }
    std::error_code error() const { return to_error_code(state_); }

    // Time from start to the terminal transition, or to now while active.
    std::chrono::milliseconds elapsed() const;

    // Returns true only for the call that performed the transition.
    bool transition_to(transfer_state state);

private:
    std::string id_;
    transfer_kind kind_;
    clock::time_point start_time_;
    std::optional<clock::time_point> finished_at_;
    std::uint64_t total_bytes_;
    std::uint64_t bytes_{0};
    transfer_state state_{transfer_state::active};
    transfer_observer* observer_;
};

std::string make_transfer_id();

} // namespace speedline
