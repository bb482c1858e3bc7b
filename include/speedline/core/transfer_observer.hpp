#pragma once

namespace speedline
{

class transfer_session;

// ============================================================================
// Transfer Observer Interface
// ============================================================================

// Notified once when a session opens and once when it reaches its terminal
// state. Called on the session's executor.
class transfer_observer
{
public:
    virtual ~transfer_observer() = default;
    virtual void on_transfer_started(const transfer_session& session) = 0;
    virtual void on_transfer_finished(const transfer_session& session) = 0;
};

} // namespace speedline
