#include <speedline/core/transfer_session.hpp>
#include <speedline/logger.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <exception>

namespace speedline
{

const char* to_string(transfer_kind kind) noexcept
{
    switch (kind)
    {
        case transfer_kind::download: return "download";
        case transfer_kind::upload:   return "upload";
    }
    return "unknown";
}

const char* to_string(transfer_state state) noexcept
{
    switch (state)
    {
        case transfer_state::active:    return "active";
        case transfer_state::completed: return "completed";
        case transfer_state::aborted:   return "aborted";
        case transfer_state::oversized: return "oversized";
        case transfer_state::errored:   return "errored";
    }
    return "unknown";
}

std::error_code to_error_code(transfer_state state) noexcept
{
    switch (state)
    {
        case transfer_state::aborted:   return make_error_code(transfer_errc::peer_abort);
        case transfer_state::oversized: return make_error_code(transfer_errc::size_violation);
        case transfer_state::errored:   return make_error_code(transfer_errc::transport_error);
        default:                        return {};
    }
}

std::string make_transfer_id()
{
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

transfer_session::transfer_session(transfer_kind kind,
                                   std::uint64_t total_bytes,
                                   transfer_observer* observer)
  : id_(make_transfer_id())
  , kind_(kind)
  , start_time_(clock::now())
  , total_bytes_(total_bytes)
  , observer_(observer)
{
    if (observer_)
        observer_->on_transfer_started(*this);
}

std::chrono::milliseconds transfer_session::elapsed() const
{
    auto end = finished_at_ ? *finished_at_ : clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start_time_);
}

bool transfer_session::transition_to(transfer_state state)
{
    if (!is_terminal(state) || is_finished())
        return false;

    state_ = state;
    finished_at_ = clock::now();

    if (observer_)
    {
        try {
            observer_->on_transfer_finished(*this);
        }
        catch (const std::exception& e) {
            logger().error("transfer observer failed: reqId={} err={}", id_, e.what());
        }
    }
    return true;
}

} // namespace speedline
