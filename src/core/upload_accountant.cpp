#include <speedline/core/upload_accountant.hpp>
#include <speedline/logger.hpp>

#include <exception>

namespace speedline
{

upload_accountant::upload_accountant(byte_source& source,
                                     std::uint64_t max_upload_size,
                                     reply_handler reply,
                                     transfer_observer* observer)
  : source_(source)
  , max_upload_size_(max_upload_size)
  , reply_(std::move(reply))
  , observer_(observer)
{
}

void upload_accountant::start()
{
    session_.emplace(transfer_kind::upload, 0, observer_);
    logger().debug("/upload start: reqId={} max={}", session_->id(), max_upload_size_);
}

void upload_accountant::on_data(std::span<const std::uint8_t> fragment)
{
    if (!session_ || session_->is_finished())
        return;

    session_->add_bytes(fragment.size());
    if (session_->bytes() <= max_upload_size_)
        return;

    source_.pause();
    if (!session_->transition_to(transfer_state::oversized))
        return;

    auto report = make_report();
    logger().warn("/upload too_large: reqId={} bytes={} millis={}",
                  session_->id(), report.bytes, report.elapsed.count());
    reply(report);
    source_.destroy();
}

void upload_accountant::on_end()
{
    if (!session_ || !session_->transition_to(transfer_state::completed))
        return;

    auto report = make_report();
    logger().debug("/upload end: reqId={} bytes={} millis={}",
                   session_->id(), report.bytes, report.elapsed.count());
    reply(report);
}

void upload_accountant::on_abort()
{
    if (!session_ || !session_->transition_to(transfer_state::aborted))
        return;

    logger().warn("/upload abort: reqId={} bytes={} millis={}",
                  session_->id(), session_->bytes(), session_->elapsed().count());
}

void upload_accountant::on_error(std::string_view reason)
{
    if (!session_ || !session_->transition_to(transfer_state::errored))
        return;

    logger().error("/upload error: reqId={} err={}", session_->id(), reason);
    reply(make_report());
}

upload_report upload_accountant::make_report() const
{
    upload_report report;
    report.state = session_->state();
    report.bytes = session_->bytes();
    report.elapsed = session_->elapsed();
    report.max_bytes = max_upload_size_;
    report.error = session_->error();
    return report;
}

void upload_accountant::reply(const upload_report& report)
{
    if (!reply_)
        return;

    try {
        reply_(report);
    }
    catch (const std::exception& e) {
        logger().error("/upload reply failed: reqId={} err={}", session_->id(), e.what());
    }
}

} // namespace speedline
