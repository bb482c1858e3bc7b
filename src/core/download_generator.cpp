#include <speedline/core/download_generator.hpp>
#include <speedline/logger.hpp>

#include <algorithm>
#include <exception>

namespace speedline
{

download_generator::download_generator(byte_sink& sink,
                                       random_source& random,
                                       std::uint64_t effective_size,
                                       std::string requested,
                                       std::size_t chunk_size,
                                       transfer_observer* observer)
  : sink_(sink)
  , random_(random)
  , effective_size_(effective_size)
  , remaining_(effective_size)
  , requested_(std::move(requested))
  , chunk_(std::max<std::size_t>(chunk_size, 1))
  , observer_(observer)
{
}

void download_generator::start()
{
    stream_head head;
    head.content_length = effective_size_;
    sink_.declare(head);

    session_.emplace(transfer_kind::download, effective_size_, observer_);
    logger().debug("/download start: reqId={} requested={} total={}",
                   session_->id(), requested_, effective_size_);

    write_more();
}

void download_generator::write_more()
{
    if (!session_ || session_->is_finished())
        return;

    try
    {
        while (remaining_ > 0)
        {
            auto len = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_.size(), remaining_));
            std::span<std::uint8_t> chunk{chunk_.data(), len};
            random_.fill(chunk);

            remaining_ -= len;
            session_->add_bytes(len);

            bool ready = sink_.write(chunk);

            // A synchronous sink failure lands here already finalized.
            if (session_->is_finished())
                return;

            if (!ready)
            {
                sink_.on_drain([this] { write_more(); });
                return;
            }
        }
    }
    catch (const std::exception& e)
    {
        fail(e.what());
        return;
    }

    stream_ended_ = true;
    sink_.end();

    if (session_->transition_to(transfer_state::completed))
    {
        logger().debug("/download end: reqId={} size={} millis={}",
                       session_->id(), effective_size_, session_->elapsed().count());
    }
}

void download_generator::on_peer_abort()
{
    abort_once();
}

void download_generator::on_close()
{
    // Only meaningful while bytes are outstanding; abort_once() ignores it
    // after the stream was ended.
    abort_once();
}

void download_generator::on_error(std::string_view reason)
{
    if (!session_)
        return;

    if (stream_ended_ || session_->is_finished())
    {
        logger().debug("/download error after finish: reqId={} err={}", session_->id(), reason);
        return;
    }

    logger().error("/download error: reqId={} err={}", session_->id(), reason);
    abort_once();
}

void download_generator::abort_once()
{
    if (!session_ || stream_ended_)
        return;

    if (session_->transition_to(transfer_state::aborted))
    {
        logger().warn("/download abort: reqId={} sent={} remaining={} millis={}",
                      session_->id(), session_->bytes(), remaining_, session_->elapsed().count());
    }
}

void download_generator::fail(std::string_view reason)
{
    if (!session_->transition_to(transfer_state::errored))
        return;

    logger().error("/download failed mid-stream: reqId={} reason={}", session_->id(), reason);
    sink_.abort();
}

} // namespace speedline
