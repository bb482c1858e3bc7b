#include <speedline/net/http_connection.hpp>
#include <speedline/net/tcp_utils.hpp>
#include <speedline/logger.hpp>

#include <boost/beast/core/string.hpp>

#include <exception>
#include <stdexcept>
#include <limits>

namespace speedline::net
{

namespace
{

std::string_view to_std(boost::beast::string_view sv)
{
    return {sv.data(), sv.size()};
}

bool is_parse_error(const boost::system::error_code& ec)
{
    return ec.category() == http::make_error_code(http::error::bad_target).category() &&
           ec != http::error::end_of_stream &&
           ec != http::error::partial_message;
}

} // namespace

http_connection::http_connection(boost::asio::ip::tcp::socket socket, std::shared_ptr<service_context> context)
  : context_(std::move(context))
  , socket_(std::move(socket))
  , peer_address_(net::remote_address(socket_).value_or("unknown"))
  , body_buf_(context_->config.flow.receive_buf_size)
  , backpressure_(context_->config.flow.send_low_watermark, context_->config.flow.send_high_watermark)
{
    pending_send_buf_.reserve(context_->config.flow.send_high_watermark + context_->config.flow.chunk_size);
    writing_send_buf_.reserve(context_->config.flow.send_high_watermark + context_->config.flow.chunk_size);
}

void http_connection::start()
{
    boost::asio::dispatch(socket_.get_executor(), [self = shared_from_this()]() {
        // The peer probe in on_peer_readable() must never block the strand.
        boost::system::error_code ec;
        self->socket_.non_blocking(true, ec);
        self->do_read_header();
    });
}

void http_connection::close(std::string_view reason)
{
    boost::asio::dispatch(socket_.get_executor(), [self = shared_from_this(), reason = std::string(reason)]() {
        self->do_close(reason);
    });
}

// ============================================================================
// Request dispatch
// ============================================================================

void http_connection::do_read_header()
{
    if (phase_ == phase::closed)
        return;

    phase_ = phase::reading_header;
    parser_.emplace();
    parser_->body_limit(std::numeric_limits<std::uint64_t>::max());

    http::async_read_header(socket_, read_buf_, *parser_,
        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            self->on_header(ec);
        });
}

void http_connection::on_header(boost::system::error_code ec)
{
    if (phase_ == phase::closed)
        return;

    // Previous exchange is over and none of its callbacks is on the stack.
    generator_.reset();
    accountant_.reset();
    drain_handler_ = {};
    backpressure_.reset();
    staged_head_.clear();
    close_after_flush_ = false;
    reading_paused_ = false;
    rate_decision_.reset();

    if (ec)
    {
        if (is_parse_error(ec))
        {
            logger().debug("malformed request: peer={} err={}", peer_address_, ec.message());
            keep_alive_ = false;
            auto res = error_response(http::status::bad_request, "Bad request", version_, false);
            send_response(res);
            return;
        }
        do_close(ec == http::error::end_of_stream ? std::string_view{} : std::string_view{ec.message()});
        return;
    }

    metrics_.requests++;
    auto& req = parser_->get();
    keep_alive_ = req.keep_alive();
    version_ = req.version();

    try
    {
        dispatch_request();
    }
    catch (const std::exception& e)
    {
        logger().error("request failed: peer={} target={} reason={}", peer_address_, to_std(req.target()), e.what());
        if (buffered() > 0 || phase_ == phase::closed)
        {
            do_close("request failed");
            return;
        }
        keep_alive_ = false;
        auto res = error_response(http::status::internal_server_error, "Internal server error", version_, false);
        send_response(res);
    }
}

void http_connection::dispatch_request()
{
    auto& req = parser_->get();

    rate_decision_ = context_->limiter.consume(peer_address_);
    if (!rate_decision_->allowed)
    {
        logger().warn("rate limited: peer={} target={}", peer_address_, to_std(req.target()));
        auto res = error_response(http::status::too_many_requests,
                                  "Too many requests, please try again later", version_, keep_alive_);
        send_response(res);
        return;
    }

    auto route = context_->routes.match(req.method(), to_std(req.target()));
    switch (route.kind)
    {
        case route_kind::download:
            start_download(route);
            break;
        case route_kind::upload:
            start_upload();
            break;
        case route_kind::preflight:
        {
            auto res = empty_response(http::status::no_content, version_, keep_alive_);
            send_response(res, route.allow);
            break;
        }
        case route_kind::method_not_allowed:
        {
            auto res = error_response(http::status::method_not_allowed, "Method not allowed", version_, keep_alive_);
            res.set(http::field::allow, route.allow);
            send_response(res);
            break;
        }
        case route_kind::not_found:
        {
            auto res = error_response(http::status::not_found, "Not found", version_, keep_alive_);
            send_response(res);
            break;
        }
    }
}

// ============================================================================
// Download
// ============================================================================

void http_connection::start_download(const route_match& route)
{
    auto policy = context_->config.limits.download_policy();
    std::optional<std::string_view> requested;
    if (route.size)
        requested = *route.size;

    // An unread request body would be taken for the next request.
    if (request_body_pending())
        keep_alive_ = false;

    phase_ = phase::downloading;
    try
    {
        generator_ = std::make_unique<download_generator>(
            *this, context_->random, policy.resolve(requested), route.size.value_or(""),
            context_->config.flow.chunk_size, context_->observer);
        generator_->start();
    }
    catch (const std::exception& e)
    {
        logger().warn("/download failed reason={}", e.what());
        generator_.reset();
        staged_head_.clear();

        if (buffered() > 0 || phase_ == phase::closed)
        {
            do_close("download setup failed");
            return;
        }
        keep_alive_ = false;
        auto res = error_response(http::status::internal_server_error, "Internal server error", version_, false);
        send_response(res);
        return;
    }

    if (phase_ == phase::downloading && !generator_->stream_ended())
        watch_peer();
}

void http_connection::watch_peer()
{
    // A wait left over from an earlier download is reused.
    if (watching_peer_)
        return;

    watching_peer_ = true;
    socket_.async_wait(boost::asio::ip::tcp::socket::wait_read,
        [self = shared_from_this()](boost::system::error_code ec) {
            self->watching_peer_ = false;
            self->on_peer_readable(ec);
        });
}

void http_connection::on_peer_readable(boost::system::error_code ec)
{
    if (phase_ != phase::downloading || !generator_ || generator_->stream_ended())
        return;

    if (ec)
    {
        if (ec == boost::asio::error::operation_aborted)
            return;
        generator_->on_peer_abort();
        do_close(ec.message());
        return;
    }

    std::uint8_t probe = 0;
    boost::system::error_code peek_ec;
    auto n = socket_.receive(boost::asio::buffer(&probe, 1), boost::asio::socket_base::message_peek, peek_ec);

    if (peek_ec == boost::asio::error::would_block || peek_ec == boost::asio::error::try_again)
    {
        watch_peer();
        return;
    }

    if (peek_ec || n == 0)
    {
        generator_->on_peer_abort();
        do_close("peer closed during download");
        return;
    }

    // Pipelined bytes of the next request; they stay queued in the socket.
}

void http_connection::declare(const stream_head& head)
{
    if (phase_ != phase::downloading)
        throw std::logic_error{"stream declared outside of a download"};

    auto res = stream_response(head, version_, keep_alive_);
    decorate(res);
    staged_head_ = serialize(res);
}

bool http_connection::write(std::span<const std::uint8_t> chunk)
{
    if (phase_ != phase::downloading)
        return false;

    flush_staged_head();
    pending_send_buf_.insert(pending_send_buf_.end(), chunk.begin(), chunk.end());
    do_send();

    backpressure_.update(buffered());
    return !backpressure_.is_saturated();
}

void http_connection::on_drain(std::function<void()> handler)
{
    if (phase_ != phase::downloading)
        return;

    if (!backpressure_.is_saturated())
    {
        boost::asio::post(socket_.get_executor(), [self = shared_from_this(), handler = std::move(handler)]() {
            if (self->phase_ == phase::downloading)
                handler();
        });
        return;
    }

    drain_handler_ = std::move(handler);
}

void http_connection::end()
{
    flush_staged_head();
    do_send();

    if (buffered() == 0)
    {
        boost::asio::post(socket_.get_executor(), [self = shared_from_this()]() {
            self->on_flushed();
        });
    }
}

void http_connection::abort()
{
    do_close("download aborted");
}

// ============================================================================
// Upload
// ============================================================================

void http_connection::start_upload()
{
    auto& req = parser_->get();

    try
    {
        accountant_ = std::make_unique<upload_accountant>(
            *this, context_->config.limits.max_upload_size,
            [this](const upload_report& report) { on_upload_report(report); },
            context_->observer);
        phase_ = phase::uploading;
        accountant_->start();
    }
    catch (const std::exception& e)
    {
        logger().error("/upload failed reason={}", e.what());
        accountant_.reset();
        keep_alive_ = false;
        auto res = error_response(http::status::internal_server_error, "Internal server error", version_, false);
        send_response(res);
        return;
    }

    if (boost::beast::iequals(req[http::field::expect], "100-continue"))
    {
        http::response<http::empty_body> interim{http::status::continue_, version_};
        enqueue(serialize(interim));
    }

    if (parser_->is_done())
    {
        accountant_->on_end();
        return;
    }

    do_read_body();
}

void http_connection::do_read_body()
{
    if (reading_paused_ || phase_ != phase::uploading)
        return;

    auto& body = parser_->get().body();
    body.data = body_buf_.data();
    body.size = body_buf_.size();

    http::async_read_some(socket_, read_buf_, *parser_,
        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            self->on_body(ec);
        });
}

void http_connection::on_body(boost::system::error_code ec)
{
    if (ec == http::error::need_buffer)
        ec = {};

    if (phase_ != phase::uploading || !accountant_ || accountant_->finished() || reading_paused_)
        return;

    auto received = body_buf_.size() - parser_->get().body().size;
    if (received > 0)
    {
        metrics_.bytes_received += received;
        accountant_->on_data({body_buf_.data(), received});
    }

    if (accountant_->finished() || reading_paused_)
        return;

    if (ec)
    {
        if (ec == http::error::partial_message || ec == http::error::end_of_stream ||
            is_peer_disconnect(ec) || ec == boost::asio::error::operation_aborted)
        {
            accountant_->on_abort();
            do_close("peer aborted upload");
            return;
        }

        accountant_->on_error(ec.message());
        return;
    }

    if (parser_->is_done())
    {
        accountant_->on_end();
        return;
    }

    do_read_body();
}

void http_connection::on_upload_report(const upload_report& report)
{
    if (report.error)
        keep_alive_ = false;

    auto res = upload_response(report, version_, keep_alive_);
    send_response(res);
}

void http_connection::pause()
{
    reading_paused_ = true;
}

void http_connection::destroy()
{
    reading_paused_ = true;
    keep_alive_ = false;
    close_after_flush_ = true;

    if (buffered() == 0)
        do_close("upload destroyed");
}

// ============================================================================
// Send path
// ============================================================================

template<typename Body>
void http_connection::send_response(http::response<Body>& res, std::string_view preflight_methods)
{
    decorate(res, preflight_methods);
    if (request_body_pending())
        keep_alive_ = false;
    res.keep_alive(keep_alive_);

    phase_ = phase::responding;
    enqueue(serialize(res));
}

void http_connection::enqueue(std::vector<std::uint8_t> bytes)
{
    pending_send_buf_.insert(pending_send_buf_.end(), bytes.begin(), bytes.end());
    do_send();
}

void http_connection::flush_staged_head()
{
    if (staged_head_.empty())
        return;

    pending_send_buf_.insert(pending_send_buf_.end(), staged_head_.begin(), staged_head_.end());
    staged_head_.clear();
}

void http_connection::do_send()
{
    if (phase_ == phase::closed || !writing_send_buf_.empty() || pending_send_buf_.empty())
        return;

    std::swap(writing_send_buf_, pending_send_buf_);

    boost::asio::async_write(socket_, boost::asio::buffer(writing_send_buf_),
        [self = shared_from_this()](boost::system::error_code ec, std::size_t sent) {
            self->on_write(ec, sent);
        });
}

void http_connection::on_write(boost::system::error_code ec, std::size_t sent)
{
    if (phase_ == phase::closed)
        return;

    if (ec)
    {
        if (phase_ == phase::downloading && generator_)
        {
            if (is_peer_disconnect(ec))
                generator_->on_close();
            else
                generator_->on_error(ec.message());
        }
        do_close(ec.message());
        return;
    }

    metrics_.bytes_sent += sent;
    writing_send_buf_.clear();

    if (backpressure_.update(buffered()) == backpressure_controller::transition::drained && drain_handler_)
    {
        auto handler = std::move(drain_handler_);
        drain_handler_ = {};
        handler();
    }

    if (phase_ == phase::closed)
        return;

    if (!pending_send_buf_.empty())
    {
        do_send();
        return;
    }

    if (writing_send_buf_.empty())
        on_flushed();
}

void http_connection::on_flushed()
{
    if (phase_ == phase::closed || buffered() > 0)
        return;

    if (close_after_flush_)
    {
        do_close("closed after reply");
        return;
    }

    switch (phase_)
    {
        case phase::downloading:
            if (generator_ && generator_->stream_ended())
                finish_exchange();
            break;
        case phase::responding:
            finish_exchange();
            break;
        default:
            // interim 100 Continue while the upload body is still arriving
            break;
    }
}

void http_connection::finish_exchange()
{
    if (!keep_alive_)
    {
        boost::system::error_code ec;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        do_close({});
        return;
    }

    do_read_header();
}

void http_connection::decorate(http::fields& fields, std::string_view preflight_methods) const
{
    apply_cors(fields, preflight_methods);
    if (rate_decision_)
        apply_rate_limit(fields, *rate_decision_);
}

bool http_connection::request_body_pending() const
{
    return parser_ && !parser_->is_done();
}

void http_connection::do_close(std::string_view reason)
{
    if (phase_ == phase::closed)
        return;

    phase_ = phase::closed;

    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    drain_handler_ = {};
    if (generator_)
        generator_->on_close();
    if (accountant_)
        accountant_->on_abort();

    if (!reason.empty())
        logger().debug("connection closed: peer={} reason={}", peer_address_, reason);

    auto close_copy = std::move(close_handler_);
    close_handler_ = {};

    if (close_copy)
    {
        try {
            close_copy(shared_from_this());
        }
        catch (const std::exception& e) {
            logger().error("Exception in close_handler: {}", e.what());
        }
    }
}

} // namespace speedline::net
