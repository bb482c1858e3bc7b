#pragma once

#include <speedline/core/byte_sink.hpp>
#include <speedline/core/byte_source.hpp>
#include <speedline/core/config.hpp>
#include <speedline/core/download_generator.hpp>
#include <speedline/core/random_source.hpp>
#include <speedline/core/upload_accountant.hpp>
#include <speedline/net/backpressure_controller.hpp>
#include <speedline/net/http_messages.hpp>
#include <speedline/net/rate_limiter.hpp>
#include <speedline/net/router.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace speedline::net
{

// State shared by every connection of one server.
struct service_context
{
    explicit service_context(server_config cfg, transfer_observer* obs = nullptr)
      : config(std::move(cfg))
      , routes(config.base_path)
      , limiter(config.rate_limit)
      , observer(obs)
    {
    }

    server_config config;
    router routes;
    rate_limiter limiter;
    system_random_source random;
    transfer_observer* observer;
};

struct connection_metrics
{
    std::atomic<std::uint64_t> bytes_sent{0};
    std::atomic<std::uint64_t> bytes_received{0};
    std::atomic<std::uint64_t> requests{0};
    std::chrono::steady_clock::time_point created_at{std::chrono::steady_clock::now()};
};

// ============================================================================
// HTTP Connection
// ============================================================================

// One keep-alive HTTP/1.1 connection. Requests are served one at a time; a
// download drives the connection as a byte_sink, an upload as a byte_source.
// All handlers run on the socket's strand.
class http_connection : public std::enable_shared_from_this<http_connection>
                      , public byte_sink
                      , public byte_source
{
public:
    using close_callback = std::function<void(std::shared_ptr<http_connection>)>;

private:
    enum class phase
    {
        reading_header,
        downloading,
        uploading,
        responding,
        closed
    };

    using request_parser = http::request_parser<http::buffer_body>;

    std::shared_ptr<service_context> context_;
    boost::asio::ip::tcp::socket socket_;
    std::string peer_address_;

    phase phase_{phase::reading_header};
    bool keep_alive_{false};
    unsigned version_{11};
    bool close_after_flush_{false};

    // Request
    boost::beast::flat_buffer read_buf_;
    std::optional<request_parser> parser_;
    std::vector<std::uint8_t> body_buf_;
    bool reading_paused_{false};
    bool watching_peer_{false};
    std::optional<rate_limit_decision> rate_decision_;

    // Send path
    std::vector<std::uint8_t> staged_head_;
    std::vector<std::uint8_t> writing_send_buf_;
    std::vector<std::uint8_t> pending_send_buf_;
    backpressure_controller backpressure_;
    std::function<void()> drain_handler_;

    // Transfers, kept until the next request so callbacks never outlive them
    std::unique_ptr<download_generator> generator_;
    std::unique_ptr<upload_accountant> accountant_;

    close_callback close_handler_;
    connection_metrics metrics_;

public:
    http_connection(boost::asio::ip::tcp::socket socket, std::shared_ptr<service_context> context);
    ~http_connection() override = default;

    http_connection(const http_connection&) = delete;
    http_connection& operator=(const http_connection&) = delete;

    void set_close_handler(close_callback handler)
    {
        close_handler_ = std::move(handler);
    }

    void start();

    // Safe to call from any thread.
    void close(std::string_view reason);

    const connection_metrics& metrics() const { return metrics_; }
    const std::string& peer_address() const { return peer_address_; }

    // byte_sink
    void declare(const stream_head& head) override;
    bool write(std::span<const std::uint8_t> chunk) override;
    void on_drain(std::function<void()> handler) override;
    void end() override;
    void abort() override;

    // byte_source
    void pause() override;
    void destroy() override;

private:
    void do_read_header();
    void on_header(boost::system::error_code ec);
    void dispatch_request();

    void start_download(const route_match& route);
    void watch_peer();
    void on_peer_readable(boost::system::error_code ec);

    void start_upload();
    void do_read_body();
    void on_body(boost::system::error_code ec);
    void on_upload_report(const upload_report& report);

    template<typename Body>
    void send_response(http::response<Body>& res, std::string_view preflight_methods = {});
    void enqueue(std::vector<std::uint8_t> bytes);
    void flush_staged_head();
    void do_send();
    void on_write(boost::system::error_code ec, std::size_t sent);
    void on_flushed();
    void finish_exchange();

    void decorate(http::fields& fields, std::string_view preflight_methods = {}) const;
    bool request_body_pending() const;
    std::size_t buffered() const { return writing_send_buf_.size() + pending_send_buf_.size(); }

    void do_close(std::string_view reason);
};

using connection_ptr = std::shared_ptr<http_connection>;

} // namespace speedline::net
