#pragma once

#include <speedline/core/config.hpp>
#include <speedline/core/transfer_observer.hpp>
#include <speedline/net/http_connection.hpp>

#include <boost/asio.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>

namespace speedline::net
{

// ============================================================================
// Connection Registry
// ============================================================================

// Tracks live connections so the server can close them on shutdown.
class connection_registry
{
public:
    using connection_id = std::uint64_t;

    struct aggregate_metrics
    {
        std::uint64_t total_bytes_sent{0};
        std::uint64_t total_bytes_received{0};
        std::uint64_t total_requests{0};
        std::size_t active_connections{0};
    };

    connection_id add(connection_ptr connection);
    void remove(connection_id id);

    // Closes every tracked connection; each one deregisters itself.
    void close_all(std::string_view reason);

    std::size_t active_count() const;
    aggregate_metrics get_metrics() const;

private:
    std::unordered_map<connection_id, connection_ptr> connections_;
    connection_id next_id_{1};
    mutable std::mutex mutex_;
};

// ============================================================================
// Server
// ============================================================================

class server : public std::enable_shared_from_this<server>
{
private:
    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<service_context> context_;
    connection_registry registry_;

public:
    // Binds and listens immediately; throws std::runtime_error when the
    // address can not be bound.
    server(boost::asio::io_context& io_context, server_config config, transfer_observer* observer = nullptr);

    server(const server&) = delete;
    server& operator=(const server&) = delete;
    server(server&&) = delete;
    server& operator=(server&&) = delete;
    ~server() = default;

    void start();
    void stop();

    boost::asio::ip::tcp::endpoint local_endpoint() const;

    std::size_t active_connection_count() const
    {
        return registry_.active_count();
    }

    connection_registry::aggregate_metrics get_metrics() const
    {
        return registry_.get_metrics();
    }

    const server_config& config() const
    {
        return context_->config;
    }

private:
    void do_accept();
    void on_accept(boost::asio::ip::tcp::socket socket);
};

} // namespace speedline::net
