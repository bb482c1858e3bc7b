#include <speedline/net/server.hpp>
#include <speedline/net/tcp_utils.hpp>
#include <speedline/logger.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace speedline::net
{

// ============================================================================
// Connection Registry
// ============================================================================

connection_registry::connection_id connection_registry::add(connection_ptr connection)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    connections_[id] = std::move(connection);
    return id;
}

void connection_registry::remove(connection_id id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.erase(id);
}

void connection_registry::close_all(std::string_view reason)
{
    std::vector<connection_ptr> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_close.reserve(connections_.size());
        for (auto& [id, connection] : connections_)
            to_close.push_back(connection);
    }

    for (auto& connection : to_close)
        connection->close(reason);
}

std::size_t connection_registry::active_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

connection_registry::aggregate_metrics connection_registry::get_metrics() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    aggregate_metrics agg;
    agg.active_connections = connections_.size();

    for (auto& [id, connection] : connections_)
    {
        auto& m = connection->metrics();
        agg.total_bytes_sent += m.bytes_sent.load();
        agg.total_bytes_received += m.bytes_received.load();
        agg.total_requests += m.requests.load();
    }

    return agg;
}

// ============================================================================
// Server
// ============================================================================

server::server(boost::asio::io_context& io_context, server_config config, transfer_observer* observer)
  : io_context_(io_context)
  , acceptor_(io_context)
  , context_(std::make_shared<service_context>(std::move(config), observer))
{
    const auto& address = context_->config.listen_address;
    auto port = context_->config.listen_port;

    try
    {
        auto endpoint = boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address(address), port};
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    }
    catch (const std::exception& ex)
    {
        throw std::runtime_error{
            "Failed to listen on " + address + ":" + std::to_string(port) + " error:" + std::string{ex.what()}};
    }
}

void server::start()
{
    auto endpoint = local_endpoint();
    logger().info("listening on {}:{} download={} upload={}",
                  endpoint.address().to_string(), endpoint.port(),
                  context_->routes.download_path(), context_->routes.upload_path());
    do_accept();
}

void server::stop()
{
    boost::system::error_code ec;
    acceptor_.close(ec);
    registry_.close_all("server shutdown");
}

boost::asio::ip::tcp::endpoint server::local_endpoint() const
{
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? boost::asio::ip::tcp::endpoint{} : endpoint;
}

void server::do_accept()
{
    acceptor_.async_accept(boost::asio::make_strand(io_context_),
        [this, wptr = weak_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (wptr.expired())
                return;

            if (ec)
            {
                if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open())
                    return;

                // Transient failures such as descriptor exhaustion must not
                // stop the listener.
                logger().error("async_accept failed: {}", ec.message());
                do_accept();
                return;
            }

            on_accept(std::move(socket));
            do_accept();
        });
}

void server::on_accept(boost::asio::ip::tcp::socket socket)
{
    enable_keepalive(socket, context_->config.flow.keepalive_idle_seconds);
    enable_no_delay(socket);

    auto connection = std::make_shared<http_connection>(std::move(socket), context_);
    auto id = registry_.add(connection);

    connection->set_close_handler([this, wptr = weak_from_this(), id](connection_ptr) {
        if (wptr.expired())
            return;
        registry_.remove(id);
    });

    logger().debug("accepted connection: peer={}", connection->peer_address());
    connection->start();
}

} // namespace speedline::net
