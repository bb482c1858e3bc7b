#pragma once

#include <speedline/logger.hpp>

#include <boost/asio.hpp>

#include <optional>
#include <string>

#ifdef __linux__
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#endif

namespace speedline::net
{

// ============================================================================
// TCP Utilities
// ============================================================================

inline void enable_keepalive(boost::asio::ip::tcp::socket& socket, int idle_seconds)
{
    boost::system::error_code ec;
    socket.set_option(boost::asio::socket_base::keep_alive(true), ec);

    if (ec)
    {
        logger().warn("Failed to enable SO_KEEPALIVE: {}", ec.message());
        return;
    }

#ifdef __linux__
    int idle = idle_seconds;
    int interval = 10;
    int count = 5;
    int fd = static_cast<int>(socket.native_handle());

    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) != 0)
        logger().warn("TCP_KEEPIDLE setsockopt failed");

    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval)) != 0)
        logger().warn("TCP_KEEPINTVL setsockopt failed");

    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count)) != 0)
        logger().warn("TCP_KEEPCNT setsockopt failed");
#else
    (void)idle_seconds;
#endif
}

inline void enable_no_delay(boost::asio::ip::tcp::socket& socket)
{
    boost::system::error_code ec;
    socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);

    if (ec)
        logger().warn("Failed to enable TCP_NODELAY: {}", ec.message());
}

inline void set_send_buffer_size(boost::asio::ip::tcp::socket& socket, int size)
{
    boost::system::error_code ec;
    socket.set_option(boost::asio::socket_base::send_buffer_size(size), ec);

    if (ec)
        logger().warn("Failed to set send buffer size: {}", ec.message());
}

inline std::optional<std::string> remote_address(const boost::asio::ip::tcp::socket& socket)
{
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec)
        return std::nullopt;
    return endpoint.address().to_string();
}

// Errors that mean the peer went away rather than the transport failing.
inline bool is_peer_disconnect(const boost::system::error_code& ec)
{
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::connection_aborted ||
           ec == boost::asio::error::broken_pipe ||
           ec == boost::asio::error::shut_down ||
           ec == boost::asio::error::not_connected;
}

} // namespace speedline::net
