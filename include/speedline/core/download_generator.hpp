#pragma once

#include <speedline/core/byte_sink.hpp>
#include <speedline/core/config.hpp>
#include <speedline/core/random_source.hpp>
#include <speedline/core/transfer_session.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace speedline
{

// ============================================================================
// Download Generator
// ============================================================================

// Streams `effective_size` random bytes into a byte_sink in fixed-size
// chunks. The write loop runs synchronously while the sink accepts data and
// suspends on saturation until the sink's drain notification.
//
// Termination: completed once every byte was handed over and the stream was
// ended. A peer abort, a close with bytes outstanding or a sink error before
// that point aborts the session. Notifications arriving after the stream was
// ended are ignored.
class download_generator
{
public:
    download_generator(byte_sink& sink,
                       random_source& random,
                       std::uint64_t effective_size,
                       std::string requested,
                       std::size_t chunk_size = download_chunk_size,
                       transfer_observer* observer = nullptr);

    download_generator(const download_generator&) = delete;
    download_generator& operator=(const download_generator&) = delete;

    // Declares the stream and starts writing. Throws when the sink cannot be
    // opened; no session is created in that case.
    void start();

    // Transport notifications
    void on_peer_abort();
    void on_close();
    void on_error(std::string_view reason);

    bool started() const { return session_.has_value(); }
    const transfer_session& session() const { return *session_; }
    std::uint64_t effective_size() const { return effective_size_; }
    std::uint64_t remaining() const { return remaining_; }
    bool stream_ended() const { return stream_ended_; }

private:
    void write_more();
    void abort_once();
    void fail(std::string_view reason);

    byte_sink& sink_;
    random_source& random_;
    std::uint64_t effective_size_;
    std::uint64_t remaining_;
    std::string requested_;
    std::vector<std::uint8_t> chunk_;
    transfer_observer* observer_;

    std::optional<transfer_session> session_;
    bool stream_ended_{false};
};

} // namespace speedline
