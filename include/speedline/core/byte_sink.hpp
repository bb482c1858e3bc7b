#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <string>

namespace speedline
{

struct stream_head
{
    std::uint64_t content_length{0};
    std::string content_type{"application/octet-stream"};
    bool no_store{true};
};

// ============================================================================
// Byte Sink Interface
// ============================================================================

// Consumer side of a download. write() copies the chunk into the sink's
// buffering layer and reports whether more may be written right away; once
// it returns false the producer waits for the drain handler.
class byte_sink
{
public:
    virtual ~byte_sink() = default;

    // Must precede the first write. Throws if the stream cannot be opened.
    virtual void declare(const stream_head& head) = 0;

    virtual bool write(std::span<const std::uint8_t> chunk) = 0;

    // One-shot: invoked once when the buffer drains below its low watermark.
    virtual void on_drain(std::function<void()> handler) = 0;

    // All declared bytes were written.
    virtual void end() = 0;

    // Tear the stream down without completing it.
    virtual void abort() = 0;
};

} // namespace speedline
