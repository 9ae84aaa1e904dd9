#ifndef FOUNDRY_STREAM_HPP
#define FOUNDRY_STREAM_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace picojson {
class value;
}

namespace foundry {

/** Default bound on a single line held by EventStream (1 MiB). */
static const size_t DEFAULT_MAX_LINE_BYTES = 1024 * 1024;

/** Marker that starts a data line. */
#define FOUNDRY_SSE_DATA_PREFIX "data:"

/** Payload that ends the stream. */
#define FOUNDRY_SSE_DONE "[DONE]"

// =============================================================================
// Byte source
// =============================================================================

/**
 * Pull-based source of response body bytes, in network arrival order.
 */
class ChunkSource {
public:
    virtual ~ChunkSource() {}

    /**
     * Block until the next chunk is available.
     *
     * @return false at end of stream (out is left untouched).
     * @throws on transport failure.
     */
    virtual bool next_chunk(std::string& out) = 0;
};

// =============================================================================
// Frames
// =============================================================================

enum FrameType {
    FRAME_DATA,
    FRAME_DONE
};

struct StreamFrame {
    FrameType type;
    std::string data;  // payload of a data line, without the marker

    StreamFrame()
        : type(FRAME_DATA)
    {}
};

/**
 * Server-sent events reader over a ChunkSource.
 *
 * Lines are cut at '\n' ("\r\n" accepted). Lines starting with "data:"
 * yield a frame; "[DONE]" ends the stream; every other line (comments,
 * keepalives, event names) is ignored. A line whose bytes are not valid
 * UTF-8 is dropped without ending the stream.
 *
 * Memory is bounded: at most one partial line of max_line_bytes - 1 bytes
 * is held. A longer line raises StreamError.
 *
 * Not restartable. Destroying the stream releases the source.
 *
 * Example:
 *   foundry::EventStream events = client.post_stream(path, body);
 *   foundry::StreamFrame frame;
 *   while (events.next(frame)) {
 *       handle(frame.data);
 *   }
 */
class EventStream {
public:
    explicit EventStream(std::unique_ptr<ChunkSource> source,
                         size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES);

    ~EventStream();

    EventStream(EventStream&& other);
    EventStream& operator=(EventStream&& other);

    /**
     * Advance to the next data frame.
     *
     * @return true and fill frame; false once the sentinel (frame.type is
     *         then FRAME_DONE) or the end of the byte stream has been reached.
     * @throws StreamError on an oversized line or a source failure. The
     *         stream is exhausted afterwards.
     */
    bool next(StreamFrame& frame);

    /**
     * Advance and decode the payload as JSON.
     *
     * @throws StreamError if the payload is not valid JSON.
     */
    bool next_json(picojson::value& value);

    /** True once next() has returned false or thrown. */
    bool finished() const;

    /** True when the stream ended with the sentinel rather than EOF. */
    bool completed() const;

    /** Lines dropped because they were not valid UTF-8. */
    size_t skipped_lines() const;

private:
    EventStream(const EventStream&);
    EventStream& operator=(const EventStream&);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/** True when bytes form valid UTF-8 (no overlongs or surrogates). */
bool is_valid_utf8(const std::string& bytes);

} // namespace foundry

#endif // FOUNDRY_STREAM_HPP
