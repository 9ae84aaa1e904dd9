#include "foundry/stream.hpp"
#include "foundry/errors.hpp"
#include "foundry/sanitize.hpp"

#include <picojson/picojson.h>
#include <plog/Log.h>

#include <sstream>

namespace foundry {

// =============================================================================
// UTF-8 validation
// =============================================================================

bool is_valid_utf8(const std::string& bytes) {
    const unsigned char* s = reinterpret_cast<const unsigned char*>(bytes.data());
    size_t n = bytes.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        unsigned int cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;

        for (size_t k = 1; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }

        /* overlong, surrogate, out of range */
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

// =============================================================================
// EventStream::Impl
// =============================================================================

struct EventStream::Impl {
    std::unique_ptr<ChunkSource> source;
    size_t max_line_bytes;

    std::string chunk;   // last chunk pulled from the source
    size_t pos;          // first unconsumed byte of chunk
    std::string line;    // partial line carried across chunks
    bool done;
    bool saw_done;
    size_t skipped;

    Impl(std::unique_ptr<ChunkSource> src, size_t max_line)
        : source(std::move(src))
        , max_line_bytes(max_line)
        , pos(0)
        , done(false)
        , saw_done(false)
        , skipped(0)
    {}

    /** Release the source and buffers. */
    void finish() {
        done = true;
        source.reset();
        std::string().swap(chunk);
        std::string().swap(line);
        pos = 0;
    }

    void fail_oversized() {
        std::ostringstream msg;
        msg << "line exceeds " << (max_line_bytes - 1)
            << " bytes without a terminator";
        PLOGE << "stream:line_too_long limit=" << max_line_bytes;
        finish();
        throw StreamError(msg.str());
    }

    /**
     * Cut the next complete line (terminator removed) into out.
     * Returns false at end of input; a trailing unterminated line is dropped.
     */
    bool next_line(std::string& out) {
        for (;;) {
            if (pos < chunk.size()) {
                size_t nl = chunk.find('\n', pos);
                if (nl != std::string::npos) {
                    size_t seg = nl - pos;
                    size_t len = line.size() + seg;
                    bool cr = seg > 0 ? chunk[nl - 1] == '\r'
                                      : (!line.empty() && line[line.size() - 1] == '\r');
                    if (cr) --len;
                    if (len >= max_line_bytes) {
                        fail_oversized();
                    }
                    out.swap(line);
                    out.append(chunk, pos, seg);
                    line.clear();
                    pos = nl + 1;
                    if (!out.empty() && out[out.size() - 1] == '\r') {
                        out.erase(out.size() - 1);
                    }
                    return true;
                }

                size_t rest = chunk.size() - pos;
                size_t len = line.size() + rest;
                /* a trailing '\r' may be the first half of "\r\n" */
                if (chunk[chunk.size() - 1] == '\r') --len;
                if (len >= max_line_bytes) {
                    fail_oversized();
                }
                line.append(chunk, pos, rest);
                pos = chunk.size();
            }

            std::string next;
            bool more = false;
            try {
                more = source->next_chunk(next);
            } catch (const std::exception& e) {
                PLOGE << "stream:source_failed error=" << sanitize(e.what());
                finish();
                throw StreamError("failed to read response body", std::current_exception());
            }

            if (!more) {
                if (!line.empty()) {
                    PLOGD << "stream:eof_partial_line bytes=" << line.size();
                }
                return false;
            }
            chunk.swap(next);
            pos = 0;
        }
    }
};

// =============================================================================
// EventStream
// =============================================================================

EventStream::EventStream(std::unique_ptr<ChunkSource> source, size_t max_line_bytes)
    : impl_(new Impl(std::move(source), max_line_bytes < 2 ? 2 : max_line_bytes))
{
    if (!impl_->source) {
        impl_->done = true;
    }
}

EventStream::~EventStream() {}

EventStream::EventStream(EventStream&& other)
    : impl_(std::move(other.impl_))
{}

EventStream& EventStream::operator=(EventStream&& other) {
    impl_ = std::move(other.impl_);
    return *this;
}

bool EventStream::next(StreamFrame& frame) {
    if (!impl_ || impl_->done) {
        return false;
    }

    static const std::string PREFIX = FOUNDRY_SSE_DATA_PREFIX;
    std::string line;

    while (impl_->next_line(line)) {
        if (!is_valid_utf8(line)) {
            ++impl_->skipped;
            PLOGW << "stream:invalid_utf8_line bytes=" << line.size() << " skipped";
            continue;
        }
        if (line.compare(0, PREFIX.size(), PREFIX) != 0) {
            continue;
        }

        size_t start = PREFIX.size();
        if (start < line.size() && line[start] == ' ') ++start;

        if (line.compare(start, std::string::npos, FOUNDRY_SSE_DONE) == 0) {
            PLOGD << "stream:done";
            impl_->saw_done = true;
            impl_->finish();
            frame.type = FRAME_DONE;
            frame.data.clear();
            return false;
        }

        frame.type = FRAME_DATA;
        frame.data.assign(line, start, std::string::npos);
        return true;
    }

    impl_->finish();
    return false;
}

bool EventStream::next_json(picojson::value& value) {
    StreamFrame frame;
    if (!next(frame)) {
        return false;
    }

    std::string err = picojson::parse(value, frame.data);
    if (!err.empty()) {
        impl_->finish();
        throw StreamError("failed to parse SSE event",
                          std::make_exception_ptr(SdkDependencyError("picojson", err)));
    }
    return true;
}

bool EventStream::finished() const {
    return !impl_ || impl_->done;
}

bool EventStream::completed() const {
    return impl_ && impl_->saw_done;
}

size_t EventStream::skipped_lines() const {
    return impl_ ? impl_->skipped : 0;
}

} /* namespace foundry */
