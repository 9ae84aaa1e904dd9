/**
 * Foundry C++ SDK - event stream parser tests.
 */

#include <foundry/foundry.hpp>
#include "test_harness.hpp"

#include <picojson/picojson.h>

#include <memory>
#include <vector>

// =============================================================================
// Fakes
// =============================================================================

/**
 * Replays scripted chunks, then optionally fails instead of reporting EOF.
 */
class ScriptedSource : public foundry::ChunkSource {
public:
    explicit ScriptedSource(bool fail_at_end = false)
        : index_(0)
        , fail_at_end_(fail_at_end)
        , destroyed_(NULL)
    {}

    ~ScriptedSource() {
        if (destroyed_) *destroyed_ = true;
    }

    ScriptedSource& add(const std::string& chunk) {
        chunks_.push_back(chunk);
        return *this;
    }

    void track_destruction(bool* flag) { destroyed_ = flag; }

    bool next_chunk(std::string& out) {
        if (index_ < chunks_.size()) {
            out = chunks_[index_++];
            return true;
        }
        if (fail_at_end_) {
            throw foundry::HttpError(0, "connection reset by peer");
        }
        return false;
    }

private:
    std::vector<std::string> chunks_;
    size_t index_;
    bool fail_at_end_;
    bool* destroyed_;
};

static foundry::EventStream make_stream(ScriptedSource* source,
                                        size_t max_line = foundry::DEFAULT_MAX_LINE_BYTES) {
    return foundry::EventStream(std::unique_ptr<foundry::ChunkSource>(source), max_line);
}

/** Drain every data frame. */
static std::vector<std::string> collect(foundry::EventStream& stream) {
    std::vector<std::string> out;
    foundry::StreamFrame frame;
    while (stream.next(frame)) {
        out.push_back(frame.data);
    }
    return out;
}

int main() {
    std::cout << "Foundry C++ SDK - Stream Tests" << std::endl;
    std::cout << "==============================" << std::endl;

    // =========================================================================
    // Framing
    // =========================================================================
    SECTION("Framing");

    RUN_TEST("Data lines become frames in order", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data: {\"n\":1}\n\ndata: {\"n\":2}\n\n");
        foundry::EventStream stream = make_stream(src);

        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 2u);
        EXPECT_EQ(frames[0], "{\"n\":1}");
        EXPECT_EQ(frames[1], "{\"n\":2}");
        EXPECT(stream.finished());
        EXPECT(!stream.completed());
    });

    RUN_TEST("Lines split across chunks are reassembled", {
        ScriptedSource* src = new ScriptedSource();
        src->add("da").add("ta: hel").add("lo\r").add("\ndata: world\n");
        foundry::EventStream stream = make_stream(src);

        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 2u);
        EXPECT_EQ(frames[0], "hello");
        EXPECT_EQ(frames[1], "world");
    });

    RUN_TEST("Marker without a space is accepted", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data:compact\n");
        foundry::EventStream stream = make_stream(src);
        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0], "compact");
    });

    RUN_TEST("Comments, event names and blank lines are ignored", {
        ScriptedSource* src = new ScriptedSource();
        src->add(": keepalive\nevent: delta\nid: 7\n\ndata: payload\n");
        foundry::EventStream stream = make_stream(src);
        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0], "payload");
    });

    RUN_TEST("Trailing partial line is dropped", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data: one\ndata: unfinished");
        foundry::EventStream stream = make_stream(src);
        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0], "one");
    });

    RUN_TEST("Empty source yields nothing", {
        foundry::EventStream stream = make_stream(new ScriptedSource());
        foundry::StreamFrame frame;
        EXPECT(!stream.next(frame));
        EXPECT(stream.finished());
    });

    // =========================================================================
    // Sentinel
    // =========================================================================
    SECTION("Sentinel");

    RUN_TEST("[DONE] ends the stream and releases the source", {
        bool destroyed = false;
        ScriptedSource* src = new ScriptedSource();
        src->track_destruction(&destroyed);
        src->add("data: a\ndata: [DONE]\ndata: after\n");
        foundry::EventStream stream = make_stream(src);

        foundry::StreamFrame frame;
        EXPECT(stream.next(frame));
        EXPECT_EQ(frame.data, "a");
        EXPECT(!stream.next(frame));
        EXPECT(frame.type == foundry::FRAME_DONE);
        EXPECT(stream.completed());
        EXPECT(destroyed);
        EXPECT(!stream.next(frame));
    });

    RUN_TEST("[DONE] is recognised with CRLF", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data: x\r\n\r\ndata: [DONE]\r\n\r\n");
        foundry::EventStream stream = make_stream(src);
        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 1u);
        EXPECT(stream.completed());
    });

    // =========================================================================
    // Bounded memory
    // =========================================================================
    SECTION("Line bound");

    RUN_TEST("Line of bound minus one bytes yields one frame", {
        const size_t bound = 64;
        std::string payload(bound - 1 - 6, 'x');  // "data: " + payload == bound - 1
        std::string line = "data: " + payload;
        EXPECT_EQ(line.size(), bound - 1);

        ScriptedSource* src = new ScriptedSource();
        for (size_t i = 0; i < line.size(); ++i) {
            src->add(std::string(1, line[i]));
        }
        src->add("\n");
        foundry::EventStream stream = make_stream(src, bound);

        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0], payload);
    });

    RUN_TEST("CRLF line of bound minus one bytes yields one frame", {
        const size_t bound = 64;
        std::string payload(bound - 1 - 6, 'x');
        std::string line = "data: " + payload;

        ScriptedSource* src = new ScriptedSource();
        for (size_t i = 0; i < line.size(); ++i) {
            src->add(std::string(1, line[i]));
        }
        src->add("\r\n");
        foundry::EventStream stream = make_stream(src, bound);

        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0], payload);
    });

    RUN_TEST("CR and LF in separate chunks do not count toward the bound", {
        const size_t bound = 64;
        std::string payload(bound - 1 - 6, 'x');

        ScriptedSource* src = new ScriptedSource();
        src->add("data: " + payload).add("\r").add("\n");
        foundry::EventStream stream = make_stream(src, bound);

        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0], payload);
    });

    RUN_TEST("CRLF line of bound minus one bytes in one chunk yields one frame", {
        const size_t bound = 64;
        std::string payload(bound - 1 - 6, 'x');

        ScriptedSource* src = new ScriptedSource();
        src->add("data: " + payload + "\r\n");
        foundry::EventStream stream = make_stream(src, bound);

        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0], payload);
    });

    RUN_TEST("CRLF line of bound bytes is still a StreamError", {
        const size_t bound = 64;
        std::string payload(bound - 6, 'x');

        ScriptedSource* src = new ScriptedSource();
        src->add("data: " + payload + "\r\n");
        foundry::EventStream stream = make_stream(src, bound);

        foundry::StreamFrame frame;
        EXPECT_THROW(stream.next(frame), foundry::StreamError);
    });

    RUN_TEST("Line reaching the bound without terminator is a StreamError", {
        const size_t bound = 64;
        bool destroyed = false;
        ScriptedSource* src = new ScriptedSource();
        src->track_destruction(&destroyed);
        src->add("data: ").add(std::string(bound, 'y')).add("\n");
        foundry::EventStream stream = make_stream(src, bound);

        foundry::StreamFrame frame;
        frame.data = "untouched";
        EXPECT_THROW(stream.next(frame), foundry::StreamError);
        EXPECT_EQ(frame.data, "untouched");
        EXPECT(stream.finished());
        EXPECT(destroyed);
    });

    RUN_TEST("Oversized line fails even inside one chunk", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data: ok\n" + std::string(100, 'z') + "\n");
        foundry::EventStream stream = make_stream(src, 32);
        foundry::StreamFrame frame;
        EXPECT(stream.next(frame));
        EXPECT_EQ(frame.data, "ok");
        EXPECT_THROW(stream.next(frame), foundry::StreamError);
    });

    RUN_TEST("Unterminated flood never grows past the bound", {
        ScriptedSource* src = new ScriptedSource();
        for (int i = 0; i < 1000; ++i) {
            src->add(std::string(1024, 'q'));
        }
        foundry::EventStream stream = make_stream(src, 4096);
        foundry::StreamFrame frame;
        EXPECT_THROW(stream.next(frame), foundry::StreamError);
    });

    // =========================================================================
    // UTF-8
    // =========================================================================
    SECTION("UTF-8");

    RUN_TEST("Invalid UTF-8 line is skipped and the stream continues", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data: good-1\n");
        src->add("data: bad \xC3\x28 bytes\n");
        src->add("data: good-2\n");
        foundry::EventStream stream = make_stream(src);

        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 2u);
        EXPECT_EQ(frames[0], "good-1");
        EXPECT_EQ(frames[1], "good-2");
        EXPECT_EQ(stream.skipped_lines(), 1u);
    });

    RUN_TEST("Multi-byte characters split across chunks survive", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data: caf\xC3").add("\xA9\n");
        foundry::EventStream stream = make_stream(src);
        std::vector<std::string> frames = collect(stream);
        EXPECT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0], "caf\xC3\xA9");
    });

    RUN_TEST("is_valid_utf8 rejects overlongs and surrogates", {
        EXPECT(foundry::is_valid_utf8("plain ascii"));
        EXPECT(foundry::is_valid_utf8("\xE2\x82\xAC"));
        EXPECT(foundry::is_valid_utf8("\xF0\x9F\x98\x80"));
        EXPECT(!foundry::is_valid_utf8("\xC0\xAF"));
        EXPECT(!foundry::is_valid_utf8("\xED\xA0\x80"));
        EXPECT(!foundry::is_valid_utf8("\xE2\x82"));
        EXPECT(!foundry::is_valid_utf8("\xFF"));
    });

    // =========================================================================
    // Source failures
    // =========================================================================
    SECTION("Source failures");

    RUN_TEST("Mid-stream failure becomes StreamError with cause", {
        ScriptedSource* src = new ScriptedSource(true);
        src->add("data: first\n");
        foundry::EventStream stream = make_stream(src);

        foundry::StreamFrame frame;
        EXPECT(stream.next(frame));
        EXPECT_EQ(frame.data, "first");

        bool caught = false;
        try {
            stream.next(frame);
        } catch (const foundry::StreamError& e) {
            caught = true;
            EXPECT(e.has_cause());
            EXPECT_THROW(std::rethrow_exception(e.cause()), foundry::HttpError);
        }
        EXPECT(caught);
        EXPECT(stream.finished());
        EXPECT(!stream.next(frame));
    });

    // =========================================================================
    // JSON envelopes
    // =========================================================================
    SECTION("JSON");

    RUN_TEST("next_json decodes payloads", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data: {\"choices\":[{\"delta\":{\"content\":\"Hi\"}}]}\ndata: [DONE]\n");
        foundry::EventStream stream = make_stream(src);

        picojson::value v;
        EXPECT(stream.next_json(v));
        const picojson::array& choices = v.get("choices").get<picojson::array>();
        EXPECT_EQ(choices.size(), 1u);
        EXPECT_EQ(choices[0].get("delta").get("content").get<std::string>(), "Hi");
        EXPECT(!stream.next_json(v));
        EXPECT(stream.completed());
    });

    RUN_TEST("next_json on a non-JSON payload is a StreamError", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data: {not json\n");
        foundry::EventStream stream = make_stream(src);

        picojson::value v;
        bool caught = false;
        try {
            stream.next_json(v);
        } catch (const foundry::StreamError& e) {
            caught = true;
            EXPECT_THROW(std::rethrow_exception(e.cause()), foundry::SdkDependencyError);
        }
        EXPECT(caught);
    });

    RUN_TEST("Moved-from stream is finished", {
        ScriptedSource* src = new ScriptedSource();
        src->add("data: a\n");
        foundry::EventStream first = make_stream(src);
        foundry::EventStream second(std::move(first));
        foundry::StreamFrame frame;
        EXPECT(first.finished());
        EXPECT(!first.next(frame));
        EXPECT(second.next(frame));
    });

    return FINISH_TESTS();
}
