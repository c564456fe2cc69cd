#include <doctest/doctest.h>

#include <segloader/context.hpp>
#include <segloader/segment_worker.hpp>

#include "test_helpers.hpp"

using namespace segloader;
using namespace segloader::testing;
using namespace std::chrono_literals;

namespace
{
    struct WorkerSetup
    {
        explicit WorkerSetup(std::size_t size)
            : content(make_content(size))
            , transport(content)
            , limiter(0, &stop)
            , state(TransferState::path_for(dir / "out.bin"), "https://example.com/out.bin", size)
            , progress(ctx)
            , worker(ctx,
                     transport,
                     spec,
                     "https://example.com/out.bin",
                     limiter,
                     state,
                     progress,
                     stop)
        {
            ctx.retry_base_delay = 1ms;
            ctx.max_retry_delay = 5ms;
            spec.url = "https://example.com/out.bin";
            spec.destination = dir / "out.bin";
            spec.retries = 3;
        }

        std::string slice(const Segment& s) const
        {
            return content.substr(s.start(), static_cast<std::size_t>(s.length().value()));
        }

        Context ctx;
        TempDir dir;
        std::string content;
        FakeTransport transport;
        TransferSpec spec;
        std::atomic<bool> stop{ false };
        RateLimiter limiter;
        TransferState state;
        ProgressTracker progress;
        SegmentWorker worker;
    };
}

TEST_SUITE("segment_worker")
{
    TEST_CASE("fetch_bounded")
    {
        WorkerSetup t(100000);
        Segment s(20000, 69999, t.dir / "out.bin");

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(s.state, SegmentState::kFINISHED);
        CHECK_EQ(read_file(s.partial_path()), t.slice(s));
        CHECK_EQ(t.transport.requested_ranges(), std::vector<std::string>{ "20000-69999" });
        CHECK_EQ(t.state.written(s.range_key()), 50000);
        CHECK_EQ(t.progress.snapshot().downloaded, 50000);
    }

    TEST_CASE("fetch_unbounded")
    {
        WorkerSetup t(30000);
        t.transport.accept_ranges = false;
        Segment s(0, std::nullopt, t.dir / "out.bin");

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(read_file(s.partial_path()), t.content);
        // no Range header for a fresh single stream
        CHECK_EQ(t.transport.requested_ranges(), std::vector<std::string>{ "" });
    }

    TEST_CASE("resume_from_partial_file")
    {
        WorkerSetup t(100000);
        Segment s(0, 99999, t.dir / "out.bin");
        write_file(s.partial_path(), t.content.substr(0, 30000));

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(read_file(s.partial_path()), t.content);
        CHECK_EQ(t.transport.requested_ranges(), std::vector<std::string>{ "30000-99999" });
        CHECK_EQ(t.transport.bytes_served.load(), 70000);
        CHECK_EQ(t.progress.snapshot().downloaded, 100000);
    }

    TEST_CASE("complete_partial_needs_no_request")
    {
        WorkerSetup t(1000);
        Segment s(0, 999, t.dir / "out.bin");
        write_file(s.partial_path(), t.content);

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(t.transport.gets.load(), 0);
        CHECK_EQ(s.state, SegmentState::kFINISHED);
        CHECK_EQ(t.progress.snapshot().downloaded, 1000);
    }

    TEST_CASE("oversized_partial_is_truncated")
    {
        WorkerSetup t(1000);
        Segment s(0, 499, t.dir / "out.bin");
        write_file(s.partial_path(), t.content);

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(t.transport.gets.load(), 0);
        CHECK_EQ(read_file(s.partial_path()), t.content.substr(0, 500));
    }

    TEST_CASE("retries_minus_one_failures_succeed")
    {
        WorkerSetup t(50000);
        t.transport.fail_gets = static_cast<int>(t.spec.retries);
        Segment s(0, 49999, t.dir / "out.bin");

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(t.transport.gets.load(), t.spec.retries + 1);
        CHECK_EQ(read_file(s.partial_path()), t.content);
    }

    TEST_CASE("retries_exhausted")
    {
        WorkerSetup t(50000);
        t.transport.fail_gets = static_cast<int>(t.spec.retries) + 1;
        Segment s(0, 49999, t.dir / "out.bin");

        auto res = t.worker.fetch(s);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::SL_RETRIESEXHAUSTED);
        CHECK(res.error().is_fatal());
        CHECK_EQ(t.transport.gets.load(), t.spec.retries + 1);
        CHECK_EQ(s.state, SegmentState::kFAILED);
    }

    TEST_CASE("dropped_connection_resumes_at_offset")
    {
        WorkerSetup t(100000);
        t.transport.drop_gets = 1;
        t.transport.drop_after = 40000;
        Segment s(0, 99999, t.dir / "out.bin");

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(read_file(s.partial_path()), t.content);
        auto ranges = t.transport.requested_ranges();
        REQUIRE_EQ(ranges.size(), 2);
        CHECK_EQ(ranges[0], "0-99999");
        CHECK_EQ(ranges[1], "40000-99999");
        CHECK_EQ(t.transport.bytes_served.load(), 100000);
    }

    TEST_CASE("bad_status_is_retried")
    {
        WorkerSetup t(1000);
        t.transport.status_gets = 2;
        t.transport.injected_status = 503;
        Segment s(0, 999, t.dir / "out.bin");

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(t.transport.gets.load(), 3);
        CHECK_EQ(read_file(s.partial_path()), t.content);
    }

    TEST_CASE("ignored_range_restarts_segment")
    {
        WorkerSetup t(1000);
        t.transport.ignore_ranges = true;
        Segment s(500, 999, t.dir / "out.bin");
        write_file(s.partial_path(), t.content.substr(500, 100));

        auto res = t.worker.fetch(s);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::SL_RETRIESEXHAUSTED);
        // the bytes of the earlier run cannot be trusted any more
        CHECK_EQ(s.written(), 0);
        CHECK_EQ(t.transport.bytes_served.load(), 0);
    }

    TEST_CASE("single_stream_restarts_without_losing_an_attempt")
    {
        WorkerSetup t(100000);
        t.spec.retries = 0;
        t.transport.accept_ranges = false;
        Segment s(0, std::nullopt, t.dir / "out.bin");
        write_file(s.partial_path(), t.content.substr(0, 50000));

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(read_file(s.partial_path()), t.content);
        CHECK_EQ(t.transport.gets.load(), 1);
        CHECK_EQ(t.transport.requested_ranges(), std::vector<std::string>{ "50000-" });
        CHECK_EQ(t.progress.snapshot().downloaded, 100000);
        CHECK_EQ(t.state.written("0-"), 100000);
    }

    TEST_CASE("single_stream_already_whole")
    {
        WorkerSetup t(100000);
        Segment s(0, std::nullopt, t.dir / "out.bin");
        write_file(s.partial_path(), t.content);

        REQUIRE(t.worker.fetch(s));
        CHECK_EQ(s.state, SegmentState::kFINISHED);
        CHECK_EQ(t.transport.gets.load(), 1);
        CHECK_EQ(t.transport.requested_ranges(), std::vector<std::string>{ "100000-" });
        CHECK_EQ(t.transport.bytes_served.load(), 0);
        CHECK_EQ(read_file(s.partial_path()), t.content);
    }

    TEST_CASE("stop_flag_interrupts")
    {
        WorkerSetup t(200000);
        t.transport.buffer_size = 10000;
        t.transport.on_deliver = [&t](const HttpRequest&, std::size_t)
        {
            if (t.transport.bytes_served.load() >= 50000)
                t.stop = true;
        };
        Segment s(0, 199999, t.dir / "out.bin");

        auto res = t.worker.fetch(s);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::SL_INTERRUPTED);
        CHECK(res.error().is_resumable());
        CHECK_EQ(s.state, SegmentState::kWAITING);
        CHECK_EQ(s.written(), 50000);
        CHECK_EQ(t.state.written(s.range_key()), 50000);
    }

    TEST_CASE("backoff")
    {
        WorkerSetup t(10);
        t.ctx.retry_base_delay = 1s;
        t.ctx.retry_backoff_factor = 2;
        t.ctx.max_retry_delay = 30s;

        CHECK_EQ(t.worker.backoff(1), std::chrono::steady_clock::duration(1s));
        CHECK_EQ(t.worker.backoff(2), std::chrono::steady_clock::duration(2s));
        CHECK_EQ(t.worker.backoff(4), std::chrono::steady_clock::duration(8s));
        CHECK_EQ(t.worker.backoff(6), std::chrono::steady_clock::duration(30s));
        CHECK_EQ(t.worker.backoff(60), std::chrono::steady_clock::duration(30s));
    }
}
