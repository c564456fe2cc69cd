#include <doctest/doctest.h>

#include <segloader/segment_planner.hpp>

#include "test_helpers.hpp"

using namespace segloader;
using namespace segloader::testing;

namespace
{
    TransferSpec make_spec(const std::string& url)
    {
        TransferSpec spec;
        spec.url = url;
        spec.destination = ".";
        return spec;
    }
}

TEST_SUITE("segment")
{
    TEST_CASE("naming")
    {
        Segment bounded(4194304, 8388607, "/tmp/out.iso");
        CHECK_EQ(bounded.range_key(), "4194304-8388607");
        CHECK_EQ(bounded.partial_path(), fs::path("/tmp/out.iso.part.4194304.8388607"));
        CHECK_EQ(bounded.length().value(), 4194304);

        Segment unbounded(0, std::nullopt, "/tmp/out.iso");
        CHECK_EQ(unbounded.range_key(), "0-");
        CHECK_EQ(unbounded.partial_path(), fs::path("/tmp/out.iso.part.0.eof"));
        CHECK_FALSE(unbounded.length());
    }

    TEST_CASE("request_range")
    {
        Segment bounded(100, 199, "out");
        CHECK_EQ(bounded.request_range(0).value(), "100-199");
        CHECK_EQ(bounded.request_range(40).value(), "140-199");
        CHECK_FALSE(bounded.complete(99));
        CHECK(bounded.complete(100));

        Segment unbounded(0, std::nullopt, "out");
        CHECK_FALSE(unbounded.request_range(0));
        CHECK_EQ(unbounded.request_range(500).value(), "500-");
        CHECK_FALSE(unbounded.complete(1000000));
    }

    TEST_CASE("written")
    {
        TempDir dir;
        Segment s(0, 99, dir / "out");
        CHECK_EQ(s.written(), 0);
        write_file(s.partial_path(), "0123456789");
        CHECK_EQ(s.written(), 10);
    }
}

TEST_SUITE("segment_planner")
{
    TEST_CASE("plan_ten_mib_in_four_mib_chunks")
    {
        ProbeResult probe;
        probe.total_size = 10485760;
        probe.accept_ranges = true;

        auto segments = SegmentPlanner::plan(probe, 4194304, "out.bin");
        REQUIRE_EQ(segments.size(), 3);
        CHECK_EQ(segments[0].start(), 0);
        CHECK_EQ(segments[0].end().value(), 4194303);
        CHECK_EQ(segments[1].start(), 4194304);
        CHECK_EQ(segments[1].end().value(), 8388607);
        CHECK_EQ(segments[2].start(), 8388608);
        CHECK_EQ(segments[2].end().value(), 10485759);
    }

    TEST_CASE("plan_covers_every_byte_once")
    {
        ProbeResult probe;
        probe.total_size = 1000;
        probe.accept_ranges = true;

        for (std::uint64_t chunk : { 1, 7, 333, 999, 1000, 5000 })
        {
            auto segments = SegmentPlanner::plan(probe, chunk, "out.bin");
            std::uint64_t next = 0;
            for (const auto& s : segments)
            {
                CHECK_EQ(s.start(), next);
                REQUIRE(s.bounded());
                next = s.end().value() + 1;
            }
            CHECK_EQ(next, 1000);
        }
    }

    TEST_CASE("plan_single_stream_fallback")
    {
        ProbeResult no_ranges;
        no_ranges.total_size = 10485760;
        no_ranges.accept_ranges = false;
        auto segments = SegmentPlanner::plan(no_ranges, 4194304, "out.bin");
        REQUIRE_EQ(segments.size(), 1);
        CHECK_EQ(segments[0].start(), 0);
        CHECK_FALSE(segments[0].bounded());

        ProbeResult unknown_size;
        unknown_size.accept_ranges = true;
        segments = SegmentPlanner::plan(unknown_size, 4194304, "out.bin");
        REQUIRE_EQ(segments.size(), 1);
        CHECK_FALSE(segments[0].bounded());

        ProbeResult empty;
        empty.total_size = 0;
        empty.accept_ranges = true;
        segments = SegmentPlanner::plan(empty, 4194304, "out.bin");
        REQUIRE_EQ(segments.size(), 1);
        CHECK_FALSE(segments[0].bounded());
    }

    TEST_CASE("probe_with_head")
    {
        FakeTransport transport(make_content(5000));
        transport.effective_url = "https://mirror.example.com/pub/file.tar.gz";

        SegmentPlanner planner(transport);
        auto probe = planner.probe(make_spec("https://example.com/file"));
        REQUIRE(probe);
        CHECK_EQ(probe->total_size.value(), 5000);
        CHECK(probe->accept_ranges);
        CHECK_EQ(probe->effective_url, "https://mirror.example.com/pub/file.tar.gz");
        CHECK_EQ(probe->filename, "file.tar.gz");
        CHECK_EQ(transport.heads.load(), 1);
        CHECK_EQ(transport.gets.load(), 0);
    }

    TEST_CASE("probe_without_head")
    {
        FakeTransport transport(make_content(5000));
        transport.head_supported = false;

        SegmentPlanner planner(transport);
        auto probe = planner.probe(make_spec("https://example.com/data.bin"));
        REQUIRE(probe);
        CHECK_EQ(probe->total_size.value(), 5000);
        CHECK(probe->accept_ranges);
        CHECK_EQ(transport.gets.load(), 1);
        CHECK_EQ(transport.requested_ranges().front(), "0-0");
        CHECK_LE(transport.bytes_served.load(), 1);
    }

    TEST_CASE("probe_without_range_support")
    {
        FakeTransport transport(make_content(5000));
        transport.head_supported = false;
        transport.accept_ranges = false;

        SegmentPlanner planner(transport);
        auto probe = planner.probe(make_spec("https://example.com/data.bin"));
        REQUIRE(probe);
        CHECK_EQ(probe->total_size.value(), 5000);
        CHECK_FALSE(probe->accept_ranges);
        // the body of the 200 answer is not downloaded
        CHECK_EQ(transport.bytes_served.load(), 0);
    }

    TEST_CASE("partial_content_without_accept_ranges_is_single_stream")
    {
        FakeTransport transport(make_content(10 * 1024 * 1024));
        transport.head_supported = false;
        transport.advertise_ranges = false;

        SegmentPlanner planner(transport);
        auto probe = planner.probe(make_spec("https://example.com/data.bin"));
        REQUIRE(probe);
        // the size still comes from the Content-Range of the 206
        CHECK_EQ(probe->total_size.value(), 10 * 1024 * 1024);
        CHECK_FALSE(probe->accept_ranges);

        auto segments = SegmentPlanner::plan(probe.value(), 4 * 1024 * 1024, "/tmp/data.bin");
        REQUIRE_EQ(segments.size(), 1);
        CHECK_FALSE(segments.front().bounded());
        CHECK_EQ(segments.front().start(), 0);
    }

    TEST_CASE("probe_without_length")
    {
        FakeTransport transport(make_content(5000));
        transport.send_length = false;
        transport.accept_ranges = false;

        SegmentPlanner planner(transport);
        auto probe = planner.probe(make_spec("https://example.com/data.bin"));
        REQUIRE(probe);
        CHECK_FALSE(probe->total_size);
        CHECK_FALSE(probe->accept_ranges);
    }

    TEST_CASE("probe_failure")
    {
        FakeTransport transport(make_content(10));
        transport.head_supported = false;
        transport.fail_gets = 1;

        SegmentPlanner planner(transport);
        auto probe = planner.probe(make_spec("https://example.com/data.bin"));
        REQUIRE_FALSE(probe);
        CHECK_EQ(probe.error().code, ErrorCode::SL_PROBEFAILED);

        transport.status_gets = 1;
        transport.injected_status = 404;
        probe = planner.probe(make_spec("https://example.com/data.bin"));
        REQUIRE_FALSE(probe);
        CHECK_EQ(probe.error().code, ErrorCode::SL_PROBEFAILED);
    }

    TEST_CASE("filename_priority")
    {
        FakeTransport transport(make_content(10));
        transport.content_disposition = "attachment; filename=\"report.pdf\"";
        SegmentPlanner planner(transport);

        auto spec = make_spec("https://example.com/download?id=3");
        CHECK_EQ(planner.probe(spec)->filename, "report.pdf");

        spec.filename = "mine.pdf";
        CHECK_EQ(planner.probe(spec)->filename, "mine.pdf");

        transport.content_disposition.clear();
        spec.filename.clear();
        spec.url = "https://example.com/files/my%20file.zip";
        CHECK_EQ(planner.probe(spec)->filename, "my file.zip");

        spec.url = "https://example.com/";
        CHECK_EQ(planner.probe(spec)->filename, "download.bin");
    }

    TEST_CASE("content_disposition")
    {
        CHECK_EQ(parse_content_disposition("attachment; filename=plain.txt").value(),
                 "plain.txt");
        CHECK_EQ(parse_content_disposition("attachment; filename=\"quoted name.txt\"").value(),
                 "quoted name.txt");
        CHECK_EQ(parse_content_disposition(
                     "attachment; filename=\"fallback.txt\"; filename*=UTF-8''na%C3%AFve.txt")
                     .value(),
                 "na\xC3\xAFve.txt");
        CHECK_EQ(parse_content_disposition("attachment; filename=\"../../etc/passwd\"").value(),
                 "passwd");
        CHECK_FALSE(parse_content_disposition("inline"));
        CHECK_FALSE(parse_content_disposition("attachment; filename=\"..\""));
    }

    TEST_CASE("content_range_total")
    {
        CHECK_EQ(parse_content_range_total("bytes 0-0/10485760").value(), 10485760);
        CHECK_FALSE(parse_content_range_total("bytes 0-0/*"));
        CHECK_FALSE(parse_content_range_total("garbage"));
    }

    TEST_CASE("resolve_filename")
    {
        CHECK_EQ(resolve_filename("", "", "https://example.com/a/b/c.iso"), "c.iso");
        CHECK_EQ(resolve_filename("", "", "not a url"), "download.bin");
        CHECK_EQ(resolve_filename("x.iso", "attachment; filename=y.iso", "https://e.com/z.iso"),
                 "x.iso");
    }
}
