#ifndef SEGLOADER_SEGMENT_PLANNER_HPP
#define SEGLOADER_SEGMENT_PLANNER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/errors.hpp>
#include <segloader/segment.hpp>
#include <segloader/transfer_spec.hpp>
#include <segloader/transport.hpp>

namespace segloader
{
    class SEGLOADER_API SegmentPlanner
    {
    public:
        explicit SegmentPlanner(Transport& transport);

        // Asks the server for the size, range support and name of the resource. A HEAD
        // request is tried first, a one byte ranged GET is the fallback.
        tl::expected<ProbeResult, TransferError> probe(const TransferSpec& spec);

        // Splits the resource in `chunk_size` ranges when the server supports ranges and
        // the size is known, otherwise plans a single stream.
        static std::vector<Segment> plan(const ProbeResult& probe,
                                         std::uint64_t chunk_size,
                                         const fs::path& destination);

    private:
        Transport& m_transport;
    };

    // Output name: `explicit_name`, then the Content-Disposition name, then the last path
    // segment of `url`, then "download.bin".
    SEGLOADER_API std::string resolve_filename(const std::string& explicit_name,
                                               const std::string& content_disposition,
                                               const std::string& url);

    // Extracts the file name of a Content-Disposition value. `filename*=` (RFC 5987) wins
    // over `filename=`; directory components are dropped.
    SEGLOADER_API std::optional<std::string> parse_content_disposition(const std::string& value);

    // Total of a "bytes 0-0/1234" Content-Range value. Empty for "*" or garbage.
    SEGLOADER_API std::optional<std::uint64_t> parse_content_range_total(const std::string& value);
}

#endif
