#ifndef SEGLOADER_SEGMENT_HPP
#define SEGLOADER_SEGMENT_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <segloader/export.hpp>
#include <segloader/enums.hpp>

namespace segloader
{
    namespace fs = std::filesystem;

    // What the server told us about the resource before the transfer starts.
    struct ProbeResult
    {
        std::optional<std::uint64_t> total_size;
        bool accept_ranges = false;
        std::string filename;
        // URL after redirects, used by every segment request.
        std::string effective_url;
    };

    // A contiguous byte range of the resource, downloaded into its own partial file.
    // An empty `end` means "until the end of the stream".
    class SEGLOADER_API Segment
    {
    public:
        Segment(std::uint64_t start, std::optional<std::uint64_t> end, const fs::path& destination);

        std::uint64_t start() const noexcept
        {
            return m_start;
        }

        const std::optional<std::uint64_t>& end() const noexcept
        {
            return m_end;
        }

        const fs::path& partial_path() const noexcept
        {
            return m_partial_path;
        }

        bool bounded() const noexcept
        {
            return m_end.has_value();
        }

        // Number of bytes covered, inclusive bounds. Empty for an unbounded segment.
        std::optional<std::uint64_t> length() const noexcept;

        // "start-end" or "start-", the key of this segment in the state file.
        std::string range_key() const;

        // Range to request when `written` bytes are already on disk, in "a-b" form.
        // Empty when the whole resource should be requested without a Range header.
        std::optional<std::string> request_range(std::uint64_t written) const;

        // Size of the partial file, 0 when it does not exist.
        std::uint64_t written() const;

        bool complete(std::uint64_t written) const noexcept;

        SegmentState state = SegmentState::kWAITING;

    private:
        std::uint64_t m_start;
        std::optional<std::uint64_t> m_end;
        fs::path m_partial_path;
    };

    // "<destination>.part.<start>.<end>", or "...<start>.eof" for an unbounded segment.
    SEGLOADER_API fs::path partial_path_for(const fs::path& destination,
                                            std::uint64_t start,
                                            const std::optional<std::uint64_t>& end);
}

#endif
