#include <system_error>

#include <spdlog/fmt/fmt.h>

#include <segloader/segment.hpp>

namespace segloader
{
    fs::path partial_path_for(const fs::path& destination,
                              std::uint64_t start,
                              const std::optional<std::uint64_t>& end)
    {
        fs::path res = destination;
        res += fmt::format(PARTEXT ".{}.{}", start, end ? std::to_string(end.value()) : "eof");
        return res;
    }

    Segment::Segment(std::uint64_t start,
                     std::optional<std::uint64_t> end,
                     const fs::path& destination)
        : m_start(start)
        , m_end(end)
        , m_partial_path(partial_path_for(destination, start, end))
    {
    }

    std::optional<std::uint64_t> Segment::length() const noexcept
    {
        if (!m_end)
            return std::nullopt;
        return m_end.value() - m_start + 1;
    }

    std::string Segment::range_key() const
    {
        if (m_end)
            return fmt::format("{}-{}", m_start, m_end.value());
        return fmt::format("{}-", m_start);
    }

    std::optional<std::string> Segment::request_range(std::uint64_t written) const
    {
        const std::uint64_t offset = m_start + written;
        if (m_end)
        {
            return fmt::format("{}-{}", offset, m_end.value());
        }
        if (offset == 0)
        {
            return std::nullopt;
        }
        return fmt::format("{}-", offset);
    }

    std::uint64_t Segment::written() const
    {
        std::error_code ec;
        auto size = fs::file_size(m_partial_path, ec);
        if (ec)
            return 0;
        return static_cast<std::uint64_t>(size);
    }

    bool Segment::complete(std::uint64_t written) const noexcept
    {
        return m_end && written >= length().value();
    }
}
