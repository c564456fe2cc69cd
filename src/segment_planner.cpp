#include <charconv>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <segloader/segment_planner.hpp>
#include <segloader/url.hpp>
#include <segloader/utils.hpp>

namespace segloader
{
    namespace
    {
        std::optional<std::uint64_t> parse_uint(std::string_view value)
        {
            value = strip(value);
            std::uint64_t res = 0;
            const char* last = value.data() + value.size();
            auto [ptr, ec] = std::from_chars(value.data(), last, res);
            if (value.empty() || ec != std::errc() || ptr != last)
            {
                return std::nullopt;
            }
            return res;
        }

        // Drops any directory part a server may put in a suggested name.
        std::string base_name(const std::string& name)
        {
            std::string res = name;
            const auto pos = res.find_last_of("/\\");
            if (pos != std::string::npos)
            {
                res = res.substr(pos + 1);
            }
            if (res == "." || res == "..")
            {
                return {};
            }
            return res;
        }

        bool declares_byte_ranges(const Response& response)
        {
            auto value = response.get_header("accept-ranges");
            if (!value)
                return false;
            for (const auto& unit : split(value.value(), ","))
            {
                if (to_lower(strip(unit)) == "bytes")
                    return true;
            }
            return false;
        }

        TransferError probe_error(std::string reason)
        {
            return { ErrorLevel::FATAL, ErrorCode::SL_PROBEFAILED, std::move(reason) };
        }
    }

    std::optional<std::string> parse_content_disposition(const std::string& value)
    {
        std::optional<std::string> plain, extended;
        for (const auto& param : split(value, ";"))
        {
            const auto eq = param.find('=');
            if (eq == std::string::npos)
                continue;

            const std::string key = to_lower(strip(std::string_view(param).substr(0, eq)));
            std::string val(strip(std::string_view(param).substr(eq + 1)));

            if (key == "filename*")
            {
                // charset'language'percent-encoded-name
                const auto first = val.find('\'');
                const auto second
                    = first == std::string::npos ? first : val.find('\'', first + 1);
                if (second != std::string::npos)
                {
                    extended = unescape(val.substr(second + 1));
                }
            }
            else if (key == "filename")
            {
                if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
                {
                    val = val.substr(1, val.size() - 2);
                }
                plain = val;
            }
        }

        for (const auto& candidate : { extended, plain })
        {
            if (candidate)
            {
                std::string name = base_name(candidate.value());
                if (!name.empty())
                    return name;
            }
        }
        return std::nullopt;
    }

    std::optional<std::uint64_t> parse_content_range_total(const std::string& value)
    {
        const auto slash = value.rfind('/');
        if (slash == std::string::npos)
            return std::nullopt;
        return parse_uint(std::string_view(value).substr(slash + 1));
    }

    std::string resolve_filename(const std::string& explicit_name,
                                 const std::string& content_disposition,
                                 const std::string& url)
    {
        if (!explicit_name.empty())
        {
            return explicit_name;
        }

        if (!content_disposition.empty())
        {
            if (auto name = parse_content_disposition(content_disposition))
            {
                return name.value();
            }
        }

        try
        {
            std::string name = base_name(URLHandler(url).last_segment());
            if (!name.empty())
            {
                return name;
            }
        }
        catch (const std::invalid_argument& e)
        {
            spdlog::debug("No file name from URL: {}", e.what());
        }
        return "download.bin";
    }

    SegmentPlanner::SegmentPlanner(Transport& transport)
        : m_transport(transport)
    {
    }

    tl::expected<ProbeResult, TransferError> SegmentPlanner::probe(const TransferSpec& spec)
    {
        ProbeResult result;
        result.effective_url = spec.url;
        std::string disposition;

        auto head = m_transport.head(spec.request(spec.url));
        const bool head_ok = head && head->http_status >= 200 && head->http_status < 300;
        if (head_ok)
        {
            if (!head->effective_url.empty())
                result.effective_url = head->effective_url;
            if (auto length = head->get_header("content-length"))
                result.total_size = parse_uint(length.value());
            result.accept_ranges = declares_byte_ranges(head.value());
            disposition = head->get_header("content-disposition").value_or("");
        }
        else if (head)
        {
            spdlog::debug("HEAD {} returned {}, trying a ranged GET", spec.url, head->http_status);
        }
        else
        {
            spdlog::debug(
                "HEAD {} failed ({}), trying a ranged GET", spec.url, head.error().reason);
        }

        if (!head_ok || !result.total_size)
        {
            HttpRequest request = spec.request(result.effective_url);
            request.range = "0-0";

            // Only the head matters: a server ignoring the range would send everything.
            std::optional<Response> seen;
            auto on_head = [&seen](const Response& r)
            {
                seen = r;
                return r.http_status == 206;
            };
            auto get = m_transport.perform(request, on_head, {});
            if (get)
            {
                seen = get.value();
            }

            if (!seen)
            {
                if (!head_ok)
                {
                    return tl::unexpected(probe_error(fmt::format(
                        "Could not probe {}: {}", spec.url, get.error().reason)));
                }
            }
            else if (seen->http_status == 206 || seen->http_status == 200)
            {
                if (!seen->effective_url.empty())
                    result.effective_url = seen->effective_url;
                // a 206 only tells the size, range support must be declared explicitly
                if (seen->http_status == 206)
                {
                    if (auto range = seen->get_header("content-range"))
                        result.total_size = parse_content_range_total(range.value());
                }
                else if (auto length = seen->get_header("content-length"))
                {
                    result.total_size = parse_uint(length.value());
                }
                result.accept_ranges = result.accept_ranges || declares_byte_ranges(*seen);
                if (disposition.empty())
                    disposition = seen->get_header("content-disposition").value_or("");
            }
            else if (!head_ok)
            {
                return tl::unexpected(probe_error(fmt::format(
                    "Could not probe {}: server answered {}", spec.url, seen->http_status)));
            }
        }

        result.filename = resolve_filename(spec.filename, disposition, result.effective_url);

        spdlog::info("Probed {}: size {}, ranges {}, name '{}'",
                     result.effective_url,
                     result.total_size ? human_bytes(result.total_size.value()) : "unknown",
                     result.accept_ranges ? "supported" : "not supported",
                     result.filename);
        return result;
    }

    std::vector<Segment> SegmentPlanner::plan(const ProbeResult& probe,
                                              std::uint64_t chunk_size,
                                              const fs::path& destination)
    {
        std::vector<Segment> segments;
        if (!probe.accept_ranges || !probe.total_size || probe.total_size.value() == 0
            || chunk_size == 0)
        {
            segments.emplace_back(0, std::nullopt, destination);
            return segments;
        }

        const std::uint64_t total = probe.total_size.value();
        for (std::uint64_t start = 0; start < total; start += chunk_size)
        {
            const std::uint64_t end = std::min(start + chunk_size, total) - 1;
            segments.emplace_back(start, end, destination);
        }
        return segments;
    }
}
