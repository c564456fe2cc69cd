#include <algorithm>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <segloader/context.hpp>
#include <segloader/fileio.hpp>
#include <segloader/segment_planner.hpp>
#include <segloader/segment_worker.hpp>
#include <segloader/utils.hpp>

namespace segloader
{
    namespace
    {
        constexpr auto stop_poll_interval = std::chrono::milliseconds(50);

        TransferError interrupted(const Segment& segment)
        {
            return { ErrorLevel::FATAL,
                     ErrorCode::SL_INTERRUPTED,
                     fmt::format("Segment {} interrupted", segment.range_key()) };
        }

        TransferError io_error(const fs::path& path, const std::error_code& ec)
        {
            return { ErrorLevel::FATAL,
                     ErrorCode::SL_IO,
                     fmt::format("Could not write {}: {}", path.string(), ec.message()) };
        }
    }

    SegmentWorker::SegmentWorker(const Context& ctx,
                                 Transport& transport,
                                 const TransferSpec& spec,
                                 const std::string& url,
                                 RateLimiter& limiter,
                                 TransferState& state,
                                 ProgressTracker& progress,
                                 const std::atomic<bool>& stop)
        : m_ctx(ctx)
        , m_transport(transport)
        , m_spec(spec)
        , m_url(url)
        , m_limiter(limiter)
        , m_state(state)
        , m_progress(progress)
        , m_stop(stop)
    {
    }

    std::chrono::steady_clock::duration SegmentWorker::backoff(std::size_t attempt) const
    {
        auto delay = m_ctx.retry_base_delay;
        for (std::size_t i = 1; i < attempt && delay < m_ctx.max_retry_delay; ++i)
        {
            delay *= static_cast<long>(m_ctx.retry_backoff_factor);
        }
        return std::min(delay, m_ctx.max_retry_delay);
    }

    bool SegmentWorker::wait(std::chrono::steady_clock::duration delay) const
    {
        const auto deadline = std::chrono::steady_clock::now() + delay;
        while (!m_stop.load())
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                return true;
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(deadline - now, stop_poll_interval));
        }
        return false;
    }

    void SegmentWorker::record(const Segment& segment, std::uint64_t written)
    {
        auto saved = m_state.update(segment.range_key(), written);
        if (!saved)
        {
            // the partial file stays authoritative for resuming
            spdlog::warn("{}", saved.error().reason);
        }
    }

    tl::expected<void, TransferError> SegmentWorker::restart(Segment& segment,
                                                             std::uint64_t& written)
    {
        std::error_code ec;
        fs::resize_file(segment.partial_path(), 0, ec);
        if (ec)
        {
            return tl::unexpected(io_error(segment.partial_path(), ec));
        }
        m_progress.discard(written);
        written = 0;
        record(segment, written);
        return {};
    }

    tl::expected<void, TransferError> SegmentWorker::fetch(Segment& segment)
    {
        std::uint64_t written = segment.written();
        if (segment.bounded() && written > segment.length().value())
        {
            spdlog::warn("Partial file {} is larger than its range, truncating",
                         segment.partial_path().string());
            std::error_code ec;
            fs::resize_file(segment.partial_path(), segment.length().value(), ec);
            if (ec)
            {
                return tl::unexpected(io_error(segment.partial_path(), ec));
            }
            written = segment.length().value();
        }
        m_progress.credit(written);

        if (segment.complete(written))
        {
            spdlog::debug("Segment {} already complete", segment.range_key());
            record(segment, written);
            segment.state = SegmentState::kFINISHED;
            return {};
        }

        segment.state = SegmentState::kRUNNING;
        const std::size_t attempts = m_spec.retries + 1;
        TransferError last_error{ ErrorLevel::INFO, ErrorCode::SL_OK, "" };

        for (std::size_t n = 1; n <= attempts; ++n)
        {
            if (m_stop.load())
            {
                segment.state = SegmentState::kWAITING;
                return tl::unexpected(interrupted(segment));
            }

            auto res = attempt(segment, written);
            if (res)
            {
                segment.state = SegmentState::kFINISHED;
                return {};
            }

            last_error = res.error();
            if (last_error.code == ErrorCode::SL_INTERRUPTED)
            {
                segment.state = SegmentState::kWAITING;
                return res;
            }
            if (!last_error.is_retryable())
            {
                segment.state = SegmentState::kFAILED;
                return res;
            }
            if (n == attempts)
            {
                break;
            }

            const auto delay = backoff(n);
            spdlog::warn("Segment {} attempt {}/{} failed: {}. Retrying in {} ms",
                         segment.range_key(),
                         n,
                         attempts,
                         last_error.reason,
                         std::chrono::duration_cast<std::chrono::milliseconds>(delay).count());
            if (!wait(delay))
            {
                segment.state = SegmentState::kWAITING;
                return tl::unexpected(interrupted(segment));
            }
        }

        segment.state = SegmentState::kFAILED;
        return tl::unexpected(
            TransferError{ ErrorLevel::FATAL,
                           ErrorCode::SL_RETRIESEXHAUSTED,
                           fmt::format("Segment {} failed after {} attempt(s): {}",
                                       segment.range_key(),
                                       attempts,
                                       last_error.reason) });
    }

    tl::expected<void, TransferError> SegmentWorker::attempt(Segment& segment,
                                                             std::uint64_t& written)
    {
        std::error_code ec;
        FileIO out(segment.partial_path(), FileIO::append_binary, ec);
        if (ec)
        {
            return tl::unexpected(io_error(segment.partial_path(), ec));
        }

        HttpRequest request = m_spec.request(m_url);
        request.range = segment.request_range(written);
        const std::uint64_t offset = segment.start() + written;

        long status = 0;
        bool range_ignored = false;
        bool stopped = false;
        bool reached_end = false;
        bool already_whole = false;
        std::error_code write_ec;

        auto on_head = [&](const Response& response)
        {
            status = response.http_status;
            if (status == 200 && offset != 0)
            {
                if (segment.bounded())
                {
                    range_ignored = true;
                    return false;
                }
                // a single stream takes the full body from this same response
                spdlog::warn("Server ignored the range {} of {}, downloading from the start",
                             request.range.value_or(""),
                             m_url);
                out.truncate(0, write_ec);
                if (write_ec)
                    return false;
                m_progress.discard(written);
                written = 0;
                record(segment, written);
                return true;
            }
            if (status == 416 && !segment.bounded())
            {
                // "bytes */<total>": the partial file may already hold everything
                auto content_range = response.get_header("content-range");
                auto total = content_range ? parse_content_range_total(content_range.value())
                                           : std::nullopt;
                already_whole = total && total.value() == offset;
                return false;
            }
            return status == 200 || status == 206;
        };

        auto on_body = [&](const char* data, std::size_t size)
        {
            if (m_stop.load())
            {
                stopped = true;
                return false;
            }

            std::size_t to_write = size;
            if (segment.bounded())
            {
                const std::uint64_t left = segment.length().value() - written;
                if (to_write >= left)
                {
                    to_write = static_cast<std::size_t>(left);
                    reached_end = true;
                }
            }

            if (!m_limiter.consume(to_write))
            {
                stopped = true;
                return false;
            }

            out.write_all(data, to_write, write_ec);
            if (!write_ec)
                out.flush(write_ec);
            if (write_ec)
                return false;

            written += to_write;
            m_progress.add(to_write);
            record(segment, written);

            // a server sending past the end of the range is cut off here
            return !(reached_end && to_write < size);
        };

        auto res = m_transport.perform(request, on_head, on_body);

        out.close(ec);
        if (write_ec || ec)
        {
            return tl::unexpected(io_error(segment.partial_path(), write_ec ? write_ec : ec));
        }
        if (stopped)
        {
            return tl::unexpected(interrupted(segment));
        }
        if (already_whole)
        {
            spdlog::debug("Segment {} already holds the whole resource ({})",
                          segment.range_key(),
                          human_bytes(written));
            return {};
        }
        if (range_ignored)
        {
            spdlog::warn("Server ignored the range {} of {}, restarting the segment",
                         request.range.value_or(""),
                         m_url);
            auto restarted = restart(segment, written);
            if (!restarted)
                return restarted;
            return tl::unexpected(TransferError{ ErrorLevel::INFO,
                                                 ErrorCode::SL_BADSTATUS,
                                                 "Server ignored the requested range" });
        }
        if (status != 0 && status != 200 && status != 206)
        {
            return tl::unexpected(
                TransferError{ ErrorLevel::INFO,
                               ErrorCode::SL_BADSTATUS,
                               fmt::format("HTTP {} for {} (range {})",
                                           status,
                                           m_url,
                                           request.range.value_or("none")) });
        }
        if (!res && !reached_end)
        {
            return tl::unexpected(res.error());
        }

        if (segment.bounded() && written < segment.length().value())
        {
            return tl::unexpected(
                TransferError{ ErrorLevel::INFO,
                               ErrorCode::SL_IO,
                               fmt::format("Short read for segment {}: {} of {} bytes",
                                           segment.range_key(),
                                           written,
                                           segment.length().value()) });
        }

        spdlog::debug("Segment {} done ({})", segment.range_key(), human_bytes(written));
        return {};
    }
}
