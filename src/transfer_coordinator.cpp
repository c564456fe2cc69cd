#include <algorithm>
#include <deque>
#include <mutex>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <segloader/assembler.hpp>
#include <segloader/context.hpp>
#include <segloader/rate_limiter.hpp>
#include <segloader/segment_planner.hpp>
#include <segloader/segment_worker.hpp>
#include <segloader/transfer_coordinator.hpp>
#include <segloader/utils.hpp>
#include <segloader/verifier.hpp>

namespace segloader
{
    fs::path resolve_destination(const fs::path& destination, const std::string& filename)
    {
        std::error_code ec;
        if (fs::is_directory(destination, ec))
        {
            return destination / filename;
        }
        return destination;
    }

    TransferCoordinator::TransferCoordinator(const Context& ctx,
                                             Transport& transport,
                                             ProgressObserver* observer)
        : m_ctx(ctx)
        , m_transport(transport)
        , m_progress(ctx, observer)
    {
    }

    TransferCoordinator::TransferCoordinator(const Context& ctx,
                                             std::unique_ptr<Transport> transport,
                                             ProgressObserver* observer)
        : m_ctx(ctx)
        , m_owned_transport(std::move(transport))
        , m_transport(*m_owned_transport)
        , m_progress(ctx, observer)
    {
    }

    void TransferCoordinator::cancel()
    {
        spdlog::info("Cancelling transfer");
        m_stop = true;
    }

    ProgressSnapshot TransferCoordinator::progress() const
    {
        return m_progress.snapshot();
    }

    TransferError TransferCoordinator::fail(TransferError error)
    {
        error.log();
        m_progress.set_phase(TransferPhase::kERROR, describe(error));
        return error;
    }

    tl::expected<bool, TransferError> TransferCoordinator::already_complete(
        const TransferSpec& spec,
        const ProbeResult& probe,
        const fs::path& destination,
        const fs::path& state_path)
    {
        std::error_code ec;
        if (!fs::is_regular_file(destination, ec) || fs::exists(state_path, ec))
        {
            return false;
        }

        if (spec.expected_sha256)
        {
            auto matches = verify(destination, spec.expected_sha256.value());
            if (!matches)
            {
                return tl::unexpected(matches.error());
            }
            if (!matches.value())
            {
                spdlog::warn("Existing {} does not match the expected SHA-256, downloading again",
                             destination.string());
                fs::remove(destination, ec);
                if (ec)
                {
                    return tl::unexpected(
                        TransferError{ ErrorLevel::FATAL,
                                       ErrorCode::SL_IO,
                                       fmt::format("Could not remove {}: {}",
                                                   destination.string(),
                                                   ec.message()) });
                }
                return false;
            }
            return true;
        }

        const auto size = fs::file_size(destination, ec);
        return !ec && probe.total_size && size == probe.total_size.value();
    }

    tl::expected<fs::path, TransferError> TransferCoordinator::run(const TransferSpec& spec)
    {
        auto res = execute(spec);
        m_stop = false;
        return res;
    }

    tl::expected<fs::path, TransferError> TransferCoordinator::execute(const TransferSpec& spec)
    {
        m_progress.reset();
        m_progress.set_phase(TransferPhase::kINITIALIZING, fmt::format("Probing {}", spec.url));

        auto valid = spec.validate();
        if (!valid)
        {
            return tl::unexpected(fail(valid.error()));
        }
        if (m_stop.load())
        {
            return tl::unexpected(fail(TransferError{
                ErrorLevel::FATAL, ErrorCode::SL_INTERRUPTED, "Transfer cancelled" }));
        }

        SegmentPlanner planner(m_transport);
        auto probe = planner.probe(spec);
        if (!probe)
        {
            return tl::unexpected(fail(probe.error()));
        }

        const fs::path destination = resolve_destination(spec.destination, probe->filename);
        const fs::path state_path = TransferState::path_for(destination);
        m_progress.set_total(probe->total_size);

        auto complete = already_complete(spec, probe.value(), destination, state_path);
        if (!complete)
        {
            return tl::unexpected(fail(complete.error()));
        }
        if (complete.value())
        {
            std::error_code ec;
            m_progress.credit(fs::file_size(destination, ec));
            m_progress.set_phase(TransferPhase::kCOMPLETED,
                                 fmt::format("{} is already complete", destination.string()));
            return destination;
        }

        std::vector<Segment> segments
            = SegmentPlanner::plan(probe.value(), spec.chunk_size, destination);

        TransferState state(state_path, spec.url, probe->total_size);
        auto loaded = state.load();
        if (!loaded)
        {
            spdlog::warn("{}, starting over", loaded.error().reason);
        }
        if (!loaded || !loaded.value())
        {
            // partial files of another resource (or of unknown origin) cannot be resumed
            for (const auto& segment : segments)
            {
                std::error_code ec;
                fs::remove(segment.partial_path(), ec);
            }
        }
        auto saved = state.save();
        if (!saved)
        {
            spdlog::warn("{}", saved.error().reason);
        }

        spdlog::info("Downloading {} to {} in {} segment(s)",
                     spec.url,
                     destination.string(),
                     segments.size());
        m_progress.set_phase(TransferPhase::kDOWNLOADING);

        RateLimiter limiter(spec.rate_limit, &m_stop);
        SegmentWorker worker(
            m_ctx, m_transport, spec, probe->effective_url, limiter, state, m_progress, m_stop);

        if (auto error = download(spec, worker, segments))
        {
            for (const auto& segment : segments)
            {
                if (segment.state != SegmentState::kFINISHED)
                {
                    error->remaining.push_back(segment.range_key());
                }
            }
            return tl::unexpected(fail(error.value()));
        }

        auto assembled = assemble(segments, destination);
        if (!assembled)
        {
            return tl::unexpected(fail(assembled.error()));
        }

        if (spec.expected_sha256)
        {
            auto matches = verify(destination, spec.expected_sha256.value());
            if (!matches)
            {
                return tl::unexpected(fail(matches.error()));
            }
            if (!matches.value())
            {
                return tl::unexpected(fail(TransferError{
                    ErrorLevel::FATAL,
                    ErrorCode::SL_INTEGRITYFAILED,
                    fmt::format("SHA-256 of {} does not match {}",
                                destination.string(),
                                spec.expected_sha256.value()) }));
            }
        }

        auto removed = state.remove();
        if (!removed)
        {
            spdlog::warn("{}", removed.error().reason);
        }

        m_progress.set_phase(TransferPhase::kCOMPLETED,
                             fmt::format("Saved {}", destination.string()));
        spdlog::info("Saved {}", destination.string());
        return destination;
    }

    std::optional<TransferError> TransferCoordinator::download(const TransferSpec& spec,
                                                               SegmentWorker& worker,
                                                               std::vector<Segment>& segments)
    {
        std::optional<TransferError> first_error;

        if (segments.size() == 1 && !segments.front().bounded())
        {
            auto res = worker.fetch(segments.front());
            if (!res)
            {
                first_error = res.error();
            }
        }
        else
        {
            std::deque<std::size_t> pending;
            for (std::size_t i = 0; i < segments.size(); ++i)
            {
                pending.push_back(i);
            }
            std::mutex queue_mutex;
            std::mutex error_mutex;

            auto work = [&]()
            {
                while (true)
                {
                    std::size_t idx;
                    {
                        std::lock_guard<std::mutex> lock(queue_mutex);
                        if (m_stop.load() || pending.empty())
                        {
                            return;
                        }
                        idx = pending.front();
                        pending.pop_front();
                    }

                    auto res = worker.fetch(segments[idx]);
                    if (!res)
                    {
                        std::lock_guard<std::mutex> lock(error_mutex);
                        // a worker interrupted by the first failure does not replace it
                        if (!first_error)
                        {
                            first_error = res.error();
                        }
                        m_stop = true;
                    }
                }
            };

            const std::size_t nthreads = std::min(spec.concurrency, segments.size());
            std::vector<std::thread> threads;
            threads.reserve(nthreads);
            for (std::size_t i = 0; i < nthreads; ++i)
            {
                threads.emplace_back(work);
            }
            for (auto& t : threads)
            {
                t.join();
            }
        }

        if (!first_error && m_stop.load())
        {
            first_error = TransferError{ ErrorLevel::FATAL,
                                         ErrorCode::SL_INTERRUPTED,
                                         "Transfer cancelled" };
        }
        return first_error;
    }
}
