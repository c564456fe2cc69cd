#ifndef SEGLOADER_SEGMENT_WORKER_HPP
#define SEGLOADER_SEGMENT_WORKER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/errors.hpp>
#include <segloader/progress.hpp>
#include <segloader/rate_limiter.hpp>
#include <segloader/segment.hpp>
#include <segloader/transfer_spec.hpp>
#include <segloader/transfer_state.hpp>
#include <segloader/transport.hpp>

namespace segloader
{
    class Context;

    // Downloads one segment into its partial file, resuming from what is already on disk
    // and retrying transient failures with exponential backoff.
    class SEGLOADER_API SegmentWorker
    {
    public:
        SegmentWorker(const Context& ctx,
                      Transport& transport,
                      const TransferSpec& spec,
                      const std::string& url,
                      RateLimiter& limiter,
                      TransferState& state,
                      ProgressTracker& progress,
                      const std::atomic<bool>& stop);

        tl::expected<void, TransferError> fetch(Segment& segment);

        // Delay before attempt `attempt + 1`: base * factor^(attempt - 1), capped.
        std::chrono::steady_clock::duration backoff(std::size_t attempt) const;

    private:
        tl::expected<void, TransferError> attempt(Segment& segment, std::uint64_t& written);
        tl::expected<void, TransferError> restart(Segment& segment, std::uint64_t& written);

        // Returns false when the stop flag interrupted the wait.
        bool wait(std::chrono::steady_clock::duration delay) const;

        void record(const Segment& segment, std::uint64_t written);

        const Context& m_ctx;
        Transport& m_transport;
        const TransferSpec& m_spec;
        std::string m_url;
        RateLimiter& m_limiter;
        TransferState& m_state;
        ProgressTracker& m_progress;
        const std::atomic<bool>& m_stop;
    };
}

#endif
