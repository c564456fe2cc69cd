#ifndef SEGLOADER_PROGRESS_HPP
#define SEGLOADER_PROGRESS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include <segloader/export.hpp>
#include <segloader/enums.hpp>

namespace segloader
{
    class Context;

    struct ProgressSnapshot
    {
        std::uint64_t downloaded = 0;
        std::optional<std::uint64_t> total;
        // bytes per second, smoothed
        double rate = 0;
        // seconds left, only when the total is known
        std::optional<double> eta;
    };

    struct ProgressEvent
    {
        TransferPhase phase = TransferPhase::kINITIALIZING;
        std::uint64_t downloaded = 0;
        std::optional<std::uint64_t> total;
        double rate = 0;
        std::optional<double> eta;
        std::string message;
    };

    class SEGLOADER_API ProgressObserver
    {
    public:
        virtual ~ProgressObserver() = default;

        // Never called concurrently for the same tracker.
        virtual void on_event(const ProgressEvent& event) = 0;
    };

    // Byte counters shared by the workers of one transfer. Counting is lock free; events
    // reach the observer through a single emitter, "downloading" events at most once per
    // `Context::progress_interval`.
    class SEGLOADER_API ProgressTracker
    {
    public:
        using clock = std::chrono::steady_clock;

        explicit ProgressTracker(const Context& ctx, ProgressObserver* observer = nullptr);

        ProgressTracker(const ProgressTracker&) = delete;
        ProgressTracker& operator=(const ProgressTracker&) = delete;

        void set_total(std::optional<std::uint64_t> total);
        // Zeroes the counters for a new run.
        void reset();

        // Bytes received from the network.
        void add(std::uint64_t n);
        // Bytes found on disk from an earlier run. Counted, but not in the rate.
        void credit(std::uint64_t n);
        // Bytes dropped again, e.g. a partial file restarted from scratch.
        void discard(std::uint64_t n);

        // Phase changes are always delivered.
        void set_phase(TransferPhase phase, const std::string& message = {});

        TransferPhase phase() const noexcept
        {
            return m_phase.load();
        }

        ProgressSnapshot snapshot() const;

    private:
        void sample_rate(clock::time_point now);
        // `m_emit_mutex` must be held
        void emit_locked(TransferPhase phase, const std::string& message);

        const Context& m_ctx;
        ProgressObserver* m_observer;

        std::atomic<std::uint64_t> m_downloaded{ 0 };
        std::atomic<std::uint64_t> m_total{ 0 };
        std::atomic<bool> m_total_known{ false };
        std::atomic<TransferPhase> m_phase{ TransferPhase::kINITIALIZING };

        mutable std::mutex m_rate_mutex;
        double m_rate = 0;
        bool m_rate_sampled = false;
        clock::time_point m_last_sample;
        std::uint64_t m_last_sample_bytes = 0;

        std::mutex m_emit_mutex;
        clock::time_point m_last_emit;
    };

    // Draws a single line bar on stderr.
    class SEGLOADER_API ConsoleProgressBar : public ProgressObserver
    {
    public:
        explicit ConsoleProgressBar(std::size_t width = 40);
        void on_event(const ProgressEvent& event) override;

    private:
        std::size_t m_width;
    };

    // One JSON object per line:
    // {"phase":"downloading","downloaded":1024,"total":4096,"rate":512.0,"eta":6.0,"message":""}
    class SEGLOADER_API JsonProgressSink : public ProgressObserver
    {
    public:
        explicit JsonProgressSink(std::ostream& out);
        void on_event(const ProgressEvent& event) override;

        static std::string to_json_line(const ProgressEvent& event);

    private:
        std::ostream& m_out;
    };
}

#endif
