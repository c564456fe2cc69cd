#include <algorithm>
#include <cstdio>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <segloader/context.hpp>
#include <segloader/progress.hpp>
#include <segloader/utils.hpp>

namespace segloader
{
    namespace
    {
        constexpr auto rate_sample_interval = std::chrono::milliseconds(100);
        // weight of the newest sample in the smoothed rate
        constexpr double rate_smoothing = 0.3;
    }

    ProgressTracker::ProgressTracker(const Context& ctx, ProgressObserver* observer)
        : m_ctx(ctx)
        , m_observer(observer)
        , m_last_sample(clock::now())
        , m_last_emit(clock::now())
    {
    }

    void ProgressTracker::set_total(std::optional<std::uint64_t> total)
    {
        m_total = total.value_or(0);
        m_total_known = total.has_value();
    }

    void ProgressTracker::reset()
    {
        std::lock_guard<std::mutex> lock(m_rate_mutex);
        m_downloaded = 0;
        m_total = 0;
        m_total_known = false;
        m_rate = 0;
        m_rate_sampled = false;
        m_last_sample = clock::now();
        m_last_sample_bytes = 0;
    }

    void ProgressTracker::add(std::uint64_t n)
    {
        m_downloaded += n;
        const auto now = clock::now();
        sample_rate(now);

        // a thread already emitting makes this update redundant
        std::unique_lock<std::mutex> lock(m_emit_mutex, std::try_to_lock);
        if (lock.owns_lock() && now - m_last_emit >= m_ctx.progress_interval)
        {
            emit_locked(TransferPhase::kDOWNLOADING, {});
        }
    }

    void ProgressTracker::credit(std::uint64_t n)
    {
        std::lock_guard<std::mutex> lock(m_rate_mutex);
        m_downloaded += n;
        m_last_sample_bytes += n;
    }

    void ProgressTracker::discard(std::uint64_t n)
    {
        std::lock_guard<std::mutex> lock(m_rate_mutex);
        const std::uint64_t current = m_downloaded.load();
        const std::uint64_t dropped = std::min(n, current);
        m_downloaded -= dropped;
        m_last_sample_bytes -= std::min(dropped, m_last_sample_bytes);
    }

    void ProgressTracker::sample_rate(clock::time_point now)
    {
        std::unique_lock<std::mutex> lock(m_rate_mutex, std::try_to_lock);
        if (!lock.owns_lock())
            return;

        const auto elapsed = now - m_last_sample;
        if (elapsed < rate_sample_interval)
            return;

        const std::uint64_t downloaded = m_downloaded.load();
        const double seconds = std::chrono::duration<double>(elapsed).count();
        const double delta = downloaded >= m_last_sample_bytes
                                 ? static_cast<double>(downloaded - m_last_sample_bytes)
                                 : 0.0;
        const double instant = delta / seconds;

        m_rate = m_rate_sampled ? rate_smoothing * instant + (1 - rate_smoothing) * m_rate
                                : instant;
        m_rate_sampled = true;
        m_last_sample = now;
        m_last_sample_bytes = downloaded;
    }

    void ProgressTracker::set_phase(TransferPhase phase, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(m_emit_mutex);
        m_phase = phase;
        emit_locked(phase, message);
    }

    ProgressSnapshot ProgressTracker::snapshot() const
    {
        ProgressSnapshot snap;
        snap.downloaded = m_downloaded.load();
        if (m_total_known)
        {
            snap.total = m_total.load();
        }
        {
            std::lock_guard<std::mutex> lock(m_rate_mutex);
            snap.rate = m_rate;
        }
        if (snap.total)
        {
            const std::uint64_t left
                = snap.total.value() > snap.downloaded ? snap.total.value() - snap.downloaded : 0;
            snap.eta = static_cast<double>(left) / std::max(snap.rate, 1.0);
        }
        return snap;
    }

    void ProgressTracker::emit_locked(TransferPhase phase, const std::string& message)
    {
        m_last_emit = clock::now();
        if (!m_observer)
            return;

        const ProgressSnapshot snap = snapshot();
        ProgressEvent event;
        event.phase = phase;
        event.downloaded = snap.downloaded;
        event.total = snap.total;
        event.rate = snap.rate;
        event.eta = snap.eta;
        event.message = message;
        m_observer->on_event(event);
    }

    ConsoleProgressBar::ConsoleProgressBar(std::size_t width)
        : m_width(width)
    {
    }

    void ConsoleProgressBar::on_event(const ProgressEvent& event)
    {
        if (event.phase == TransferPhase::kINITIALIZING)
        {
            if (!event.message.empty())
                fmt::print(stderr, "{}\n", event.message);
            return;
        }

        std::string line;
        if (event.total && event.total.value() > 0)
        {
            const double done = std::min(
                1.0,
                static_cast<double>(event.downloaded) / static_cast<double>(event.total.value()));
            const std::size_t pos = static_cast<std::size_t>(static_cast<double>(m_width) * done);

            line += "[";
            for (std::size_t i = 0; i < m_width; ++i)
            {
                if (i < pos)
                    line += "=";
                else if (i == pos)
                    line += ">";
                else
                    line += " ";
            }
            line += fmt::format("] {:5.1f}% {}/{}",
                                done * 100,
                                human_bytes(event.downloaded),
                                human_bytes(event.total.value()));
        }
        else
        {
            line += human_bytes(event.downloaded);
        }

        line += fmt::format(" {}/s", human_bytes(static_cast<std::uint64_t>(event.rate)));
        if (event.eta && event.phase == TransferPhase::kDOWNLOADING)
        {
            line += fmt::format(" eta {:.0f}s", event.eta.value());
        }

        fmt::print(stderr, "\r{}\x1b[K", line);
        if (event.phase == TransferPhase::kCOMPLETED || event.phase == TransferPhase::kERROR)
        {
            fmt::print(stderr, "\n");
            if (!event.message.empty())
                fmt::print(stderr, "{}\n", event.message);
        }
        std::fflush(stderr);
    }

    JsonProgressSink::JsonProgressSink(std::ostream& out)
        : m_out(out)
    {
    }

    std::string JsonProgressSink::to_json_line(const ProgressEvent& event)
    {
        nlohmann::json j;
        j["phase"] = to_string(event.phase);
        j["downloaded"] = event.downloaded;
        j["total"] = event.total ? nlohmann::json(event.total.value()) : nlohmann::json();
        j["rate"] = event.rate;
        j["eta"] = event.eta ? nlohmann::json(event.eta.value()) : nlohmann::json();
        j["message"] = event.message;
        return j.dump();
    }

    void JsonProgressSink::on_event(const ProgressEvent& event)
    {
        m_out << to_json_line(event) << std::endl;
    }
}
