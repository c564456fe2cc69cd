#include <algorithm>
#include <thread>

#include <segloader/rate_limiter.hpp>

namespace segloader
{
    namespace
    {
        // upper bound of one sleep, so a raised stop flag is noticed quickly
        constexpr auto max_wait_slice = std::chrono::milliseconds(50);
    }

    RateLimiter::RateLimiter(std::uint64_t rate, const std::atomic<bool>* stop)
        : m_rate(rate)
        , m_stop(stop)
        , m_tokens(static_cast<double>(rate))
        , m_last_refill(clock::now())
    {
    }

    RateLimiter::clock::duration RateLimiter::try_debit(std::uint64_t n)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        const auto now = clock::now();
        const double elapsed = std::chrono::duration<double>(now - m_last_refill).count();
        m_last_refill = now;
        m_tokens = std::min(static_cast<double>(m_rate),
                            m_tokens + elapsed * static_cast<double>(m_rate));

        const double wanted = static_cast<double>(n);
        if (m_tokens >= wanted)
        {
            m_tokens -= wanted;
            return clock::duration::zero();
        }

        const double deficit = (wanted - m_tokens) / static_cast<double>(m_rate);
        return std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(deficit))
               + clock::duration(1);
    }

    bool RateLimiter::consume(std::uint64_t n)
    {
        if (m_rate == 0)
            return true;

        while (n > 0)
        {
            const std::uint64_t piece = std::min(n, m_rate);
            while (true)
            {
                if (m_stop && m_stop->load())
                    return false;

                const auto wait = try_debit(piece);
                if (wait == clock::duration::zero())
                    break;

                std::this_thread::sleep_for(
                    std::min<clock::duration>(wait, max_wait_slice));
            }
            n -= piece;
        }
        return true;
    }
}
