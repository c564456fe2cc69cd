#ifndef SEGLOADER_RATE_LIMITER_HPP
#define SEGLOADER_RATE_LIMITER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

#include <segloader/export.hpp>

namespace segloader
{
    // Token bucket shared by every worker of a transfer. The bucket holds at most one
    // second worth of tokens and refills continuously.
    class SEGLOADER_API RateLimiter
    {
    public:
        using clock = std::chrono::steady_clock;

        // A rate of 0 disables limiting. When `stop` is given, waiting callers give up as
        // soon as it is raised.
        explicit RateLimiter(std::uint64_t rate, const std::atomic<bool>* stop = nullptr);

        RateLimiter(const RateLimiter&) = delete;
        RateLimiter& operator=(const RateLimiter&) = delete;

        // Blocks until `n` tokens have been debited. Requests larger than the capacity are
        // debited in capacity sized pieces. Returns false if interrupted by the stop flag.
        bool consume(std::uint64_t n);

        std::uint64_t rate() const noexcept
        {
            return m_rate;
        }

    private:
        // Refills, then debits up to `n` tokens. Returns the time to wait for the rest.
        clock::duration try_debit(std::uint64_t n);

        const std::uint64_t m_rate;
        const std::atomic<bool>* m_stop;

        std::mutex m_mutex;
        double m_tokens;
        clock::time_point m_last_refill;
    };
}

#endif
