#ifndef CONVSYNC_BACKOFF_HPP
#define CONVSYNC_BACKOFF_HPP

/**
 * @file Backoff.hpp
 * @brief Exponential reconnect delay with additive jitter.
 *
 *   base(n)  = min(maxDelay, initialDelay * 2^n)
 *   next(n)  = base(n) + U[0, jitterRatio * base(n)]
 *
 * The random engine is seeded explicitly so tests can replay a sequence.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>

namespace convsync
{
    struct BackoffPolicy
    {
        std::chrono::milliseconds initialDelay{1000};
        std::chrono::milliseconds maxDelay{30000};
        double jitterRatio = 0.3;
    };

    class Backoff
    {
    public:
        explicit Backoff(BackoffPolicy policy = {},
                         std::uint32_t seed = std::random_device{}());

        /// Delay before jitter for the given (0-based) attempt.
        [[nodiscard]] std::chrono::milliseconds base(std::size_t attempt) const;

        /// Delay to wait before retrying after `attempt` failed attempts.
        std::chrono::milliseconds next(std::size_t attempt);

        [[nodiscard]] const BackoffPolicy &policy() const noexcept { return policy_; }

    private:
        BackoffPolicy policy_;
        std::mt19937 rng_;
    };

} // namespace convsync

#endif // CONVSYNC_BACKOFF_HPP
