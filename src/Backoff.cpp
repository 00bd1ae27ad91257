#include <convsync/Backoff.hpp>

#include <algorithm>
#include <cmath>

namespace convsync
{
    Backoff::Backoff(BackoffPolicy policy, std::uint32_t seed)
        : policy_(policy), rng_(seed)
    {
        if (policy_.initialDelay.count() < 0)
            policy_.initialDelay = std::chrono::milliseconds{0};
        if (policy_.maxDelay < policy_.initialDelay)
            policy_.maxDelay = policy_.initialDelay;
        policy_.jitterRatio = std::clamp(policy_.jitterRatio, 0.0, 1.0);
    }

    std::chrono::milliseconds Backoff::base(std::size_t attempt) const
    {
        const long long cap = policy_.maxDelay.count();
        long long delay = policy_.initialDelay.count();

        for (std::size_t i = 0; i < attempt && delay < cap; ++i)
            delay *= 2;

        return std::chrono::milliseconds{std::min(delay, cap)};
    }

    std::chrono::milliseconds Backoff::next(std::size_t attempt)
    {
        const auto b = base(attempt);
        const auto spread = static_cast<long long>(
            std::floor(static_cast<double>(b.count()) * policy_.jitterRatio));

        if (spread <= 0)
            return b;

        std::uniform_int_distribution<long long> jitter(0, spread);
        return b + std::chrono::milliseconds{jitter(rng_)};
    }

} // namespace convsync
