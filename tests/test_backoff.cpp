#include <gtest/gtest.h>

#include <convsync/Backoff.hpp>

using namespace convsync;
using std::chrono::milliseconds;

TEST(Backoff, BaseDoublesUpToTheCap)
{
    Backoff b{BackoffPolicy{milliseconds{1000}, milliseconds{30000}, 0.3}, 1};

    EXPECT_EQ(b.base(0), milliseconds{1000});
    EXPECT_EQ(b.base(1), milliseconds{2000});
    EXPECT_EQ(b.base(4), milliseconds{16000});
    EXPECT_EQ(b.base(5), milliseconds{30000});
    EXPECT_EQ(b.base(60), milliseconds{30000});
}

TEST(Backoff, JitterStaysWithinThirtyPercent)
{
    Backoff b{BackoffPolicy{}, 42};

    for (std::size_t attempt = 0; attempt < 8; ++attempt)
    {
        const auto base = b.base(attempt);
        for (int i = 0; i < 50; ++i)
        {
            const auto d = b.next(attempt);
            EXPECT_GE(d, base);
            EXPECT_LE(d.count(), base.count() + base.count() * 3 / 10);
        }
    }
}

TEST(Backoff, SameSeedReplaysSameSequence)
{
    Backoff a{BackoffPolicy{}, 7};
    Backoff b{BackoffPolicy{}, 7};

    for (std::size_t i = 0; i < 10; ++i)
        EXPECT_EQ(a.next(i), b.next(i));
}

TEST(Backoff, ZeroJitterIsDeterministic)
{
    Backoff b{BackoffPolicy{milliseconds{100}, milliseconds{1000}, 0.0}, 3};
    EXPECT_EQ(b.next(2), milliseconds{400});
}

TEST(Backoff, MaxBelowInitialIsRaised)
{
    Backoff b{BackoffPolicy{milliseconds{500}, milliseconds{100}, 0.0}};
    EXPECT_EQ(b.policy().maxDelay, milliseconds{500});
    EXPECT_EQ(b.base(3), milliseconds{500});
}
