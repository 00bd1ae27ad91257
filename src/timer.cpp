#include <convsync/timer.hpp>

namespace convsync
{
    AsioTimer::AsioTimer(boost::asio::io_context &ioc)
        : timer_(ioc)
    {
    }

    AsioTimer::~AsioTimer()
    {
        ++generation_;
        timer_.cancel();
    }

    void AsioTimer::arm(std::chrono::milliseconds delay, std::function<void()> callback)
    {
        const std::uint64_t generation = ++generation_;

        timer_.expires_after(delay);
        timer_.async_wait(
            [this, generation, cb = std::move(callback)](const boost::system::error_code &ec)
            {
                // A re-arm or cancel after this wait was queued makes it stale.
                if (ec || generation != generation_)
                    return;
                cb();
            });
    }

    void AsioTimer::cancel()
    {
        ++generation_;
        timer_.cancel();
    }

} // namespace convsync
