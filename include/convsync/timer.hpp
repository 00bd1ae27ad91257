#ifndef CONVSYNC_TIMER_HPP
#define CONVSYNC_TIMER_HPP

/**
 * @file timer.hpp
 * @brief One-shot timer slot used by the client state machine.
 *
 * Arming replaces whatever was armed before; cancel() drops it. The
 * callback runs on the owner's event loop, never inside arm().
 */

#include <chrono>
#include <cstdint>
#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace convsync
{
    class ITimer
    {
    public:
        virtual ~ITimer() = default;

        virtual void arm(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
        virtual void cancel() = 0;
    };

    /// ITimer over a boost::asio::steady_timer. Not thread-safe: use it from
    /// the io_context thread only.
    class AsioTimer : public ITimer
    {
    public:
        explicit AsioTimer(boost::asio::io_context &ioc);
        ~AsioTimer() override;

        void arm(std::chrono::milliseconds delay, std::function<void()> callback) override;
        void cancel() override;

    private:
        boost::asio::steady_timer timer_;
        std::uint64_t generation_ = 0;
    };

} // namespace convsync

#endif // CONVSYNC_TIMER_HPP
