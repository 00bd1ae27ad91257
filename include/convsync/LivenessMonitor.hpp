#ifndef CONVSYNC_LIVENESS_MONITOR_HPP
#define CONVSYNC_LIVENESS_MONITOR_HPP

/**
 * @file LivenessMonitor.hpp
 * @brief Application-level heartbeat for an open channel.
 *
 * Every `interval` the monitor sends a probe and expects inbound traffic
 * (of any type) within `timeout`. Traffic resets the consecutive-miss
 * count. After `maxMissed` consecutive misses the monitor stops itself
 * and reports the channel as dead, exactly once per start().
 *
 *   start ── interval ──> probe ── timeout ──> check ── interval-timeout ──> probe ...
 */

#include <chrono>
#include <cstddef>
#include <functional>

#include <convsync/timer.hpp>

namespace convsync
{
    struct LivenessConfig
    {
        std::chrono::milliseconds interval{30000};
        std::chrono::milliseconds timeout{5000};
        std::size_t maxMissed = 3;
    };

    class LivenessMonitor
    {
    public:
        using ProbeFn = std::function<void()>;
        using DeadFn = std::function<void()>;

        LivenessMonitor(ITimer &timer, LivenessConfig cfg, ProbeFn probe, DeadFn onDead);

        void start();
        void stop();

        /// Any inbound frame counts as an acknowledgement.
        void note_traffic();

        [[nodiscard]] bool running() const noexcept { return running_; }
        [[nodiscard]] std::size_t missed() const noexcept { return missed_; }
        [[nodiscard]] const LivenessConfig &config() const noexcept { return cfg_; }

    private:
        void on_probe_due();
        void on_ack_deadline();

        ITimer &timer_;
        LivenessConfig cfg_;
        ProbeFn probe_;
        DeadFn onDead_;

        bool running_ = false;
        bool awaiting_ = false;
        std::size_t missed_ = 0;
    };

} // namespace convsync

#endif // CONVSYNC_LIVENESS_MONITOR_HPP
