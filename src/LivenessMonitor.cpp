#include <convsync/LivenessMonitor.hpp>

#include <algorithm>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    LivenessMonitor::LivenessMonitor(ITimer &timer, LivenessConfig cfg, ProbeFn probe, DeadFn onDead)
        : timer_(timer),
          cfg_(cfg),
          probe_(std::move(probe)),
          onDead_(std::move(onDead))
    {
        if (cfg_.maxMissed == 0)
            cfg_.maxMissed = 1;
        cfg_.timeout = std::min(cfg_.timeout, cfg_.interval);
    }

    void LivenessMonitor::start()
    {
        running_ = true;
        awaiting_ = false;
        missed_ = 0;

        timer_.arm(cfg_.interval, [this]()
                   { on_probe_due(); });
    }

    void LivenessMonitor::stop()
    {
        if (!running_)
            return;

        running_ = false;
        awaiting_ = false;
        timer_.cancel();
    }

    void LivenessMonitor::note_traffic()
    {
        awaiting_ = false;
        missed_ = 0;
    }

    void LivenessMonitor::on_probe_due()
    {
        if (!running_)
            return;

        awaiting_ = true;
        if (probe_)
            probe_();

        timer_.arm(cfg_.timeout, [this]()
                   { on_ack_deadline(); });
    }

    void LivenessMonitor::on_ack_deadline()
    {
        if (!running_)
            return;

        if (awaiting_)
        {
            ++missed_;
            awaiting_ = false;

            logger.log(Logger::Level::WARN,
                       "[convsync][Liveness] heartbeat missed ({}/{})", missed_, cfg_.maxMissed);

            if (missed_ >= cfg_.maxMissed)
            {
                running_ = false;
                if (onDead_)
                    onDead_();
                return;
            }
        }

        timer_.arm(cfg_.interval - cfg_.timeout, [this]()
                   { on_probe_due(); });
    }

} // namespace convsync
