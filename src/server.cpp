#include <convsync/server.hpp>
#include <convsync/channel.hpp>

#include <chrono>
#include <thread>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    Server::Server(const GatewayConfig &cfg,
                   SyncGateway &gateway,
                   GatewayMetrics *metrics)
        : gateway_(gateway),
          metrics_(metrics),
          router_(std::make_shared<Router>()),
          dispatcher_(cfg.storePoolSize),
          listener_(cfg, router_)
    {
        install_handlers();
    }

    void Server::install_handlers()
    {
        router_->on_open(
            [this](Channel &ch)
            {
                if (metrics_)
                {
                    metrics_->connections_total++;
                    metrics_->connections_active++;
                }
                gateway_.attach(ch.shared_from_this());
            });

        router_->on_close(
            [this](Channel &ch)
            {
                if (metrics_)
                    metrics_->connections_active--;
                gateway_.detach(ch);
                dispatcher_.release(&ch);
            });

        router_->on_error(
            [this](Channel &ch, const boost::system::error_code &ec)
            {
                if (metrics_)
                    metrics_->errors_total++;
                logger.log(Logger::Level::DEBUG,
                           "[convsync][Server] channel {} error: {}", ch.session_id(), ec.message());
            });

        router_->on_message(
            [this](Channel &ch, std::string payload)
            {
                // store calls block; keep them off the I/O threads
                dispatcher_.post(&ch, [this, self = ch.shared_from_this(), payload = std::move(payload)]()
                                 { gateway_.handle_text(*self, payload); });
            });
    }

    void Server::start()
    {
        logger.log(Logger::Level::INFO, "[convsync][Server] start() on port {}", port());
        listener_.run();
    }

    void Server::stop()
    {
        listener_.stop_async();
        listener_.join_threads();
        dispatcher_.join();
    }

    void Server::listen_blocking()
    {
        start();
        while (!listener_.is_stop_requested())
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

} // namespace convsync
