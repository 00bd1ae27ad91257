#include <convsync/App.hpp>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    App::App(const std::string &configPath, const std::string &dbPath)
        : config_(configPath),
          gatewayConfig_(GatewayConfig::from_core(config_)),
          store_(std::make_shared<SqliteMessageStore>(dbPath, gatewayConfig_.storePoolSize)),
          metrics_(),
          gateway_(store_, &metrics_),
          server_(gatewayConfig_, gateway_, &metrics_),
          httpApi_(store_, &metrics_, &gateway_),
          httpIoc_(1)
    {
        if (gatewayConfig_.httpPort != 0)
            httpServer_ = std::make_unique<HttpServer>(httpIoc_, gatewayConfig_.httpPort, httpApi_);
    }

    App::~App()
    {
        stop();
    }

    void App::run_blocking()
    {
        if (httpServer_)
        {
            httpServer_->start();
            httpThread_ = std::thread(
                [this]()
                {
                    try
                    {
                        httpIoc_.run();
                    }
                    catch (const std::exception &e)
                    {
                        logger.log(Logger::Level::ERROR, "[convsync][App] HTTP thread error: {}", e.what());
                    }
                });
        }

        logger.log(Logger::Level::INFO, "[convsync][App] gateway running (ws={}, http={})",
                   gatewayConfig_.port, gatewayConfig_.httpPort);

        server_.listen_blocking();
    }

    void App::stop()
    {
        if (stopped_.exchange(true))
            return;

        logger.log(Logger::Level::INFO, "[convsync][App] stopping");

        server_.stop();

        if (httpServer_)
            httpServer_->stop();
        httpIoc_.stop();
        if (httpThread_.joinable())
            httpThread_.join();
    }

} // namespace convsync
