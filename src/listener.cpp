#include <convsync/listener.hpp>
#include <convsync/channel.hpp>

#include <algorithm>
#include <system_error>

#include <boost/asio/strand.hpp>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    Listener::Listener(const GatewayConfig &cfg, std::shared_ptr<Router> router)
        : cfg_(cfg),
          router_(std::move(router)),
          ioContext_(std::make_shared<net::io_context>()),
          acceptor_(nullptr),
          ioThreads_(),
          stopRequested_(false)
    {
        init_acceptor(cfg_.port);

        logger.log(Logger::Level::INFO,
                   "[convsync][Listener] maxMessageSize={} idleTimeout={}s deflate={}",
                   cfg_.maxMessageSize,
                   cfg_.idleTimeout.count(),
                   cfg_.enablePerMessageDeflate);
    }

    Listener::~Listener()
    {
        if (!stopRequested_)
            stop_async();
        join_threads();
    }

    void Listener::init_acceptor(unsigned short port)
    {
        acceptor_ = std::make_unique<tcp::acceptor>(*ioContext_);
        boost::system::error_code ec;

        tcp::endpoint endpoint(tcp::v4(), port);
        acceptor_->open(endpoint.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "open acceptor");

        acceptor_->set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "reuse_address");

        acceptor_->bind(endpoint, ec);
        if (ec)
        {
            if (ec == boost::system::errc::address_in_use)
                throw std::system_error(ec, "bind: address already in use");
            throw std::system_error(ec, "bind acceptor");
        }

        acceptor_->listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "listen acceptor");

        logger.log(Logger::Level::INFO,
                   "[convsync][Listener] listening on port {} (ws://.../ws/<session_id>)", this->port());
    }

    unsigned short Listener::port() const
    {
        boost::system::error_code ec;
        auto ep = acceptor_->local_endpoint(ec);
        return ec ? cfg_.port : ep.port();
    }

    void Listener::run()
    {
        start_accept();
        start_io_threads();
    }

    void Listener::start_accept()
    {
        acceptor_->async_accept(
            net::make_strand(*ioContext_),
            [this](boost::system::error_code ec, tcp::socket socket)
            {
                if (!ec && !stopRequested_)
                {
                    auto channel = std::make_shared<Channel>(std::move(socket), cfg_, router_);
                    channel->run();
                }
                else if (ec && ec != net::error::operation_aborted)
                {
                    logger.log(Logger::Level::WARN,
                               "[convsync][Listener] accept error: {}", ec.message());
                }

                if (!stopRequested_)
                    start_accept();
            });
    }

    std::size_t Listener::compute_io_thread_count() const
    {
        if (cfg_.ioThreads > 0)
            return cfg_.ioThreads;

        const unsigned int hc = std::thread::hardware_concurrency();
        const unsigned int v = (hc != 0u) ? (hc / 2u) : 1u;
        return static_cast<std::size_t>(std::max(1u, v));
    }

    void Listener::start_io_threads()
    {
        const std::size_t n = compute_io_thread_count();
        ioThreads_.reserve(n);

        for (std::size_t i = 0; i < n; ++i)
        {
            ioThreads_.emplace_back(
                [this, i]()
                {
                    try
                    {
                        ioContext_->run();
                    }
                    catch (const std::exception &e)
                    {
                        logger.log(Logger::Level::ERROR,
                                   "[convsync][Listener] IO thread {} error: {}", i, e.what());
                    }

                    logger.log(Logger::Level::DEBUG,
                               "[convsync][Listener] IO thread {} finished", i);
                });
        }
    }

    void Listener::stop_async()
    {
        stopRequested_.store(true);

        if (acceptor_ && acceptor_->is_open())
        {
            boost::system::error_code ec;
            acceptor_->close(ec);
        }

        ioContext_->stop();
    }

    void Listener::join_threads()
    {
        for (auto &t : ioThreads_)
        {
            if (t.joinable())
                t.join();
        }
        ioThreads_.clear();
    }

} // namespace convsync
