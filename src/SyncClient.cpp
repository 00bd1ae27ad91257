#include <convsync/SyncClient.hpp>
#include <convsync/errors.hpp>

#include <algorithm>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    namespace net = boost::asio;

    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr std::chrono::milliseconds kMinTickInterval{20};

        std::shared_ptr<IKeyValueStorage> open_storage(const SyncClient::Options &opt)
        {
            if (opt.cachePath.empty())
                return std::make_shared<MemoryKeyValueStorage>();

            try
            {
                return std::make_shared<SqliteKeyValueStorage>(opt.cachePath, opt.config.cacheQuotaBytes);
            }
            catch (const StorageUnavailable &e)
            {
                logger.log(Logger::Level::WARN,
                           "[convsync][Client] cache file {} unusable ({}), keeping cache in memory",
                           opt.cachePath, e.what());
                return std::make_shared<MemoryKeyValueStorage>();
            }
        }
    } // namespace

    SyncClient::SyncClient(Options options)
        : options_(std::move(options)),
          ioc_(1),
          work_(net::make_work_guard(ioc_)),
          storage_(open_storage(options_)),
          cache_(std::make_unique<LocalCache>(storage_, options_.config.cache)),
          timer_(ioc_),
          transport_(),
          manager_(),
          cacheTick_(ioc_)
    {
        if (!is_valid_session_id(options_.sessionId))
            throw ValidationError("invalid session id: '" + options_.sessionId + "'");

        transport_ = std::make_unique<WsTransport>(
            ioc_, options_.host, options_.port, options_.sessionId, WsTransport::Sink{});

        manager_ = std::make_unique<ConnectionManager>(
            options_.sessionId, *transport_, timer_, *cache_, options_.config.connection);

        transport_->set_sink([this](Event ev)
                             { manager_->handle_event(ev); });

        manager_->on_state_change([this](ConnectionState from, ConnectionState to)
                                  {
                                      state_.store(to);
                                      if (userStateFn_)
                                          userStateFn_(from, to); });
    }

    SyncClient::~SyncClient()
    {
        close();
    }

    void SyncClient::on_state_change(ConnectionManager::StateFn fn)
    {
        userStateFn_ = std::move(fn);
    }

    void SyncClient::on_update(ConnectionManager::UpdateFn fn)
    {
        manager_->on_update(std::move(fn));
    }

    void SyncClient::start()
    {
        if (closed_ || started_.exchange(true))
            return;

        logger.log(Logger::Level::INFO,
                   "[convsync][Client] session {} via ws://{}:{}",
                   options_.sessionId, options_.host, options_.port);

        net::post(ioc_, [this]()
                  {
                      manager_->connect();
                      schedule_cache_tick(); });

        thread_ = std::thread([this]()
                              {
                                  try
                                  {
                                      ioc_.run();
                                  }
                                  catch (const std::exception &e)
                                  {
                                      logger.log(Logger::Level::ERROR,
                                                 "[convsync][Client] event loop stopped: {}", e.what());
                                  } });
    }

    void SyncClient::close()
    {
        if (closed_.exchange(true))
            return;

        net::post(ioc_, [this]()
                  {
                      cacheTick_.cancel();
                      manager_->close(); });

        work_.reset();

        if (thread_.joinable())
        {
            thread_.join();
        }
        else
        {
            // never started: run the posted close inline
            ioc_.restart();
            ioc_.run();
        }

        cache_->flush();
    }

    std::future<std::string> SyncClient::send_message(std::string role,
                                                      std::string content,
                                                      std::optional<std::string> agentName)
    {
        auto promise = std::make_shared<std::promise<std::string>>();
        auto future = promise->get_future();

        if (closed_)
        {
            promise->set_exception(std::make_exception_ptr(SyncError("client is closed")));
            return future;
        }

        net::post(ioc_, [this, promise, role = std::move(role), content = std::move(content),
                         agentName = std::move(agentName)]() mutable
                  {
                      try
                      {
                          promise->set_value(manager_->send_message(role, content, std::move(agentName)));
                      }
                      catch (const SyncError &)
                      {
                          promise->set_exception(std::current_exception());
                      } });

        return future;
    }

    void SyncClient::reset_session()
    {
        net::post(ioc_, [this]()
                  { manager_->reset_session(); });
    }

    std::vector<CachedMessage> SyncClient::messages()
    {
        return cache_->read(options_.sessionId);
    }

    void SyncClient::schedule_cache_tick()
    {
        if (closed_)
            return;

        cacheTick_.expires_after(std::max(options_.config.cache.debounce, kMinTickInterval));
        cacheTick_.async_wait([this](const boost::system::error_code &ec)
                              {
                                  if (ec)
                                      return;
                                  cache_->tick();
                                  schedule_cache_tick(); });
    }

} // namespace convsync
