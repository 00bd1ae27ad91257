#include <convsync/dispatcher.hpp>

#include <algorithm>
#include <exception>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    Dispatcher::Dispatcher(std::size_t threads)
        : pool_(std::max<std::size_t>(threads, 1))
    {
    }

    Dispatcher::~Dispatcher()
    {
        join();
    }

    void Dispatcher::post(const void *key, Task task)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (joined_)
        {
            logger.log(Logger::Level::WARN, "[convsync][Dispatcher] task posted after shutdown dropped");
            return;
        }

        auto it = strands_.find(key);
        if (it == strands_.end())
            it = strands_.emplace(key, boost::asio::make_strand(pool_.get_executor())).first;

        Strand strand = it->second;
        lock.unlock();

        boost::asio::post(strand, [task = std::move(task)]()
                          {
                              try
                              {
                                  task();
                              }
                              catch (const std::exception &e)
                              {
                                  logger.log(Logger::Level::ERROR,
                                             "[convsync][Dispatcher] task failed: {}", e.what());
                              } });
    }

    void Dispatcher::release(const void *key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        strands_.erase(key);
    }

    void Dispatcher::join()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (joined_)
                return;
            joined_ = true;
            strands_.clear();
        }
        pool_.join();
    }

    std::size_t Dispatcher::tracked() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return strands_.size();
    }

} // namespace convsync
