#ifndef CONVSYNC_DISPATCHER_HPP
#define CONVSYNC_DISPATCHER_HPP

/**
 * @file dispatcher.hpp
 * @brief Worker pool that runs blocking store work off the I/O threads.
 *
 * Each channel gets its own strand on the pool: work posted for one
 * channel runs in post order, work of different channels runs in parallel.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

namespace convsync
{
    class Dispatcher
    {
    public:
        using Task = std::function<void()>;

        explicit Dispatcher(std::size_t threads);
        ~Dispatcher();

        Dispatcher(const Dispatcher &) = delete;
        Dispatcher &operator=(const Dispatcher &) = delete;

        /// Queue `task` behind the earlier tasks of `key`.
        void post(const void *key, Task task);

        /// Forget the strand of `key`; already queued tasks still run.
        void release(const void *key);

        /// Wait for every queued task, then stop the workers.
        void join();

        [[nodiscard]] std::size_t tracked() const;

    private:
        using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

        boost::asio::thread_pool pool_;
        mutable std::mutex mutex_;
        std::unordered_map<const void *, Strand> strands_;
        bool joined_ = false;
    };

} // namespace convsync

#endif // CONVSYNC_DISPATCHER_HPP
