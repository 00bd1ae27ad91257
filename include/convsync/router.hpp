#ifndef CONVSYNC_ROUTER_HPP
#define CONVSYNC_ROUTER_HPP

#include <functional>
#include <string>
#include <boost/system/error_code.hpp>

namespace convsync
{
    class Channel;

    /// Callbacks a Channel reports its lifecycle and inbound frames to.
    class Router
    {
    public:
        using OpenHandler = std::function<void(Channel &)>;
        using CloseHandler = std::function<void(Channel &)>;
        using ErrorHandler = std::function<void(Channel &, const boost::system::error_code &)>;
        using MessageHandler = std::function<void(Channel &, std::string)>;

        Router() = default;

        void on_open(OpenHandler cb) { openHandler_ = std::move(cb); }
        void on_close(CloseHandler cb) { closeHandler_ = std::move(cb); }
        void on_error(ErrorHandler cb) { errorHandler_ = std::move(cb); }
        void on_message(MessageHandler cb) { messageHandler_ = std::move(cb); }

        void handle_open(Channel &channel) const;
        void handle_close(Channel &channel) const;
        void handle_error(Channel &channel, const boost::system::error_code &ec) const;
        void handle_message(Channel &channel, std::string payload) const;

    private:
        OpenHandler openHandler_{};
        CloseHandler closeHandler_{};
        ErrorHandler errorHandler_{};
        MessageHandler messageHandler_{};
    };

} // namespace convsync

#endif // CONVSYNC_ROUTER_HPP
