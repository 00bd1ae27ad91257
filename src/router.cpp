#include <convsync/router.hpp>
#include <convsync/channel.hpp>

namespace convsync
{
    void Router::handle_open(Channel &channel) const
    {
        if (openHandler_)
            openHandler_(channel);
    }

    void Router::handle_close(Channel &channel) const
    {
        if (closeHandler_)
            closeHandler_(channel);
    }

    void Router::handle_error(Channel &channel, const boost::system::error_code &ec) const
    {
        if (errorHandler_)
            errorHandler_(channel, ec);
    }

    void Router::handle_message(Channel &channel, std::string payload) const
    {
        if (messageHandler_)
            messageHandler_(channel, std::move(payload));
    }

} // namespace convsync
