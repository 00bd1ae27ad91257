#include <convsync/channel.hpp>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    std::optional<std::string> session_id_from_target(std::string_view target)
    {
        constexpr std::string_view prefix = "/ws/";

        if (auto q = target.find('?'); q != std::string_view::npos)
            target = target.substr(0, q);

        if (target.size() <= prefix.size() || target.substr(0, prefix.size()) != prefix)
            return std::nullopt;

        std::string_view id = target.substr(prefix.size());
        if (!id.empty() && id.back() == '/')
            id.remove_suffix(1);

        if (!is_valid_session_id(id))
            return std::nullopt;

        return std::string{id};
    }

    Channel::Channel(tcp::socket socket,
                     const GatewayConfig &cfg,
                     std::shared_ptr<Router> router)
        : ws_(std::move(socket)),
          cfg_(cfg),
          router_(std::move(router)),
          buffer_(),
          upgrade_(),
          rejection_(),
          sessionId_(),
          idleTimer_(ws_.get_executor()),
          writeQueue_()
    {
        {
            boost::system::error_code ec;
            ws_.next_layer().set_option(tcp::no_delay(true), ec);
        }

        ws_.read_message_max(cfg_.maxMessageSize);

        if (cfg_.enablePerMessageDeflate)
        {
            ws::permessage_deflate pmd;
            pmd.server_enable = true;
            ws_.set_option(pmd);
        }
    }

    void Channel::run()
    {
        logger.log(Logger::Level::DEBUG, "[convsync][Channel] reading upgrade request");
        do_read_request();
    }

    // ───────────────────────── Handshake ─────────────────────────

    void Channel::do_read_request()
    {
        auto self = shared_from_this();

        http::async_read(
            ws_.next_layer(),
            buffer_,
            upgrade_,
            [this, self](const boost::system::error_code &ec, std::size_t)
            {
                on_request(ec);
            });
    }

    void Channel::on_request(const boost::system::error_code &ec)
    {
        if (ec)
        {
            logger.log(Logger::Level::DEBUG,
                       "[convsync][Channel] upgrade read failed: {}", ec.message());
            return;
        }

        if (!ws::is_upgrade(upgrade_))
        {
            reject_request(http::status::bad_request, "WebSocket upgrade expected\n");
            return;
        }

        const auto target = upgrade_.target();
        auto sid = session_id_from_target(std::string_view{target.data(), target.size()});
        if (sid)
            sessionId_ = std::move(*sid);

        auto self = shared_from_this();
        ws_.async_accept(
            upgrade_,
            [this, self](const boost::system::error_code &acceptEc)
            {
                on_accept(acceptEc);
            });
    }

    void Channel::reject_request(http::status status, std::string body)
    {
        rejection_.result(status);
        rejection_.version(upgrade_.version());
        rejection_.set(http::field::content_type, "text/plain; charset=utf-8");
        rejection_.set(http::field::connection, "close");
        rejection_.body() = std::move(body);
        rejection_.prepare_payload();

        auto self = shared_from_this();
        http::async_write(
            ws_.next_layer(),
            rejection_,
            [this, self](const boost::system::error_code &, std::size_t)
            {
                boost::system::error_code ignore;
                ws_.next_layer().shutdown(tcp::socket::shutdown_send, ignore);
            });
    }

    void Channel::on_accept(const boost::system::error_code &ec)
    {
        if (ec)
        {
            logger.log(Logger::Level::ERROR,
                       "[convsync][Channel] accept failed: {}", ec.message());
            if (router_)
                router_->handle_error(*this, ec);
            return;
        }

        if (sessionId_.empty())
        {
            const auto target = upgrade_.target();
            logger.log(Logger::Level::WARN,
                       "[convsync][Channel] rejected target '{}': malformed session id",
                       std::string(target.data(), target.size()));
            close(ws::close_reason(ws::close_code::policy_error, "malformed session id"));
            return;
        }

        logger.log(Logger::Level::INFO,
                   "[convsync][Channel] handshake OK for session {}", sessionId_);

        opened_ = true;
        if (router_)
            router_->handle_open(*this);

        arm_idle_timer();
        do_read();
    }

    // ───────────────────────── Read loop ─────────────────────────

    void Channel::do_read()
    {
        auto self = shared_from_this();

        ws_.async_read(
            buffer_,
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_read(ec, bytes);
            });
    }

    void Channel::on_read(const boost::system::error_code &ec, std::size_t bytes)
    {
        cancel_idle_timer();

        if (ec)
        {
            if (ec == ws::error::closed)
            {
                logger.log(Logger::Level::INFO,
                           "[convsync][Channel] {} closed by client", sessionId_);
            }
            else if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[convsync][Channel] {} read error: {}", sessionId_, ec.message());
                if (router_)
                    router_->handle_error(*this, ec);
            }

            notify_closed();
            return;
        }

        logger.log(Logger::Level::DEBUG,
                   "[convsync][Channel] {} received {} bytes", sessionId_, bytes);

        auto data = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (router_)
            router_->handle_message(*this, std::move(data));

        if (!closing_)
        {
            arm_idle_timer();
            do_read();
        }
    }

    // ───────────────────────── Idle timeout ─────────────────────────

    void Channel::arm_idle_timer()
    {
        if (cfg_.idleTimeout.count() <= 0)
            return;

        idleTimer_.expires_after(cfg_.idleTimeout);

        auto self = shared_from_this();
        idleTimer_.async_wait(
            [this, self](const boost::system::error_code &ec)
            {
                on_idle_timeout(ec);
            });
    }

    void Channel::cancel_idle_timer()
    {
        idleTimer_.cancel();
    }

    void Channel::on_idle_timeout(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted)
            return;

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[convsync][Channel] idle timer error: {}", ec.message());
            return;
        }

        logger.log(Logger::Level::WARN,
                   "[convsync][Channel] {} idle for {}s, closing", sessionId_, cfg_.idleTimeout.count());

        close(ws::close_reason(ws::close_code::going_away, "idle timeout"));
    }

    // ───────────────────────── Write queue ─────────────────────────

    void Channel::send_text(std::string_view text)
    {
        auto self = shared_from_this();
        std::string payload{text};

        net::post(
            ws_.get_executor(),
            [self, payload = std::move(payload)]() mutable
            {
                self->do_enqueue(std::move(payload));
            });
    }

    void Channel::do_enqueue(std::string payload)
    {
        if (closing_ || !opened_)
            return;

        writeQueue_.push_back(std::move(payload));

        if (!writeInProgress_)
            do_write_next();
    }

    void Channel::do_write_next()
    {
        if (closing_ || writeQueue_.empty())
        {
            writeQueue_.clear();
            writeInProgress_ = false;
            return;
        }

        writeInProgress_ = true;

        auto self = shared_from_this();
        auto frame = std::make_shared<std::string>(std::move(writeQueue_.front()));
        writeQueue_.pop_front();

        ws_.text(true);
        ws_.async_write(
            net::buffer(*frame),
            [this, self, frame](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_write_complete(ec, bytes);
            });
    }

    void Channel::on_write_complete(const boost::system::error_code &ec, std::size_t bytes)
    {
        if (ec)
        {
            if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[convsync][Channel] {} write error: {}", sessionId_, ec.message());
            }
            closing_ = true;
            writeQueue_.clear();
            writeInProgress_ = false;
            return;
        }

        logger.log(Logger::Level::DEBUG,
                   "[convsync][Channel] {} sent {} bytes", sessionId_, bytes);

        do_write_next();
    }

    // ───────────────────────── Close ─────────────────────────

    void Channel::close(ws::close_reason reason)
    {
        if (closing_)
            return;

        closing_ = true;
        cancel_idle_timer();

        auto self = shared_from_this();
        ws_.async_close(
            reason,
            [this, self](const boost::system::error_code &ec)
            {
                if (ec && ec != net::error::operation_aborted)
                {
                    logger.log(Logger::Level::WARN,
                               "[convsync][Channel] close error: {}", ec.message());
                }
                notify_closed();
            });
    }

    void Channel::notify_closed()
    {
        if (closeNotified_)
            return;
        closeNotified_ = true;

        if (opened_ && router_)
            router_->handle_close(*this);
    }

} // namespace convsync
