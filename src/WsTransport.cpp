#include <convsync/WsTransport.hpp>

#include <deque>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    namespace net = boost::asio;
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    using tcp = net::ip::tcp;

    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    /// One connection attempt and, if it opens, its lifetime.
    class WsTransport::Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(net::io_context &ioc,
                   std::string host,
                   std::string port,
                   std::string target,
                   std::uint64_t epoch,
                   Sink sink)
            : resolver_(ioc),
              ws_(ioc),
              host_(std::move(host)),
              port_(std::move(port)),
              target_(std::move(target)),
              epoch_(epoch),
              sink_(std::move(sink))
        {
        }

        void run()
        {
            auto self = shared_from_this();
            resolver_.async_resolve(
                host_,
                port_,
                [self](const boost::system::error_code &ec, tcp::resolver::results_type res)
                {
                    if (ec)
                    {
                        self->fail(ec, "resolve");
                        return;
                    }
                    self->do_connect(res);
                });
        }

        void send(std::string text)
        {
            if (silenced_ || !open_)
                return;

            writeQueue_.push_back(std::move(text));
            if (!writeInProgress_)
                do_write();
        }

        /// Stop reporting events and close the socket gracefully.
        void shutdown()
        {
            if (silenced_)
                return;
            silenced_ = true;

            writeQueue_.clear();

            boost::system::error_code ignore;
            resolver_.cancel();

            if (!open_)
            {
                ws_.next_layer().close(ignore);
                return;
            }

            auto self = shared_from_this();
            ws_.async_close(
                websocket::close_code::normal,
                [self](const boost::system::error_code &ec)
                {
                    if (ec && ec != net::error::operation_aborted)
                    {
                        logger.log(Logger::Level::DEBUG,
                                   "[convsync][Transport] close error: {}", ec.message());
                    }
                });
        }

    private:
        void do_connect(const tcp::resolver::results_type &results)
        {
            if (silenced_)
                return;

            auto self = shared_from_this();
            net::async_connect(
                ws_.next_layer(),
                results,
                [self](const boost::system::error_code &ec, const tcp::endpoint &)
                {
                    if (ec)
                    {
                        self->fail(ec, "connect");
                        return;
                    }
                    self->do_handshake();
                });
        }

        void do_handshake()
        {
            if (silenced_)
                return;

            ws_.set_option(websocket::stream_base::timeout::suggested(
                beast::role_type::client));

            auto self = shared_from_this();
            ws_.async_handshake(
                host_ + ":" + port_,
                target_,
                [self](const boost::system::error_code &ec)
                {
                    if (ec)
                    {
                        self->fail(ec, "handshake");
                        return;
                    }

                    if (self->silenced_)
                        return;

                    self->open_ = true;
                    self->ws_.text(true);
                    self->emit(event::Opened{self->epoch_});
                    self->do_read();
                });
        }

        void do_read()
        {
            auto self = shared_from_this();
            ws_.async_read(
                buffer_,
                [self](const boost::system::error_code &ec, std::size_t)
                {
                    if (ec)
                    {
                        self->fail(ec, "read");
                        return;
                    }

                    auto data = beast::buffers_to_string(self->buffer_.data());
                    self->buffer_.consume(self->buffer_.size());

                    self->emit(event::Frame{self->epoch_, std::move(data)});

                    if (!self->silenced_)
                        self->do_read();
                });
        }

        void do_write()
        {
            if (silenced_ || writeQueue_.empty())
            {
                writeInProgress_ = false;
                return;
            }

            writeInProgress_ = true;

            auto frame = std::make_shared<std::string>(std::move(writeQueue_.front()));
            writeQueue_.pop_front();

            auto self = shared_from_this();
            ws_.async_write(
                net::buffer(*frame),
                [self, frame](const boost::system::error_code &ec, std::size_t)
                {
                    if (ec)
                    {
                        self->writeInProgress_ = false;
                        self->fail(ec, "write");
                        return;
                    }
                    self->do_write();
                });
        }

        void fail(const boost::system::error_code &ec, const char *stage)
        {
            if (silenced_ || closedReported_)
                return;
            closedReported_ = true;

            if (ec != websocket::error::closed && ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[convsync][Transport] {} failed (epoch {}): {}",
                           stage, epoch_, ec.message());
            }

            open_ = false;
            writeQueue_.clear();

            boost::system::error_code ignore;
            ws_.next_layer().close(ignore);

            emit(event::Closed{epoch_, std::string(stage) + ": " + ec.message()});
        }

        void emit(Event ev)
        {
            if (silenced_ || !sink_)
                return;
            sink_(std::move(ev));
        }

        tcp::resolver resolver_;
        websocket::stream<tcp::socket> ws_;
        beast::flat_buffer buffer_;

        std::string host_;
        std::string port_;
        std::string target_;
        std::uint64_t epoch_;
        Sink sink_;

        bool open_ = false;
        bool silenced_ = false;
        bool closedReported_ = false;

        std::deque<std::string> writeQueue_;
        bool writeInProgress_ = false;
    };

    // ───────────────────────── WsTransport ─────────────────────────

    WsTransport::WsTransport(net::io_context &ioc,
                             std::string host,
                             std::string port,
                             std::string sessionId,
                             Sink sink)
        : ioc_(ioc),
          host_(std::move(host)),
          port_(std::move(port)),
          target_("/ws/" + sessionId),
          sink_(std::move(sink))
    {
    }

    WsTransport::~WsTransport()
    {
        close();
    }

    void WsTransport::open(std::uint64_t epoch)
    {
        close();

        logger.log(Logger::Level::DEBUG,
                   "[convsync][Transport] opening ws://{}:{}{} (epoch {})",
                   host_, port_, target_, epoch);

        current_ = std::make_shared<Connection>(ioc_, host_, port_, target_, epoch, sink_);
        current_->run();
    }

    void WsTransport::close()
    {
        if (!current_)
            return;

        current_->shutdown();
        current_.reset();
    }

    void WsTransport::send_text(const std::string &text)
    {
        if (current_)
            current_->send(text);
    }

} // namespace convsync
