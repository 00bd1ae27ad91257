#include <convsync/HttpApi.hpp>
#include <convsync/errors.hpp>
#include <convsync/protocol.hpp>

#include <charconv>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <boost/beast/core.hpp>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace beast = boost::beast;

    // ───────────────────────── Request target ─────────────────────────

    struct HttpApi::Target
    {
        std::vector<std::string> segments;
        std::unordered_map<std::string, std::string> query;

        [[nodiscard]] const std::string *param(const std::string &key) const
        {
            auto it = query.find(key);
            return it == query.end() ? nullptr : &it->second;
        }
    };

    namespace
    {
        int hex_value(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        std::string url_decode(std::string_view in)
        {
            std::string out;
            out.reserve(in.size());
            for (std::size_t i = 0; i < in.size(); ++i)
            {
                const char c = in[i];
                if (c == '+')
                {
                    out.push_back(' ');
                }
                else if (c == '%' && i + 2 < in.size())
                {
                    const int hi = hex_value(in[i + 1]);
                    const int lo = hex_value(in[i + 2]);
                    if (hi < 0 || lo < 0)
                    {
                        out.push_back(c);
                        continue;
                    }
                    out.push_back(static_cast<char>(hi * 16 + lo));
                    i += 2;
                }
                else
                {
                    out.push_back(c);
                }
            }
            return out;
        }

        std::vector<std::string> split(std::string_view text, char sep)
        {
            std::vector<std::string> out;
            std::size_t start = 0;
            while (start <= text.size())
            {
                const std::size_t end = text.find(sep, start);
                const std::string_view part =
                    text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
                if (!part.empty())
                    out.emplace_back(part);
                if (end == std::string_view::npos)
                    break;
                start = end + 1;
            }
            return out;
        }

        /// Non-negative integer query parameter; ValidationError when malformed.
        std::size_t size_param(const std::string *raw, std::size_t def, const char *name)
        {
            if (!raw || raw->empty())
                return def;

            long long value = 0;
            const char *first = raw->data();
            const char *last = raw->data() + raw->size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last)
                throw ValidationError(std::string{"invalid '"} + name + "' parameter");
            if (value < 0)
                throw ValidationError(std::string{"negative '"} + name + "' parameter");

            return static_cast<std::size_t>(value);
        }

        HttpApi::Response make_response(const HttpApi::Request &req,
                                        http::status status,
                                        std::string body,
                                        const char *contentType)
        {
            HttpApi::Response res{status, req.version()};
            res.set(http::field::server, "convsync");
            res.set(http::field::content_type, contentType);
            res.set(http::field::cache_control, "no-store");
            res.keep_alive(req.keep_alive());
            res.body() = std::move(body);
            res.prepare_payload();
            return res;
        }

        HttpApi::Response json_response(const HttpApi::Request &req,
                                        http::status status,
                                        const nlohmann::json &body)
        {
            return make_response(req, status,
                                 body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                                 "application/json");
        }

        HttpApi::Response error_response(const HttpApi::Request &req,
                                         http::status status,
                                         const std::string &message)
        {
            return json_response(req, status, nlohmann::json{{"error", message}});
        }

        /// Request body as a JSON object; an empty body counts as {}.
        std::optional<nlohmann::json> parse_body(const HttpApi::Request &req)
        {
            if (req.body().empty())
                return nlohmann::json::object();

            auto j = nlohmann::json::parse(req.body(), nullptr, /*allow_exceptions=*/false);
            if (j.is_discarded())
                return std::nullopt;
            return j;
        }

        std::optional<std::string> optional_string_field(const nlohmann::json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return std::nullopt;
            return it->get<std::string>();
        }

        NewMessage new_message_from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
                throw ValidationError("message must be a JSON object");

            auto role = optional_string_field(j, "role");
            if (!role)
                throw ValidationError("missing 'role'");

            auto content = optional_string_field(j, "content");
            if (!content)
                throw ValidationError("missing 'content'");

            NewMessage m;
            m.role = std::move(*role);
            m.content = std::move(*content);
            m.agent_name = optional_string_field(j, "agent_name");
            m.user_id = optional_string_field(j, "user_id");
            if (auto it = j.find("metadata"); it != j.end())
                m.metadata = detail::nlohmann_to_kvs(*it);
            return m;
        }
    } // namespace

    nlohmann::json session_to_json(const Session &s)
    {
        nlohmann::json j{
            {"session_id", s.session_id},
            {"name", s.name},
            {"user_id", nullptr},
            {"created_at", s.created_at},
            {"last_message_at", nullptr},
            {"preview", nullptr},
            {"is_active", s.is_active},
        };
        if (s.user_id)
            j["user_id"] = *s.user_id;
        if (s.last_message_at)
            j["last_message_at"] = *s.last_message_at;
        if (s.preview)
            j["preview"] = *s.preview;
        return j;
    }

    // ───────────────────────── HttpApi ─────────────────────────

    HttpApi::HttpApi(std::shared_ptr<IMessageStore> store,
                     GatewayMetrics *metrics,
                     SyncGateway *gateway)
        : store_(std::move(store)),
          metrics_(metrics),
          gateway_(gateway)
    {
        if (!store_)
            throw std::invalid_argument("HttpApi requires a message store");
    }

    HttpApi::Response HttpApi::handle(const Request &req) const
    {
        if (metrics_)
            metrics_->http_requests_total++;

        const auto rawTarget = req.target();
        const std::string_view full{rawTarget.data(), rawTarget.size()};
        const auto q = full.find('?');

        Target target;
        target.segments = split(full.substr(0, q), '/');
        for (auto &s : target.segments)
            s = url_decode(s);

        if (q != std::string_view::npos)
        {
            for (const auto &pair : split(full.substr(q + 1), '&'))
            {
                const auto eq = pair.find('=');
                if (eq == std::string::npos)
                    target.query[url_decode(pair)] = std::string{};
                else
                    target.query[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }

        try
        {
            return dispatch(req, target);
        }
        catch (const ValidationError &e)
        {
            return error_response(req, http::status::bad_request, e.what());
        }
        catch (const StorageUnavailable &e)
        {
            if (metrics_)
                metrics_->errors_total++;
            logger.log(Logger::Level::ERROR, "[convsync][HttpApi] storage unavailable: {}", e.what());
            return error_response(req, http::status::service_unavailable, "storage unavailable");
        }
        catch (const nlohmann::json::exception &e)
        {
            return error_response(req, http::status::bad_request, e.what());
        }
        catch (const std::exception &e)
        {
            if (metrics_)
                metrics_->errors_total++;
            const auto verb = req.method_string();
            logger.log(Logger::Level::ERROR, "[convsync][HttpApi] {} {} failed: {}",
                       std::string(verb.data(), verb.size()), std::string(full), e.what());
            return error_response(req, http::status::internal_server_error, "internal error");
        }
    }

    HttpApi::Response HttpApi::dispatch(const Request &req, const Target &target) const
    {
        const auto &seg = target.segments;
        const auto method = req.method();

        if (seg.size() == 1 && seg[0] == "health")
        {
            if (method != http::verb::get)
                return error_response(req, http::status::method_not_allowed, "method not allowed");
            return json_response(req, http::status::ok, nlohmann::json{{"status", "ok"}});
        }

        if (seg.size() == 1 && seg[0] == "metrics")
        {
            if (method != http::verb::get)
                return error_response(req, http::status::method_not_allowed, "method not allowed");
            GatewayMetrics empty;
            return make_response(req, http::status::ok,
                                 metrics_ ? metrics_->render_prometheus() : empty.render_prometheus(),
                                 "text/plain; version=0.0.4; charset=utf-8");
        }

        if (seg.size() >= 2 && seg[0] == "api" && seg[1] == "messages")
        {
            if (seg.size() == 3)
            {
                if (method == http::verb::post)
                    return post_message(req, seg[2]);
                if (method == http::verb::get)
                    return get_messages(req, target, seg[2]);
                return error_response(req, http::status::method_not_allowed, "method not allowed");
            }
            if (seg.size() == 4 && seg[3] == "batch")
            {
                if (method == http::verb::post)
                    return post_batch(req, seg[2]);
                return error_response(req, http::status::method_not_allowed, "method not allowed");
            }
        }

        if (seg.size() >= 2 && seg[0] == "api" && seg[1] == "sessions")
        {
            if (seg.size() == 2)
            {
                if (method == http::verb::get)
                    return get_sessions(req, target);
                return error_response(req, http::status::method_not_allowed, "method not allowed");
            }
            if (seg.size() == 3 && seg[2] == "create" && method == http::verb::post)
                return create_session(req);
            if (seg.size() == 3)
            {
                if (method == http::verb::get)
                    return get_session(req, seg[2]);
                if (method == http::verb::delete_)
                    return delete_session(req, seg[2]);
                return error_response(req, http::status::method_not_allowed, "method not allowed");
            }
            if (seg.size() == 4 && seg[3] == "rename")
            {
                if (method == http::verb::put)
                    return rename_session(req, seg[2]);
                return error_response(req, http::status::method_not_allowed, "method not allowed");
            }
            if (seg.size() == 4 && seg[3] == "reset")
            {
                if (method == http::verb::post)
                    return reset_session(req, seg[2]);
                return error_response(req, http::status::method_not_allowed, "method not allowed");
            }
        }

        return error_response(req, http::status::not_found, "not found");
    }

    // ───────────────────────── Messages ─────────────────────────

    HttpApi::Response HttpApi::post_message(const Request &req, const std::string &sid) const
    {
        auto body = parse_body(req);
        if (!body)
            return error_response(req, http::status::bad_request, "invalid JSON body");

        const std::string id = store_->append_message(sid, new_message_from_json(*body));
        publish(sid, id);

        return json_response(req, http::status::created, nlohmann::json{{"message_id", id}});
    }

    HttpApi::Response HttpApi::post_batch(const Request &req, const std::string &sid) const
    {
        auto body = parse_body(req);
        if (!body)
            return error_response(req, http::status::bad_request, "invalid JSON body");

        const nlohmann::json *items = nullptr;
        if (body->is_array())
            items = &*body;
        else if (auto it = body->find("messages"); it != body->end() && it->is_array())
            items = &*it;

        if (!items || items->empty())
            return error_response(req, http::status::bad_request, "'messages' must be a non-empty array");

        std::vector<NewMessage> batch;
        std::size_t rejected = 0;
        for (const auto &item : *items)
        {
            try
            {
                batch.push_back(new_message_from_json(item));
            }
            catch (const ValidationError &e)
            {
                ++rejected;
                logger.log(Logger::Level::WARN, "[convsync][HttpApi] batch item skipped: {}", e.what());
            }
        }

        if (batch.empty())
            return error_response(req, http::status::bad_request, "no valid message in batch");

        BatchResult result;
        try
        {
            result = store_->append_messages(sid, batch);
        }
        catch (const SyncError &e)
        {
            logger.log(Logger::Level::ERROR, "[convsync][HttpApi] batch failed for {}: {}", sid, e.what());
            return json_response(req, http::status::internal_server_error,
                                 nlohmann::json{{"error", e.what()}, {"failed", items->size()}});
        }

        for (const auto &id : result.ids)
            publish(sid, id);

        return json_response(req, http::status::created,
                             nlohmann::json{
                                 {"message_ids", result.ids},
                                 {"count", result.ids.size()},
                                 {"failed", result.failed + rejected},
                             });
    }

    HttpApi::Response HttpApi::get_messages(const Request &req,
                                            const Target &target,
                                            const std::string &sid) const
    {
        const std::size_t limit = size_param(target.param("limit"), kDefaultMessageLimit, "limit");
        const std::size_t offset = size_param(target.param("offset"), 0, "offset");

        if (!store_->get_session(sid))
            return error_response(req, http::status::not_found, "session not found");

        auto messages = store_->list_messages(sid, limit, offset);
        const std::int64_t total = store_->get_message_count(sid);
        const bool hasMore = static_cast<std::int64_t>(offset + messages.size()) < total;

        return json_response(req, http::status::ok,
                             nlohmann::json{
                                 {"messages", messages_to_json(messages)},
                                 {"total_count", total},
                                 {"has_more", hasMore},
                             });
    }

    void HttpApi::publish(const std::string &sid, const std::string &messageId) const
    {
        if (!gateway_)
            return;

        if (auto stored = store_->get_message(sid, messageId))
            gateway_->publish(*stored);
    }

    // ───────────────────────── Sessions ─────────────────────────

    HttpApi::Response HttpApi::get_sessions(const Request &req, const Target &target) const
    {
        std::optional<std::string> userId;
        if (const auto *raw = target.param("user_id"); raw && !raw->empty())
            userId = *raw;

        const std::size_t limit = size_param(target.param("limit"), kDefaultSessionLimit, "limit");
        const std::size_t offset = size_param(target.param("offset"), 0, "offset");

        nlohmann::json arr = nlohmann::json::array();
        for (const auto &s : store_->list_sessions(userId, limit, offset))
            arr.push_back(session_to_json(s));

        return json_response(req, http::status::ok, nlohmann::json{{"sessions", std::move(arr)}});
    }

    HttpApi::Response HttpApi::get_session(const Request &req, const std::string &sid) const
    {
        auto session = store_->get_session(sid);
        if (!session || !session->is_active)
            return error_response(req, http::status::not_found, "session not found");
        return json_response(req, http::status::ok, session_to_json(*session));
    }

    HttpApi::Response HttpApi::create_session(const Request &req) const
    {
        auto body = parse_body(req);
        if (!body || !body->is_object())
            return error_response(req, http::status::bad_request, "invalid JSON body");

        const std::string sid = optional_string_field(*body, "session_id").value_or(generate_uuid());
        store_->create_or_update_session(sid,
                                         optional_string_field(*body, "name"),
                                         optional_string_field(*body, "user_id"));

        auto session = store_->get_session(sid);
        if (!session)
            throw StorageUnavailable("session vanished after creation");

        logger.log(Logger::Level::INFO, "[convsync][HttpApi] session {} created", sid);
        return json_response(req, http::status::created, session_to_json(*session));
    }

    HttpApi::Response HttpApi::rename_session(const Request &req, const std::string &sid) const
    {
        auto body = parse_body(req);
        if (!body || !body->is_object())
            return error_response(req, http::status::bad_request, "invalid JSON body");

        auto name = optional_string_field(*body, "name");
        if (!name || name->empty())
            return error_response(req, http::status::bad_request, "missing 'name'");

        if (!store_->get_session(sid))
            return error_response(req, http::status::not_found, "session not found");

        store_->create_or_update_session(sid, name);
        return json_response(req, http::status::ok, session_to_json(*store_->get_session(sid)));
    }

    HttpApi::Response HttpApi::delete_session(const Request &req, const std::string &sid) const
    {
        if (!store_->soft_delete_session(sid))
            return error_response(req, http::status::not_found, "session not found");
        return json_response(req, http::status::ok, nlohmann::json{{"status", "deleted"}});
    }

    HttpApi::Response HttpApi::reset_session(const Request &req, const std::string &sid) const
    {
        if (!store_->reset_session_messages(sid))
            return error_response(req, http::status::not_found, "session not found");
        return json_response(req, http::status::ok, nlohmann::json{{"status", "reset"}});
    }

    // ───────────────────────── HttpServer ─────────────────────────

    namespace
    {
        class HttpConnection : public std::enable_shared_from_this<HttpConnection>
        {
        public:
            HttpConnection(tcp::socket socket, const HttpApi &api)
                : socket_(std::move(socket)), api_(api)
            {
            }

            void run() { do_read(); }

        private:
            void do_read()
            {
                req_ = {};
                auto self = shared_from_this();
                http::async_read(socket_, buffer_, req_,
                                 [this, self](const boost::system::error_code &ec, std::size_t)
                                 {
                                     on_read(ec);
                                 });
            }

            void on_read(const boost::system::error_code &ec)
            {
                if (ec == http::error::end_of_stream)
                {
                    shutdown();
                    return;
                }
                if (ec)
                {
                    logger.log(Logger::Level::DEBUG, "[convsync][HttpServer] read error: {}", ec.message());
                    return;
                }

                res_ = api_.handle(req_);

                auto self = shared_from_this();
                http::async_write(socket_, res_,
                                  [this, self](const boost::system::error_code &wec, std::size_t)
                                  {
                                      on_write(wec);
                                  });
            }

            void on_write(const boost::system::error_code &ec)
            {
                if (ec)
                {
                    logger.log(Logger::Level::DEBUG, "[convsync][HttpServer] write error: {}", ec.message());
                    return;
                }

                if (!res_.keep_alive())
                {
                    shutdown();
                    return;
                }
                do_read();
            }

            void shutdown()
            {
                boost::system::error_code ignore;
                socket_.shutdown(tcp::socket::shutdown_send, ignore);
            }

            tcp::socket socket_;
            const HttpApi &api_;
            beast::flat_buffer buffer_;
            HttpApi::Request req_;
            HttpApi::Response res_;
        };
    } // namespace

    HttpServer::HttpServer(net::io_context &ioc, unsigned short port, const HttpApi &api)
        : ioc_(ioc), acceptor_(ioc), api_(api)
    {
        boost::system::error_code ec;
        tcp::endpoint ep{tcp::v4(), port};

        acceptor_.open(ep.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "open");

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "reuse_address");

        acceptor_.bind(ep, ec);
        if (ec)
            throw std::system_error(ec, "bind");

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "listen");

        logger.log(Logger::Level::INFO, "[convsync][HttpServer] listening on port {} (/api, /metrics, /health)",
                   this->port());
    }

    unsigned short HttpServer::port() const
    {
        boost::system::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void HttpServer::start()
    {
        start_accept();
    }

    void HttpServer::stop()
    {
        stopRequested_ = true;
        net::post(ioc_, [this]()
                  {
                      boost::system::error_code ec;
                      acceptor_.close(ec);
                  });
    }

    void HttpServer::start_accept()
    {
        acceptor_.async_accept(
            [this](boost::system::error_code ec, tcp::socket socket)
            {
                if (!ec && !stopRequested_)
                    std::make_shared<HttpConnection>(std::move(socket), api_)->run();

                if (!stopRequested_ && acceptor_.is_open())
                    start_accept();
            });
    }

} // namespace convsync
