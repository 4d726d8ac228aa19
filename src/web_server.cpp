#include "arbiter/web_server.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace arbiter
{
    namespace
    {
        constexpr std::size_t kMaxBodyBytes = 1024 * 1024;

        template <class Body, class Allocator>
        std::string client_id(const http::request<Body, http::basic_fields<Allocator>> &req,
                              const tcp::endpoint &remote)
        {
            if (auto cid = req.find("X-Client-Id"); cid != req.end())
            {
                return std::string(cid->value());
            }
            return remote.address().to_string();
        }

        http::response<http::string_body> json_response(int status, const nlohmann::json &body, unsigned version, bool keep_alive)
        {
            http::response<http::string_body> res{static_cast<http::status>(status), version};
            res.set(http::field::server, "arbiter");
            res.set(http::field::content_type, "application/json");
            res.keep_alive(keep_alive);
            res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            res.prepare_payload();
            return res;
        }
    } // namespace

    class WebServer::Impl
    {
    public:
        Impl(const ServerConfig &cfg, ApiRouter &router)
            : cfg_(cfg),
              router_(router),
              ioc_(static_cast<int>(cfg.threads)),
              acceptor_(ioc_),
              limiter_(RateLimiter::Config{cfg.rate_limit_rps, cfg.rate_limit_burst})
        {
        }

        ~Impl()
        {
            stop();
        }

        void run()
        {
            tcp::endpoint endpoint{tcp::v4(), cfg_.port};
            beast::error_code ec;

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            net::signal_set signals(ioc_, SIGINT, SIGTERM);
            signals.async_wait([this](beast::error_code, int signal)
                               {
                spdlog::info("Received signal {}, shutting down", signal);
                stop(); });

            spdlog::info("Listening on 0.0.0.0:{} with {} threads", cfg_.port, cfg_.threads);
            do_accept();

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this]
                                     { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (ec == net::error::operation_aborted)
                return;
            if (ec)
                spdlog::warn("accept failed: {}", ec.message());
            else
                std::make_shared<Session>(std::move(socket), limiter_, router_)->run();
            do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, RateLimiter &limiter, ApiRouter &router)
                : stream_(std::move(socket)),
                  limiter_(limiter),
                  router_(router)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                parser_.emplace();
                parser_->body_limit(kMaxBodyBytes);
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, *parser_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    if (ec != beast::error::timeout)
                        spdlog::debug("read failed: {}", ec.message());
                    return;
                }

                auto req = parser_->release();
                beast::error_code endpoint_ec;
                auto remote = stream_.socket().remote_endpoint(endpoint_ec);
                auto key = endpoint_ec ? std::string(req["X-Client-Id"]) : client_id(req, remote);

                if (!limiter_.allow(key))
                {
                    res_ = json_response(429, {{"error", "rate_limited"}, {"message", "rate limit exceeded"}},
                                         req.version(), req.keep_alive());
                    return do_write();
                }

                auto api = router_.handle(std::string_view(req.method_string().data(), req.method_string().size()),
                                          std::string_view(req.target().data(), req.target().size()),
                                          req.body());
                res_ = json_response(api.status, api.body, req.version(), req.keep_alive());
                do_write();
            }

            void do_write()
            {
                http::async_write(stream_, res_,
                                  beast::bind_front_handler(&Session::on_write, shared_from_this()));
            }

            void on_write(beast::error_code ec, std::size_t)
            {
                if (ec)
                {
                    return;
                }
                if (res_.need_eof())
                    return do_close();
                do_read();
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            std::optional<http::request_parser<http::string_body>> parser_;
            http::response<http::string_body> res_;
            RateLimiter &limiter_;
            ApiRouter &router_;
        };

        ServerConfig cfg_;
        ApiRouter &router_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        RateLimiter limiter_;
    };

    WebServer::WebServer(const ServerConfig &cfg, ApiRouter &router) : impl_(std::make_unique<Impl>(cfg, router)) {}
    WebServer::~WebServer() = default;

    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }

} // namespace arbiter
