#pragma once

#include "config.hpp"
#include "http_api.hpp"
#include "rate_limiter.hpp"
#include <memory>

namespace arbiter
{
    /**
     * HTTP/1.1 front end over Boost.Beast. Each request passes the per-client
     * rate limiter (X-Client-Id header, else the peer address) and is then
     * answered by the ApiRouter.
     */
    class WebServer
    {
    public:
        WebServer(const ServerConfig &cfg, ApiRouter &router);
        ~WebServer();

        /** Bind, listen and serve on cfg.threads threads until stop(); throws on bind failure. */
        void run();

        /** Request a stop; active connections complete gracefully. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
