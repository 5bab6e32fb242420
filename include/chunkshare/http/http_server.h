#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "chunkshare/http/route_registration.h"
#include "chunkshare/http/router.h"

namespace chunkshare::http {

/// @brief HTTP server bootstrapper (acceptor + TLS context + expiry sweep).
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, AppServices services, Router router);
    /// @brief Bind the listener and schedule the sweep; false when the endpoint cannot be bound.
    bool Run();
    /// @brief Expire one batch of stale upload sessions.
    void RunCleanupSweep();

private:
    void StartCleanupJob();
    void ScheduleCleanupSweep();

    boost::asio::io_context& ioc_;
    AppServices services_;
    std::shared_ptr<const Router> router_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    std::unique_ptr<boost::asio::steady_timer> cleanup_timer_;
};

}  // namespace chunkshare::http
