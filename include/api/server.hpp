#pragma once

#include "api/status_controller.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace oatpp
{
    namespace network
    {
        namespace tcp
        {
            namespace server
            {
                class ConnectionProvider;
            }
        }
    }
    namespace web
    {
        namespace server
        {
            class HttpConnectionHandler;
        }
    }
}

namespace hotspot
{
    namespace core
    {
        class Logger;
    }

    namespace api
    {

        /**
         * Loopback HTTP server for the read-only status endpoints
         */
        class StatusApiServer
        {
        public:
            explicit StatusApiServer(StatusProviders providers);
            ~StatusApiServer();

            bool start(const std::string &host, uint16_t port);
            void stop();

            bool is_running() const { return m_running; }

        private:
            StatusProviders m_providers;
            std::shared_ptr<oatpp::network::tcp::server::ConnectionProvider> m_connectionProvider;
            std::shared_ptr<oatpp::web::server::HttpConnectionHandler> m_connectionHandler;
            std::thread m_workerThread;
            std::atomic<bool> m_running;
            std::shared_ptr<core::Logger> m_logger;
        };

    } // namespace api
} // namespace hotspot
