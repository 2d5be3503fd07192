#include "api/server.hpp"
#include "core/logger.hpp"

#include "oatpp/core/base/Environment.hpp"
#include "oatpp/network/tcp/server/ConnectionProvider.hpp"
#include "oatpp/parser/json/mapping/ObjectMapper.hpp"
#include "oatpp/web/server/HttpConnectionHandler.hpp"
#include "oatpp/web/server/HttpRouter.hpp"

#include <chrono>

namespace hotspot
{
    namespace api
    {

        StatusApiServer::StatusApiServer(StatusProviders providers)
            : m_providers(std::move(providers)), m_running(false), m_logger(core::get_logger("api"))
        {
        }

        StatusApiServer::~StatusApiServer()
        {
            stop();
        }

        bool StatusApiServer::start(const std::string &host, uint16_t port)
        {
            if (m_running.exchange(true))
            {
                return true;
            }

            oatpp::base::Environment::init();

            try
            {
                auto objectMapper = oatpp::parser::json::mapping::ObjectMapper::createShared();
                auto router = oatpp::web::server::HttpRouter::createShared();
                router->addController(StatusController::createShared(objectMapper, m_providers));

                m_connectionProvider = oatpp::network::tcp::server::ConnectionProvider::createShared(
                    {host.c_str(), port, oatpp::network::Address::IP_4});
                m_connectionHandler = oatpp::web::server::HttpConnectionHandler::createShared(router);
            }
            catch (const std::exception &e)
            {
                m_logger->error("Failed to start status API",
                                core::LogContext().add("host", host).add("port", port).add("error", e.what()));
                m_running = false;
                m_connectionHandler.reset();
                m_connectionProvider.reset();
                oatpp::base::Environment::destroy();
                return false;
            }

            m_workerThread = std::thread([this]() {
                while (m_running)
                {
                    auto connection = m_connectionProvider->get();
                    if (connection)
                    {
                        m_connectionHandler->handleConnection(connection, nullptr);
                    }
                    else
                    {
                        std::this_thread::sleep_for(std::chrono::milliseconds(10));
                    }
                }
            });

            m_logger->info("Status API listening",
                           core::LogContext().add("url", "http://" + host + ":" + std::to_string(port) + "/api/status"));
            return true;
        }

        void StatusApiServer::stop()
        {
            if (!m_running.exchange(false))
            {
                return;
            }

            if (m_connectionProvider)
            {
                m_connectionProvider->stop();
            }
            if (m_workerThread.joinable())
            {
                m_workerThread.join();
            }
            if (m_connectionHandler)
            {
                m_connectionHandler->stop();
            }

            m_connectionHandler.reset();
            m_connectionProvider.reset();
            oatpp::base::Environment::destroy();
            m_logger->info("Status API stopped");
        }

    } // namespace api
} // namespace hotspot
