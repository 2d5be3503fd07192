#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/macro/component.hpp"
#include "api/dto.hpp"
#include "infrastructure/capability_prober.hpp"
#include "infrastructure/interface_inventory.hpp"
#include "services/status_publisher.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hotspot
{
    namespace api
    {

        /**
         * Read-only views of the backend state served over HTTP
         */
        struct StatusProviders
        {
            std::function<services::StatusRecord()> status;
            std::function<std::vector<infrastructure::NetworkInterface>()> interfaces;
            std::function<std::map<std::string, infrastructure::CapabilitySet>()> capabilities;
        };

    } // namespace api
} // namespace hotspot

#include OATPP_CODEGEN_BEGIN(ApiController)

namespace hotspot
{
    namespace api
    {

        /**
         * Status Controller
         * GET /api/status and GET /api/interfaces
         */
        class StatusController : public oatpp::web::server::api::ApiController
        {
        private:
            StatusProviders m_providers;

            template <class T>
            std::shared_ptr<OutgoingResponse> createDtoResponseWithHeaders(const Status &status, const T &dto)
            {
                auto response = createDtoResponse(status, dto);
                response->putHeader("Cache-Control", "no-store");
                response->putHeader("Connection", "close");
                return response;
            }

            static oatpp::Vector<oatpp::String> toVector(const std::vector<std::string> &items)
            {
                auto result = oatpp::Vector<oatpp::String>::createShared();
                for (const auto &item : items)
                {
                    result->push_back(item.c_str());
                }
                return result;
            }

        public:
            StatusController(const std::shared_ptr<ObjectMapper> &objectMapper, StatusProviders providers)
                : oatpp::web::server::api::ApiController(objectMapper), m_providers(std::move(providers))
            {
            }

            static std::shared_ptr<StatusController> createShared(const std::shared_ptr<ObjectMapper> &objectMapper,
                                                                  StatusProviders providers)
            {
                return std::make_shared<StatusController>(objectMapper, std::move(providers));
            }

            ENDPOINT_INFO(getStatus)
            {
                info->summary = "Get hotspot status";
                info->description = "Returns the latest published status record";
                info->addResponse<Object<StatusDto>>(Status::CODE_200, "application/json");
                info->addTag("Status");
            }
            ENDPOINT("GET", "/api/status", getStatus)
            {
                auto dto = StatusDto::createShared();
                if (!m_providers.status)
                {
                    dto->status = "idle";
                    return createDtoResponseWithHeaders(Status::CODE_200, dto);
                }

                auto record = m_providers.status();
                dto->status = record.status.empty() ? "idle" : record.status.c_str();
                dto->state = record.state.c_str();
                dto->message = record.message.c_str();
                dto->timestamp = record.timestamp;
                dto->isError = record.is_error;
                dto->errorCode = record.error_code.c_str();
                dto->exitCode = record.exit_code;
                dto->reasons = toVector(record.reasons);
                dto->warnings = toVector(record.warnings);
                dto->ssid = record.ssid.c_str();
                dto->interface = record.interface.c_str();
                dto->internetInterface = record.internet_interface.c_str();
                if (record.started_at)
                {
                    dto->startedAt = *record.started_at;
                }
                if (record.auto_off_deadline)
                {
                    dto->autoOffDeadline = *record.auto_off_deadline;
                }
                dto->pid = record.pid;

                return createDtoResponseWithHeaders(Status::CODE_200, dto);
            }

            ENDPOINT_INFO(getInterfaces)
            {
                info->summary = "List network interfaces";
                info->description = "Returns the last inventory snapshot with capability labels";
                info->addResponse<Object<InterfaceListDto>>(Status::CODE_200, "application/json");
                info->addTag("Status");
            }
            ENDPOINT("GET", "/api/interfaces", getInterfaces)
            {
                auto dto = InterfaceListDto::createShared();
                dto->interfaces = oatpp::Vector<oatpp::Object<InterfaceDto>>::createShared();

                std::vector<infrastructure::NetworkInterface> inventory;
                std::map<std::string, infrastructure::CapabilitySet> capabilities;
                if (m_providers.interfaces)
                {
                    inventory = m_providers.interfaces();
                }
                if (m_providers.capabilities)
                {
                    capabilities = m_providers.capabilities();
                }

                for (const auto &iface : inventory)
                {
                    auto item = InterfaceDto::createShared();
                    item->name = iface.name.c_str();
                    item->kind = infrastructure::to_string(iface.kind);
                    item->label = iface.label.c_str();
                    item->up = iface.admin_up;
                    if (iface.connected_network)
                    {
                        item->connectedNetwork = iface.connected_network->c_str();
                    }
                    item->carriesInternet = iface.carries_internet;
                    item->driver = iface.driver.c_str();
                    item->bus = iface.bus.c_str();

                    auto caps = capabilities.find(iface.name);
                    if (caps != capabilities.end() && caps->second.reachable)
                    {
                        item->supportsAp = caps->second.supports_ap;
                        item->supports5ghz = caps->second.supports_5ghz;
                        item->rfkillBlocked = caps->second.rfkill.blocked();
                        item->concurrency = infrastructure::concurrency_label(caps->second).c_str();
                    }
                    dto->interfaces->push_back(item);
                }
                dto->total = static_cast<v_int32>(dto->interfaces->size());

                return createDtoResponseWithHeaders(Status::CODE_200, dto);
            }
        };

    } // namespace api
} // namespace hotspot

#include OATPP_CODEGEN_END(ApiController)
