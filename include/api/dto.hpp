#pragma once

#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/Types.hpp"

#include OATPP_CODEGEN_BEGIN(DTO)

namespace hotspot
{
    namespace api
    {

        class StatusDto : public oatpp::DTO
        {
            DTO_INIT(StatusDto, DTO)

            DTO_FIELD_INFO(status)
            {
                info->required = true;
            }
            DTO_FIELD(String, status);

            DTO_FIELD(String, state);
            DTO_FIELD(String, message);
            DTO_FIELD(Float64, timestamp);

            DTO_FIELD(Boolean, isError, "is_error");
            DTO_FIELD(String, errorCode, "error_code");
            DTO_FIELD(Int32, exitCode, "exit_code");
            DTO_FIELD(Vector<String>, reasons);
            DTO_FIELD(Vector<String>, warnings);

            DTO_FIELD(String, ssid);
            DTO_FIELD(String, interface);
            DTO_FIELD(String, internetInterface, "internet_interface");
            DTO_FIELD(Float64, startedAt, "started_at");            // null when not running
            DTO_FIELD(Float64, autoOffDeadline, "auto_off_deadline"); // null without a timer
            DTO_FIELD(Int32, pid);
        };

        class InterfaceDto : public oatpp::DTO
        {
            DTO_INIT(InterfaceDto, DTO)

            DTO_FIELD(String, name);
            DTO_FIELD(String, kind); // "wifi", "usb-wifi", "ethernet", "vpn", ...
            DTO_FIELD(String, label);
            DTO_FIELD(Boolean, up);
            DTO_FIELD(String, connectedNetwork, "connected_network");
            DTO_FIELD(Boolean, carriesInternet, "carries_internet");
            DTO_FIELD(String, driver);
            DTO_FIELD(String, bus);

            // Wireless only
            DTO_FIELD(Boolean, supportsAp, "supports_ap");
            DTO_FIELD(Boolean, supports5ghz, "supports_5ghz");
            DTO_FIELD(Boolean, rfkillBlocked, "rfkill_blocked");
            DTO_FIELD(String, concurrency);
        };

        class InterfaceListDto : public oatpp::DTO
        {
            DTO_INIT(InterfaceListDto, DTO)

            DTO_FIELD(Vector<Object<InterfaceDto>>, interfaces);
            DTO_FIELD(Int32, total);
        };

    } // namespace api
} // namespace hotspot

#include OATPP_CODEGEN_END(DTO)
