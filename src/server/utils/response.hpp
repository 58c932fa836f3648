/*
 * response.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BEACON_SERVER_UTILS_RESPONSE_HPP
#define BEACON_SERVER_UTILS_RESPONSE_HPP

#include <crow.h>
#include <string>

#include <nlohmann/json.hpp>

namespace beacon::server::utils {

/**
 * @brief JSON response helpers shared by every route
 */
class ResponseBuilder {
public:
    /**
     * @brief @p body as-is, for routes whose payload is the whole document
     */
    static crow::response json(const nlohmann::json& body, int code = 200) {
        return makeJsonResponse(body, code);
    }

    static crow::response success(const nlohmann::json& data, int code = 200) {
        nlohmann::json body = {
            {"status", "success"},
            {"data", data}
        };
        return makeJsonResponse(body, code);
    }

    static crow::response successWithMessage(const std::string& message,
                                             const nlohmann::json& data = nullptr,
                                             int code = 200) {
        nlohmann::json body = {
            {"status", "success"},
            {"message", message}
        };
        if (!data.is_null()) {
            body["data"] = data;
        }
        return makeJsonResponse(body, code);
    }

    static crow::response error(const std::string& code,
                               const std::string& message,
                               int httpCode = 400,
                               const nlohmann::json& details = nullptr) {
        nlohmann::json errorObj = {
            {"code", code},
            {"message", message}
        };
        if (!details.is_null()) {
            errorObj["details"] = details;
        }

        nlohmann::json body = {
            {"status", "error"},
            {"error", errorObj}
        };
        return makeJsonResponse(body, httpCode);
    }

    static crow::response deviceNotFound(const std::string& mac) {
        return error("device_not_found",
                    "No cached device with address '" + mac + "'.",
                    404,
                    {{"mac", mac}});
    }

    static crow::response missingField(const std::string& fieldName) {
        return error("missing_required_field",
                    "Required field '" + fieldName + "' is missing.",
                    400,
                    {{"field", fieldName}});
    }

    static crow::response invalidFieldValue(const std::string& fieldName,
                                           const std::string& constraint = "") {
        nlohmann::json details = {{"field", fieldName}};
        if (!constraint.empty()) {
            details["constraint"] = constraint;
        }
        return error("invalid_field_value",
                    "Field '" + fieldName + "' has an invalid value.",
                    400,
                    details);
    }

    static crow::response validationFailed(const std::string& message) {
        return error("validation_failed", message, 400);
    }

    static crow::response invalidJson(const std::string& parseError) {
        return error("invalid_json",
                    "The request body is not valid JSON: " + parseError,
                    400);
    }

private:
    static crow::response makeJsonResponse(const nlohmann::json& body, int code) {
        crow::response res(code);
        res.set_header("Content-Type", "application/json");
        res.write(body.dump());
        return res;
    }
};

}  // namespace beacon::server::utils

#endif  // BEACON_SERVER_UTILS_RESPONSE_HPP
