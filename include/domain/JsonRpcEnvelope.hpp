#pragma once

#include <nlohmann/json.hpp>

namespace relay::domain {

/**
 * @brief JSON-RPC конверт, который понимает Odoo
 *
 * { "jsonrpc": "2.0", "method": "call", "params": {...}, "id": ... }
 */
struct JsonRpcEnvelope {
    static constexpr const char* kVersion = "2.0";
    static constexpr const char* kMethod = "call";

    static nlohmann::json make(const nlohmann::json& params, const nlohmann::json& id) {
        return {
            {"jsonrpc", kVersion},
            {"method", kMethod},
            {"params", params},
            {"id", id}
        };
    }

    static nlohmann::json authenticate(
        const std::string& db,
        const std::string& login,
        const std::string& password,
        const nlohmann::json& id
    ) {
        return make({{"db", db}, {"login", login}, {"password", password}}, id);
    }

    static nlohmann::json callKw(
        const std::string& model,
        const std::string& method,
        const nlohmann::json& args,
        const nlohmann::json& kwargs,
        const nlohmann::json& id
    ) {
        return make({
            {"model", model},
            {"method", method},
            {"args", args},
            {"kwargs", kwargs}
        }, id);
    }
};

} // namespace relay::domain
