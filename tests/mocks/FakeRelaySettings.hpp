#pragma once

#include "settings/IRelaySettings.hpp"

namespace relay::tests {

/**
 * @brief IRelaySettings без ENV, поля меняются прямо в тесте
 */
class FakeRelaySettings : public settings::IRelaySettings {
public:
    std::string apiKey = "test-key";
    std::string defaultOdooUrl;
    std::vector<std::string> allowedOrigins = {"https://imitrr.github.io"};
    std::chrono::milliseconds upstreamTimeout{10000};

    std::string getApiKey() const override { return apiKey; }
    std::string getDefaultOdooUrl() const override { return defaultOdooUrl; }
    std::vector<std::string> getAllowedOrigins() const override { return allowedOrigins; }
    std::chrono::milliseconds getUpstreamTimeout() const override { return upstreamTimeout; }
};

} // namespace relay::tests
