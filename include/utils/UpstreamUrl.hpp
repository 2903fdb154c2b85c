#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace relay::utils {

/**
 * @brief Разобранный базовый адрес Odoo
 *
 * Поддерживаются только http:// и https://.
 * "https://erp.example.com/odoo/" → scheme=https, host=erp.example.com,
 * port=443, basePath=/odoo
 */
struct UpstreamUrl {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string basePath;

    bool isTls() const { return scheme == "https"; }

    /**
     * @brief Значение заголовка Host (порт только если нестандартный)
     */
    std::string hostHeader() const {
        bool defaultPort = (isTls() && port == 443) || (!isTls() && port == 80);
        return defaultPort ? host : host + ":" + std::to_string(port);
    }

    /**
     * @brief HTTP target для endpoint ("/web/session/authenticate")
     */
    std::string target(const std::string& endpoint) const {
        return basePath + endpoint;
    }

    std::string toString() const {
        return scheme + "://" + hostHeader() + basePath;
    }

    /**
     * @brief Разобрать адрес; nullopt, если он не годится для запроса к Odoo
     *
     * Пробелы и управляющие байты (<= 0x20, 0x7F) запрещены во всём адресе:
     * host и basePath попадают в стартовую строку и заголовок Host.
     */
    static std::optional<UpstreamUrl> parse(const std::string& url) {
        if (std::any_of(url.begin(), url.end(), isUnsafeByte)) {
            return std::nullopt;
        }

        auto schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos) {
            return std::nullopt;
        }

        UpstreamUrl result;
        result.scheme = url.substr(0, schemeEnd);
        std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (result.scheme != "http" && result.scheme != "https") {
            return std::nullopt;
        }

        std::string rest = url.substr(schemeEnd + 3);
        auto pathStart = rest.find_first_of("/?#");
        std::string authority = rest.substr(0, pathStart);
        std::string path = pathStart == std::string::npos ? "" : rest.substr(pathStart);

        // query и fragment в базовом адресе не нужны
        auto queryStart = path.find_first_of("?#");
        if (queryStart != std::string::npos) {
            path = path.substr(0, queryStart);
        }
        while (!path.empty() && path.back() == '/') {
            path.pop_back();
        }
        result.basePath = path;

        // userinfo и IPv6-литералы не поддерживаются
        if (authority.find_first_of("@[]") != std::string::npos) {
            return std::nullopt;
        }

        result.port = result.isTls() ? 443 : 80;
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            std::string portStr = authority.substr(colon + 1);
            authority = authority.substr(0, colon);
            if (portStr.empty() || portStr.size() > 5 ||
                !std::all_of(portStr.begin(), portStr.end(),
                             [](unsigned char c) { return std::isdigit(c); })) {
                return std::nullopt;
            }
            result.port = std::stoi(portStr);
            if (result.port <= 0 || result.port > 65535) {
                return std::nullopt;
            }
        }

        if (authority.empty()) {
            return std::nullopt;
        }
        result.host = authority;
        return result;
    }

private:
    static bool isUnsafeByte(char c) {
        auto byte = static_cast<unsigned char>(c);
        return byte <= 0x20 || byte == 0x7F;
    }
};

} // namespace relay::utils
