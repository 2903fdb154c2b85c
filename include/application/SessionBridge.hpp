#pragma once

#include "ports/input/ISessionBridge.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IUpstreamClient.hpp"
#include "ports/output/ISessionStore.hpp"
#include "ports/output/IRequestIdGenerator.hpp"
#include "settings/IRelaySettings.hpp"
#include "domain/JsonRpcEnvelope.hpp"
#include "utils/CookieParser.hpp"
#include "utils/UpstreamUrl.hpp"
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>

namespace relay::application {

/**
 * @brief Мост сессии Odoo
 *
 * login(): POST /web/session/authenticate, cookie из Set-Cookie
 * сохраняется в ISessionStore (последний логин побеждает).
 * call(): POST /web/dataset/call_kw с сохранённой cookie,
 * тело ответа Odoo возвращается клиенту без изменений.
 *
 * Без активной сессии call() сразу отвечает 401 и в Odoo не ходит.
 * Повторов нет: любая ошибка возвращается клиенту как RelayError.
 */
class SessionBridge : public ports::input::ISessionBridge {
public:
    static constexpr const char* kAuthenticatePath = "/web/session/authenticate";
    static constexpr const char* kCallKwPath = "/web/dataset/call_kw";
    static constexpr std::size_t kMaxDetailsLength = 512;

    SessionBridge(
        std::shared_ptr<settings::IRelaySettings> settings,
        std::shared_ptr<ports::output::IUpstreamClient> upstream,
        std::shared_ptr<ports::output::ISessionStore> sessionStore,
        std::shared_ptr<ports::output::IRequestIdGenerator> idGenerator,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : settings_(std::move(settings))
      , upstream_(std::move(upstream))
      , sessionStore_(std::move(sessionStore))
      , idGenerator_(std::move(idGenerator))
      , metrics_(std::move(metrics))
    {
        std::cout << "[SessionBridge] Created" << std::endl;
    }

    ports::input::LoginResult login(const domain::OdooConfig& config, const nlohmann::json& id) override {
        if (!config.hasCredentials()) {
            std::cerr << "[SessionBridge] Missing Odoo configuration in login request" << std::endl;
            return loginFailed(domain::RelayError::invalidInput(
                "Missing Odoo configuration (url, db, username, password)"));
        }

        std::string url;
        if (auto error = resolveUrl(config.url, url)) {
            return loginFailed(*error);
        }

        auto envelope = domain::JsonRpcEnvelope::authenticate(
            config.db, config.username, config.password, correlationId(id));

        std::cout << "[SessionBridge] Login: " << url << kAuthenticatePath
                  << " db=" << config.db << " user=" << config.username << std::endl;

        ports::output::UpstreamResponse response;
        try {
            response = upstream_->post(url, kAuthenticatePath, envelope);
        } catch (const ports::output::UpstreamError& e) {
            std::cerr << "[SessionBridge] Login endpoint error: " << e.what() << std::endl;
            return loginFailed(fromUpstreamError(
                e, "Internal Server Error during Odoo login API call", "Odoo login API error"));
        } catch (const std::exception& e) {
            std::cerr << "[SessionBridge] Login failed unexpectedly: " << e.what() << std::endl;
            return loginFailed(unexpectedFailure(e, "Internal Server Error during Odoo login API call"));
        }

        if (!response.isSuccess()) {
            std::cerr << "[SessionBridge] Login endpoint returned " << response.status << std::endl;
            return loginFailed(rejected(response, "Odoo login API error"));
        }

        const auto& json = response.json;
        if (json.is_object() && json.contains("result") && json["result"].is_object()) {
            const auto& result = json["result"];
            auto uid = result.find("uid");
            if (uid != result.end() && !uid->is_null() && *uid != false) {
                captureSession(response);
                metrics_->increment("relay_logins_total", {{"outcome", "success"}});
                std::cout << "[SessionBridge] Login successful, uid=" << uid->dump() << std::endl;
                return {true, *uid, {}};
            }
            return loginFailed(domain::RelayError::authenticationFailed("Odoo authentication failed"));
        }

        if (json.is_object() && json.contains("error")) {
            const auto& error = json["error"];
            std::string message = "Odoo authentication failed";
            if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                message = error["message"].get<std::string>();
            }
            std::cerr << "[SessionBridge] Odoo authentication error: " << message << std::endl;
            return loginFailed(domain::RelayError::authenticationFailed(message, error));
        }

        return loginFailed(domain::RelayError::upstreamMalformed("Unexpected Odoo login response"));
    }

    ports::input::CallResult call(const domain::OdooCall& call) override {
        auto token = sessionStore_->get();
        if (!token) {
            std::cerr << "[SessionBridge] No Odoo session cookie available. Client needs to log in first."
                      << std::endl;
            return callFailed(domain::RelayError::noActiveSession());
        }

        if (call.model.empty() || call.method.empty()) {
            return callFailed(domain::RelayError::invalidInput("model and method are required"));
        }
        if (!call.args.is_array()) {
            return callFailed(domain::RelayError::invalidInput("args must be an array"));
        }
        if (!call.kwargs.is_object()) {
            return callFailed(domain::RelayError::invalidInput("kwargs must be an object"));
        }

        std::string url;
        if (auto error = resolveUrl(call.url, url)) {
            return callFailed(*error);
        }

        auto envelope = domain::JsonRpcEnvelope::callKw(
            call.model, call.method, call.args, call.kwargs, correlationId(call.id));

        std::cout << "[SessionBridge] call_kw: " << call.model << "." << call.method
                  << " -> " << url << kCallKwPath << std::endl;

        ports::output::UpstreamResponse response;
        try {
            response = upstream_->post(url, kCallKwPath, envelope, {{"Cookie", *token}});
        } catch (const ports::output::UpstreamError& e) {
            std::cerr << "[SessionBridge] Odoo API endpoint error: " << e.what() << std::endl;
            return callFailed(fromUpstreamError(
                e, "Internal Server Error during Odoo API call", "Odoo API error"));
        } catch (const std::exception& e) {
            std::cerr << "[SessionBridge] Odoo API call failed unexpectedly: " << e.what() << std::endl;
            return callFailed(unexpectedFailure(e, "Internal Server Error during Odoo API call"));
        }

        if (!response.isSuccess()) {
            std::cerr << "[SessionBridge] Odoo API endpoint returned " << response.status << std::endl;
            return callFailed(rejected(response, "Odoo API error"));
        }

        metrics_->increment("relay_calls_total", {{"outcome", "success"}});
        return {true, response.body, {}};
    }

    bool hasActiveSession() const override {
        return sessionStore_->get().has_value();
    }

private:
    std::shared_ptr<settings::IRelaySettings> settings_;
    std::shared_ptr<ports::output::IUpstreamClient> upstream_;
    std::shared_ptr<ports::output::ISessionStore> sessionStore_;
    std::shared_ptr<ports::output::IRequestIdGenerator> idGenerator_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    /**
     * @brief url из запроса, иначе ODOO_URL
     * @return Ошибка, если адреса нет или он не http(s)
     */
    std::optional<domain::RelayError> resolveUrl(const std::string& requested, std::string& resolved) const {
        resolved = requested.empty() ? settings_->getDefaultOdooUrl() : requested;
        if (resolved.empty()) {
            std::cerr << "[SessionBridge] Missing Odoo URL: not in request and ODOO_URL is not set" << std::endl;
            return domain::RelayError::serverMisconfigured("Missing Odoo URL");
        }
        if (!utils::UpstreamUrl::parse(resolved)) {
            return domain::RelayError::invalidInput("Invalid Odoo URL: " + resolved);
        }
        return std::nullopt;
    }

    nlohmann::json correlationId(const nlohmann::json& id) const {
        if (id.is_null()) {
            return idGenerator_->next();
        }
        return id;
    }

    void captureSession(const ports::output::UpstreamResponse& response) {
        auto setCookies = response.getHeaderValues("Set-Cookie");
        auto token = utils::CookieParser::toCookieHeader(setCookies);
        if (token.empty()) {
            std::cerr << "[SessionBridge] WARNING: No Odoo session cookie received in login response"
                      << std::endl;
            return;
        }
        sessionStore_->set(token);
        std::cout << "[SessionBridge] Odoo session cookie captured from "
                  << setCookies.size() << " Set-Cookie header(s)" << std::endl;
    }

    domain::RelayError fromUpstreamError(
        const ports::output::UpstreamError& e,
        const std::string& unavailableMessage,
        const std::string& rejectedMessage
    ) {
        using ports::output::UpstreamErrorKind;

        if (e.kind() == UpstreamErrorKind::MALFORMED_RESPONSE) {
            if (e.status() && (*e.status() < 200 || *e.status() >= 300)) {
                metrics_->increment("relay_upstream_errors_total", {{"kind", "rejected"}});
                return domain::RelayError::upstreamRejected(
                    *e.status(), rejectedMessage, truncatedBody(e.body()));
            }
            metrics_->increment("relay_upstream_errors_total", {{"kind", "malformed"}});
            return domain::RelayError::upstreamMalformed("Malformed Odoo response", e.what());
        }

        metrics_->increment("relay_upstream_errors_total", {{"kind", ports::output::toString(e.kind())}});
        return domain::RelayError::upstreamUnavailable(unavailableMessage, e.what());
    }

    // bad_alloc, ошибки json и прочее, что пришло не как UpstreamError
    domain::RelayError unexpectedFailure(const std::exception& e, const std::string& message) {
        metrics_->increment("relay_upstream_errors_total", {{"kind", "transport"}});
        return domain::RelayError::upstreamUnavailable(message, e.what());
    }

    domain::RelayError rejected(const ports::output::UpstreamResponse& response, const std::string& message) {
        metrics_->increment("relay_upstream_errors_total", {{"kind", "rejected"}});

        nlohmann::json details = truncatedBody(response.body);
        if (response.json.is_object() && response.json.contains("error")) {
            details = response.json["error"];
        }
        return domain::RelayError::upstreamRejected(response.status, message, details);
    }

    static nlohmann::json truncatedBody(const std::string& body) {
        if (body.empty()) {
            return nullptr;
        }
        if (body.size() <= kMaxDetailsLength) {
            return body;
        }
        // не резать UTF-8 последовательность посередине
        std::size_t cut = kMaxDetailsLength;
        while (cut > 0 && (static_cast<unsigned char>(body[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        return body.substr(0, cut) + "...";
    }

    ports::input::LoginResult loginFailed(domain::RelayError error) {
        metrics_->increment("relay_logins_total", {{"outcome", "failure"}});
        return {false, nullptr, std::move(error)};
    }

    ports::input::CallResult callFailed(domain::RelayError error) {
        metrics_->increment("relay_calls_total", {{"outcome", "failure"}});
        return {false, "", std::move(error)};
    }
};

} // namespace relay::application
