#include "adapters/secondary/BeastUpstreamClient.hpp"
#include "utils/AsioDrain.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <iostream>
#include <memory>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace relay::adapters::secondary {

namespace {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;
using Clock = std::chrono::steady_clock;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

/**
 * @brief Один запрос-ответ: resolve → connect → [handshake] → write → read
 *
 * Таймер tcp_stream ограничивает connect/write/read дедлайном,
 * resolve ограничивается через io_context::run_until.
 * url хранится копией: exchange может пережить вызов post().
 */
template <class Stream>
class Exchange {
public:
    static constexpr bool kIsTls = std::is_same_v<Stream, TlsStream>;

    Exchange(net::io_context& ioc, Stream& stream, utils::UpstreamUrl url,
             Request& request, Clock::time_point deadline)
        : resolver_(ioc)
        , stream_(stream)
        , url_(std::move(url))
        , request_(request)
        , deadline_(deadline)
    {
        parser_.body_limit(BeastUpstreamClient::kBodyLimit);
    }

    void start() {
        resolver_.async_resolve(
            url_.host, std::to_string(url_.port),
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                onResolve(ec, std::move(results));
            });
    }

    void cancel() {
        resolver_.cancel();
        beast::get_lowest_layer(stream_).cancel();
    }

    bool finished() const { return finished_; }
    const beast::error_code& error() const { return error_; }
    const std::string& stage() const { return stage_; }
    Response release() { return parser_.release(); }

private:
    tcp::resolver resolver_;
    Stream& stream_;
    utils::UpstreamUrl url_;
    Request& request_;
    Clock::time_point deadline_;
    beast::flat_buffer buffer_;
    http::response_parser<http::string_body> parser_;

    bool finished_ = false;
    beast::error_code error_;
    std::string stage_ = "resolve";

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail(ec, "resolve");
        }
        stage_ = "connect";
        beast::get_lowest_layer(stream_).expires_at(deadline_);
        beast::get_lowest_layer(stream_).async_connect(
            results,
            [this](beast::error_code ec, const tcp::endpoint&) { onConnect(ec); });
    }

    void onConnect(beast::error_code ec) {
        if (ec) {
            return fail(ec, "connect");
        }
        if constexpr (kIsTls) {
            stage_ = "tls handshake";
            stream_.async_handshake(
                ssl::stream_base::client,
                [this](beast::error_code ec) { onHandshake(ec); });
        } else {
            write();
        }
    }

    void onHandshake(beast::error_code ec) {
        if (ec) {
            return fail(ec, "tls handshake");
        }
        write();
    }

    void write() {
        stage_ = "write";
        http::async_write(
            stream_, request_,
            [this](beast::error_code ec, std::size_t) { onWrite(ec); });
    }

    void onWrite(beast::error_code ec) {
        if (ec) {
            return fail(ec, "write");
        }
        stage_ = "read";
        http::async_read(
            stream_, buffer_, parser_,
            [this](beast::error_code ec, std::size_t) { onRead(ec); });
    }

    void onRead(beast::error_code ec) {
        if (ec) {
            return fail(ec, "read");
        }
        finished_ = true;
    }

    void fail(beast::error_code ec, const char* stage) {
        error_ = ec;
        stage_ = stage;
        finished_ = true;
    }
};

std::string toStdString(beast::string_view value) {
    return std::string(value.data(), value.size());
}

/**
 * @brief Всё, на что ссылаются handlers одного запроса
 *
 * Живёт в shared_ptr: если отмена не успела завершиться, владение
 * уходит фоновому потоку (utils::drainOrHandOff).
 * Порядок членов важен: exchange и stream разрушаются раньше ioc.
 */
template <class Stream>
struct Connection {
    net::io_context ioc;
    std::unique_ptr<ssl::context> tls;
    std::unique_ptr<Stream> stream;
    Request request;
    std::unique_ptr<Exchange<Stream>> exchange;
};

template <class Stream>
Response runExchange(std::shared_ptr<Connection<Stream>> connection, const utils::UpstreamUrl& url,
                     std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;

    connection->exchange = std::make_unique<Exchange<Stream>>(
        connection->ioc, *connection->stream, url, connection->request, deadline);
    auto& exchange = *connection->exchange;
    exchange.start();
    connection->ioc.run_until(deadline);

    if (!exchange.finished()) {
        std::string stage = exchange.stage();
        exchange.cancel();
        // после hand-off exchange принадлежит фоновому потоку
        if (!utils::drainOrHandOff(connection, connection->ioc, BeastUpstreamClient::kCancelGrace)) {
            std::cerr << "[BeastUpstreamClient] " << url.toString() << ": " << stage
                      << " did not stop on cancel, finishing in background" << std::endl;
        }
        throw ports::output::UpstreamError(
            ports::output::UpstreamErrorKind::TIMEOUT,
            url.toString() + ": no response within " + std::to_string(timeout.count()) +
                " ms (" + stage + ")");
    }

    if (exchange.error() == beast::error::timeout) {
        throw ports::output::UpstreamError(
            ports::output::UpstreamErrorKind::TIMEOUT,
            url.toString() + ": no response within " + std::to_string(timeout.count()) +
                " ms (" + exchange.stage() + ")");
    }
    if (exchange.error()) {
        throw ports::output::UpstreamError(
            ports::output::UpstreamErrorKind::TRANSPORT,
            url.toString() + ": " + exchange.stage() + " failed: " + exchange.error().message());
    }
    return exchange.release();
}

} // namespace

BeastUpstreamClient::BeastUpstreamClient(std::shared_ptr<settings::IRelaySettings> settings)
    : settings_(std::move(settings))
{
    std::cout << "[BeastUpstreamClient] Created, timeout: "
              << settings_->getUpstreamTimeout().count() << " ms" << std::endl;
}

ports::output::UpstreamResponse BeastUpstreamClient::post(
    const std::string& baseUrl,
    const std::string& endpoint,
    const nlohmann::json& body,
    const std::map<std::string, std::string>& headers
) {
    using ports::output::UpstreamError;
    using ports::output::UpstreamErrorKind;

    auto url = utils::UpstreamUrl::parse(baseUrl);
    if (!url) {
        throw UpstreamError(UpstreamErrorKind::TRANSPORT, "Invalid Odoo URL: " + baseUrl);
    }

    Request request{http::verb::post, url->target(endpoint), 11};
    request.set(http::field::host, url->hostHeader());
    request.set(http::field::user_agent, "odoo-relay/1.0");
    request.set(http::field::content_type, "application/json");
    request.set(http::field::accept, "application/json");
    for (const auto& [name, value] : headers) {
        request.set(name, value);
    }
    request.body() = body.dump();
    request.prepare_payload();

    auto timeout = settings_->getUpstreamTimeout();
    Response response;

    try {
        if (url->isTls()) {
            auto connection = std::make_shared<Connection<TlsStream>>();
            connection->tls = std::make_unique<ssl::context>(ssl::context::tls_client);
            connection->tls->set_default_verify_paths();
            connection->tls->set_verify_mode(ssl::verify_peer);

            connection->stream = std::make_unique<TlsStream>(connection->ioc, *connection->tls);
            if (!SSL_set_tlsext_host_name(connection->stream->native_handle(), url->host.c_str())) {
                throw UpstreamError(UpstreamErrorKind::TRANSPORT,
                                    "Cannot set TLS server name for " + url->host);
            }
            connection->stream->set_verify_callback(ssl::host_name_verification(url->host));
            connection->request = std::move(request);
            response = runExchange(connection, *url, timeout);
        } else {
            auto connection = std::make_shared<Connection<beast::tcp_stream>>();
            connection->stream = std::make_unique<beast::tcp_stream>(connection->ioc);
            connection->request = std::move(request);
            response = runExchange(connection, *url, timeout);
        }
    } catch (const boost::system::system_error& e) {
        throw UpstreamError(UpstreamErrorKind::TRANSPORT,
                            url->toString() + ": " + e.what());
    }

    ports::output::UpstreamResponse result;
    result.status = static_cast<int>(response.result_int());
    result.body = std::move(response.body());
    for (const auto& field : response) {
        result.headers.emplace_back(toStdString(field.name_string()), toStdString(field.value()));
    }

    std::cout << "[BeastUpstreamClient] POST " << url->toString() << endpoint
              << " -> " << result.status << std::endl;

    try {
        result.json = nlohmann::json::parse(result.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw UpstreamError(UpstreamErrorKind::MALFORMED_RESPONSE,
                            "Odoo returned a non-JSON body (HTTP " + std::to_string(result.status) +
                                "): " + e.what(),
                            result.status, result.body);
    }

    return result;
}

} // namespace relay::adapters::secondary
