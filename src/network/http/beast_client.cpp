#include "beast_client.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Arachne {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

constexpr std::uint64_t MAX_BODY_BYTES = 32 * 1024 * 1024;
constexpr const char*   ACCEPT_HEADER  = "text/html,application/xhtml+xml;q=0.9,*/*;q=0.8";

std::string unbracket(const std::string& host) {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']')
        return host.substr(1, host.size() - 2);
    return host;
}

Response to_response(http::response<http::string_body>&& res, const std::string& effective_url) {
    Response response;
    response.effective_url = effective_url;
    response.status_code   = res.result_int();
    for (const auto& field : res) {
        std::string name = Arachne::Utils::Text::to_lower(std::string(field.name_string()));
        auto        it   = response.headers.find(name);
        if (it == response.headers.end())
            response.headers.emplace(std::move(name), std::string(field.value()));
        else
            it->second += ", " + std::string(field.value());
    }
    auto ct = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    response.body    = std::move(res.body());
    response.success = (response.status_code >= 200
                        && response.status_code < static_cast<long>(MaxCode::ClientError));
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    return response;
}

// Outcome of a lookup racing its deadline. The first completion wins.
struct ResolveRace {
    std::mutex                  mutex;
    bool                        settled = false;
    boost::system::error_code   ec;
    tcp::resolver::results_type results;
    std::function<void()>       waiter;

    void settle(const boost::system::error_code& error, tcp::resolver::results_type found) {
        std::function<void()> resume;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (settled)
                return;
            settled = true;
            ec      = error;
            results = std::move(found);
            resume.swap(waiter);
        }
        if (resume)
            resume();
    }
};

template <typename CompletionToken>
auto async_settled(std::shared_ptr<ResolveRace> race, CompletionToken&& token) {
    return net::async_initiate<CompletionToken, void()>(
        [race](auto handler) {
            using Handler = std::decay_t<decltype(handler)>;
            auto shared   = std::make_shared<Handler>(std::move(handler));
            auto resume   = [shared]() {
                auto executor = net::get_associated_executor(*shared);
                net::post(executor, [shared]() { (*shared)(); });
            };

            std::unique_lock<std::mutex> lock(race->mutex);
            if (race->settled) {
                lock.unlock();
                resume();
                return;
            }
            race->waiter = std::move(resume);
        },
        token);
}

Response error_response(const std::string& url, const std::string& message, ErrorType type) {
    Response response;
    response.effective_url = url;
    response.success       = false;
    response.error         = message;
    response.error_type    = type;
    response.status_code   = static_cast<long>(HTTPCode::NetworkError);
    return response;
}

}  // namespace

BeastClient::BeastClient(net::io_context& /*ioc*/)
    : user_agent_(Arachne::Core::Constants::USER_AGENT),
      connect_timeout_(Arachne::Core::Constants::CONNECT_TIMEOUT_MS),
      request_timeout_(std::chrono::seconds(Arachne::Core::Constants::REQUEST_TIMEOUT_SECONDS)) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout_ = timeout;
}

net::awaitable<Response> BeastClient::get(const std::string& url) {
    auto parsed = Arachne::Utils::Url::parse(url);
    if (parsed.host.empty() || !Arachne::Utils::Url::is_http_scheme(parsed.scheme)) {
        co_return error_response(url, "Invalid URL", ErrorType::Other);
    }

    std::string scheme = Arachne::Utils::Text::to_lower(parsed.scheme);
    bool        is_ssl = (scheme == "https");
    std::string port   = parsed.port.empty() ? Arachne::Utils::Url::default_port(scheme) : parsed.port;
    std::string host_header = parsed.host;
    if (!parsed.port.empty() && parsed.port != Arachne::Utils::Url::default_port(scheme))
        host_header += ":" + parsed.port;

    std::string target = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target += "?" + parsed.query;

    try {
        if (!is_ssl) {
            co_return co_await perform_http_request(parsed.host, port, host_header, target, url);
        }
        else {
            co_return co_await perform_https_request(parsed.host, port, host_header, target, url);
        }
    } catch (const boost::system::system_error& e) {
        bool timed_out = e.code() == beast::error::timeout || e.code() == net::error::timed_out;
        co_return error_response(url, e.what(), timed_out ? ErrorType::Timeout : ErrorType::Network);
    } catch (const std::exception& e) {
        co_return error_response(url, e.what(), ErrorType::Other);
    }
}

net::awaitable<tcp::resolver::results_type> BeastClient::resolve(const std::string& host,
                                                                const std::string& port) {
    auto executor = co_await net::this_coro::executor;
    auto race     = std::make_shared<ResolveRace>();
    auto resolver = std::make_shared<tcp::resolver>(executor);
    net::steady_timer deadline(executor);

    // Start the lookup before arming the deadline that cancels it.
    resolver->async_resolve(
        host, port, [race](const boost::system::error_code& ec, tcp::resolver::results_type found) {
            race->settle(ec, std::move(found));
        });
    deadline.expires_after(connect_timeout_);
    deadline.async_wait([race, resolver](const boost::system::error_code& ec) {
        if (ec)
            return;
        resolver->cancel();
        race->settle(net::error::timed_out, {});
    });

    co_await async_settled(race, net::use_awaitable);
    if (race->ec)
        throw boost::system::system_error(race->ec, "Resolving " + host);
    co_return race->results;
}

http::request<http::empty_body> BeastClient::build_request(const std::string& host_header,
                                                           const std::string& target) const {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host_header);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, ACCEPT_HEADER);
    req.set(http::field::connection, "close");
    return req;
}

net::awaitable<Response> BeastClient::perform_http_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& host_header,
                                                           const std::string& target,
                                                           const std::string& effective_url) {
    auto results = co_await resolve(unbracket(host), port);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(connect_timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(request_timeout_);
    auto     req = build_request(host_header, target);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                       b;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_BYTES);
    co_await http::async_read(stream, b, parser, net::use_awaitable);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return to_response(parser.release(), effective_url);
}

net::awaitable<Response> BeastClient::perform_https_request(const std::string& host,
                                                            const std::string& port,
                                                            const std::string& host_header,
                                                            const std::string& target,
                                                            const std::string& effective_url) {
    std::string server_name = unbracket(host);
    auto        results     = co_await resolve(server_name, port);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), server_name.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }
    ssl_stream.set_verify_callback(ssl::host_name_verification(server_name));

    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    beast::get_lowest_layer(ssl_stream).expires_after(request_timeout_);
    auto     req = build_request(host_header, target);
    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    beast::flat_buffer                       b;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_BYTES);
    co_await http::async_read(ssl_stream, b, parser, net::use_awaitable);

    // Servers commonly drop the connection without close_notify.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return to_response(parser.release(), effective_url);
}

}  // namespace Http
}  // namespace Network
}  // namespace Arachne
