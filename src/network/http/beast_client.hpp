#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "http_client.hpp"

namespace Arachne {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    explicit BeastClient(boost::asio::io_context& ioc);
    ~BeastClient() override = default;

    void set_user_agent(const std::string& user_agent) override;
    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_request_timeout(std::chrono::milliseconds timeout) override;
    boost::asio::awaitable<Response> get(const std::string& url) override;

private:
    std::string               user_agent_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds request_timeout_;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    // Resolution is bounded by the connect timeout; expiry throws net::error::timed_out.
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type>
    resolve(const std::string& host, const std::string& port);

    boost::beast::http::request<boost::beast::http::empty_body>
    build_request(const std::string& host_header, const std::string& target) const;

    boost::asio::awaitable<Response> perform_http_request(const std::string& host,
                                                          const std::string& port,
                                                          const std::string& host_header,
                                                          const std::string& target,
                                                          const std::string& effective_url);
    boost::asio::awaitable<Response> perform_https_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& host_header,
                                                           const std::string& target,
                                                           const std::string& effective_url);
};

}  // namespace Http
}  // namespace Network
}  // namespace Arachne
