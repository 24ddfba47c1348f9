#pragma once

#include "core/status.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sentindex::network {

/// One async HTTPS POST with a deadline, to endpoints resolved by the caller
/// The handler is invoked exactly once: with the 2xx body, or with an error
class RestClient : public std::enable_shared_from_this<RestClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using ssl_stream = boost::asio::ssl::stream<tcp::socket>;

    /// Response handler callback
    using ResponseHandler = std::function<void(Result<std::string, std::string>)>;

    /// Request description
    struct Request {
        std::string host;
        std::string port;
        std::string path;
        std::string body;
        std::string bearer_token;   // Sent as Authorization header when not empty
    };

    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared SSL context
    RestClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx
    );

    ~RestClient();

    // Non-copyable, non-movable
    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    /// Start an async JSON POST
    /// @param request Target and body; host is used for SNI and the Host header
    /// @param endpoints Addresses of request.host, tried in order
    /// @param timeout Deadline for the exchange (connect to last byte)
    /// @param handler Callback with response body or error
    void post(
        Request request,
        const tcp::resolver::results_type& endpoints,
        std::chrono::milliseconds timeout,
        ResponseHandler handler
    );

    /// Abort the exchange; the handler receives "cancelled" if still pending
    /// After completion only closes the socket
    void cancel();

    [[nodiscard]] bool completed() const noexcept { return completed_; }

private:
    void do_connect(const tcp::resolver::results_type& endpoints);
    void on_connect(boost::system::error_code ec);
    void on_ssl_handshake(boost::system::error_code ec);
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void on_deadline(boost::system::error_code ec);
    void do_shutdown();
    void fail(const std::string& what, boost::system::error_code ec);
    void finish(Result<std::string, std::string> result);
    void close_socket();

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    boost::asio::steady_timer deadline_;
    std::unique_ptr<ssl_stream> stream_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> req_;
    boost::beast::http::response<boost::beast::http::string_body> res_;

    Request request_;
    ResponseHandler handler_;
    bool completed_{false};
};

}  // namespace sentindex::network
