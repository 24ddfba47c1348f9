#include "network/rest_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

// Helper to set SNI hostname without old-style cast warning
namespace {
inline bool set_sni_hostname(SSL* ssl, const char* hostname) {
    // SSL_set_tlsext_host_name is a macro with old-style cast
    return SSL_ctrl(ssl, SSL_CTRL_SET_TLSEXT_HOSTNAME,
                    TLSEXT_NAMETYPE_host_name,
                    const_cast<char*>(hostname)) != 0;
}
}  // namespace

namespace sentindex::network {

namespace http = boost::beast::http;

RestClient::RestClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , deadline_(ioc)
{}

RestClient::~RestClient() {
    close_socket();
}

void RestClient::post(
    Request request,
    const tcp::resolver::results_type& endpoints,
    std::chrono::milliseconds timeout,
    ResponseHandler handler
) {
    request_ = std::move(request);
    handler_ = std::move(handler);
    completed_ = false;

    spdlog::debug("REST POST https://{}:{}{} ({} bytes, timeout {}ms)",
                  request_.host, request_.port, request_.path,
                  request_.body.size(), timeout.count());

    deadline_.expires_after(timeout);
    deadline_.async_wait(
        [self = shared_from_this()](boost::system::error_code ec) {
            self->on_deadline(ec);
        }
    );

    do_connect(endpoints);
}

void RestClient::cancel() {
    if (completed_) {
        // Abort a pending TLS shutdown
        close_socket();
        return;
    }
    finish(Result<std::string, std::string>::Err("cancelled"));
}

void RestClient::do_connect(const tcp::resolver::results_type& endpoints) {
    stream_ = std::make_unique<ssl_stream>(ioc_, *ssl_ctx_);

    if (!set_sni_hostname(stream_->native_handle(), request_.host.c_str())) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail("ssl_sni", ssl_ec);
    }

    // Try every resolved endpoint in turn
    boost::asio::async_connect(
        stream_->next_layer(),
        endpoints,
        [self = shared_from_this()](auto ec, const auto& /*endpoint*/) {
            self->on_connect(ec);
        }
    );
}

void RestClient::on_connect(boost::system::error_code ec) {
    if (completed_) {
        return;
    }
    if (ec) {
        return fail("connect", ec);
    }

    stream_->async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void RestClient::on_ssl_handshake(boost::system::error_code ec) {
    if (completed_) {
        return;
    }
    if (ec) {
        return fail("ssl_handshake", ec);
    }

    req_.method(http::verb::post);
    req_.target(request_.path);
    req_.version(11);
    req_.set(http::field::host, request_.host);
    req_.set(http::field::user_agent, "sentindex/1.0");
    req_.set(http::field::accept, "application/json");
    req_.set(http::field::content_type, "application/json");
    if (!request_.bearer_token.empty()) {
        req_.set(http::field::authorization, "Bearer " + request_.bearer_token);
    }
    req_.body() = request_.body;
    req_.prepare_payload();

    http::async_write(
        *stream_,
        req_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void RestClient::on_write(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (completed_) {
        return;
    }
    if (ec) {
        return fail("write", ec);
    }

    http::async_read(
        *stream_,
        buffer_,
        res_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void RestClient::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (completed_) {
        return;
    }
    if (ec) {
        return fail("read", ec);
    }

    // Any 2xx is a success
    if (http::to_status_class(res_.result()) != http::status_class::successful) {
        std::string error = "HTTP " + std::to_string(res_.result_int()) +
                           ": " + std::string(res_.reason());
        spdlog::warn("REST request failed: {}", error);
        finish(Result<std::string, std::string>::Err(std::move(error)));
        return;
    }

    spdlog::debug("REST response: {} bytes", res_.body().size());
    deadline_.cancel();
    completed_ = true;
    if (handler_) {
        auto handler = std::move(handler_);
        handler(Result<std::string, std::string>::Ok(std::move(res_.body())));
    }

    do_shutdown();
}

void RestClient::on_deadline(boost::system::error_code ec) {
    // Timer cancelled because the exchange finished first
    if (ec == boost::asio::error::operation_aborted || completed_) {
        return;
    }
    spdlog::warn("REST request to {} timed out", request_.host);
    finish(Result<std::string, std::string>::Err("timeout"));
}

void RestClient::do_shutdown() {
    if (!stream_) {
        return;
    }
    stream_->async_shutdown(
        [self = shared_from_this()](boost::system::error_code ec) {
            // SSL shutdown errors are common and can be ignored
            if (ec && ec != boost::asio::error::eof &&
                ec != boost::asio::ssl::error::stream_truncated) {
                spdlog::debug("SSL shutdown: {}", ec.message());
            }
            self->close_socket();
        }
    );
}

void RestClient::fail(const std::string& what, boost::system::error_code ec) {
    spdlog::error("REST {} error: {}", what, ec.message());
    finish(Result<std::string, std::string>::Err(what + ": " + ec.message()));
}

void RestClient::finish(Result<std::string, std::string> result) {
    if (completed_) {
        return;
    }
    completed_ = true;
    deadline_.cancel();
    close_socket();

    if (handler_) {
        auto handler = std::move(handler_);
        handler(std::move(result));
    }
}

void RestClient::close_socket() {
    if (stream_) {
        boost::system::error_code ec;
        stream_->lowest_layer().close(ec);
    }
}

}  // namespace sentindex::network
