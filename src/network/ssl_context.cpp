#include "network/ssl_context.hpp"
#include <spdlog/spdlog.h>

namespace sentindex::network {

std::shared_ptr<boost::asio::ssl::context> create_ssl_context(const std::string& ca_file) {
    auto ctx = std::make_shared<boost::asio::ssl::context>(
        boost::asio::ssl::context::tlsv12_client
    );

    if (ca_file.empty()) {
        ctx->set_default_verify_paths();
    } else {
        boost::system::error_code ec;
        ctx->load_verify_file(ca_file, ec);
        if (ec) {
            spdlog::warn("Cannot load CA bundle '{}': {}, using system store", ca_file, ec.message());
            ctx->set_default_verify_paths();
        }
    }

    ctx->set_verify_mode(boost::asio::ssl::verify_peer);

    ctx->set_options(
        boost::asio::ssl::context::default_workarounds |
        boost::asio::ssl::context::no_sslv2 |
        boost::asio::ssl::context::no_sslv3 |
        boost::asio::ssl::context::single_dh_use
    );

    return ctx;
}

}  // namespace sentindex::network
