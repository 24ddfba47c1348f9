#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>

namespace sentindex::network {

/// Create a shared TLS client context with peer verification
/// @param ca_file Optional PEM bundle used instead of the system store
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_ssl_context(
    const std::string& ca_file = ""
);

}  // namespace sentindex::network
