#include "network/host_resolver.hpp"
#include <memory>
#include <spdlog/spdlog.h>

namespace sentindex::network {

ThreadedHostResolver::ThreadedHostResolver()
    : work_(boost::asio::make_work_guard(ioc_))
    , thread_([this]() { ioc_.run(); })
{}

ThreadedHostResolver::~ThreadedHostResolver() {
    work_.reset();
    ioc_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ThreadedHostResolver::resolve(const std::string& host, const std::string& port, Handler handler) {
    auto resolver = std::make_shared<boost::asio::ip::tcp::resolver>(ioc_);
    resolver->async_resolve(
        host,
        port,
        [resolver, host, handler = std::move(handler)](
            boost::system::error_code ec, Endpoints results) {
            if (ec) {
                spdlog::error("REST resolve error for {}: {}", host, ec.message());
                handler(Result<Endpoints, std::string>::Err("resolve: " + ec.message()));
                return;
            }
            handler(Result<Endpoints, std::string>::Ok(std::move(results)));
        }
    );
}

}  // namespace sentindex::network
