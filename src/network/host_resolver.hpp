#pragma once

#include "core/status.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <string>
#include <thread>

namespace sentindex::network {

/// Host name lookup that a caller can abandon
/// A stalled lookup must never hold up the caller's own io_context
class HostResolver {
public:
    using Endpoints = boost::asio::ip::tcp::resolver::results_type;

    /// May run on another thread, or never if the lookup stalls
    using Handler = std::function<void(Result<Endpoints, std::string>)>;

    virtual ~HostResolver() = default;

    virtual void resolve(const std::string& host, const std::string& port, Handler handler) = 0;
};

/// Resolves on a long-lived io_context driven by its own thread
/// Destruction waits for a lookup still in flight
class ThreadedHostResolver final : public HostResolver {
public:
    ThreadedHostResolver();
    ~ThreadedHostResolver() override;

    ThreadedHostResolver(const ThreadedHostResolver&) = delete;
    ThreadedHostResolver& operator=(const ThreadedHostResolver&) = delete;

    void resolve(const std::string& host, const std::string& port, Handler handler) override;

private:
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;
};

}  // namespace sentindex::network
