/**
 * @file voice_server.cpp
 * @brief Accept loop and connection bookkeeping
 */

#include "server/voice_server.h"
#include "logger.h"
#include "server/connection.h"
#include "session/session_registry.h"
#include "vad/energy_vad.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <condition_variable>
#include <list>
#include <mutex>
#include <thread>
#include <sys/socket.h>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace samaira {
namespace server {

namespace {

session::SessionRegistryConfig registry_config(const Config& config) {
    session::SessionRegistryConfig c;
    c.max_sessions = static_cast<size_t>(config.server.max_sessions);
    c.retention_minutes = config.server.session_retention_minutes;
    c.memory.max_messages = config.memory.max_messages;
    c.memory.max_tokens = config.memory.max_tokens;
    c.memory.system_prompt = config.llm.system_prompt;
    return c;
}

struct Worker {
    std::shared_ptr<Connection> connection;
    std::thread thread;
};

} // anonymous namespace

class VoiceServer::Impl {
public:
    Impl(const Config& config, session::Engines engines)
        : config_(config)
        , registry_(registry_config(config))
        , context_{config_, registry_, engines, nullptr}
        , acceptor_(ioc_)
        , stopping_(false)
    {
        vad::EnergyVADConfig vad_config = vad::EnergyVADConfig::from(config_);
        context_.make_vad = [vad_config]() -> std::unique_ptr<vad::IVAD> {
            return std::make_unique<vad::EnergyVAD>(vad_config);
        };
    }

    ~Impl() {
        stop();
        shutdown_connections();
        stop_sweeper();
    }

    Result<void> start() {
        boost::system::error_code ec;
        auto address = net::ip::make_address(config_.server.host, ec);
        if (ec) {
            return make_config_error("Invalid server.host '" + config_.server.host + "': " + ec.message());
        }
        tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.server.port));

        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (!ec) acceptor_.bind(endpoint, ec);
        if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            return make_error(ErrorType::TransportClosed, "Cannot listen on " + config_.server.host +
                              ":" + std::to_string(config_.server.port) + ": " + ec.message());
        }

        LOG_NET("Listening on ws://" + config_.server.host + ":" + std::to_string(port()) +
                config_.server.path);
        sweeper_ = std::thread([this] { sweep_loop(); });
        return {};
    }

    void run() {
        while (!stopping_.load()) {
            tcp::socket socket(ioc_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (stopping_.load()) break;
            if (ec) {
                Logger::warn("[Net] Accept failed: " + ec.message());
                std::this_thread::sleep_for(std::chrono::milliseconds(constants::turn::POLL_INTERVAL_MS));
                continue;
            }

            reap_finished();

            auto connection = std::make_shared<Connection>(std::move(socket), context_);
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.push_back(Worker{connection, std::thread([connection] { connection->run(); })});
        }

        LOG_NET("Server stopping");
        shutdown_connections();
        stop_sweeper();
    }

    void stop() {
        stopping_.store(true);
        if (acceptor_.is_open()) {
            ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
        }
    }

    uint16_t port() const {
        boost::system::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    size_t active_connections() const {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        size_t count = 0;
        for (const auto& w : workers_) {
            if (!w.connection->finished()) count++;
        }
        return count;
    }

private:
    void reap_finished() {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->connection->finished()) {
                if (it->thread.joinable()) it->thread.join();
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    /// Close every socket; each connection cancels its turn and detaches
    void shutdown_connections() {
        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers.swap(workers_);
        }
        for (auto& w : workers) {
            w.connection->close();
        }
        for (auto& w : workers) {
            if (w.thread.joinable()) w.thread.join();
        }
        if (!workers.empty()) {
            LOG_NET("Closed " + std::to_string(workers.size()) + " connection(s)");
        }
    }

    void sweep_loop() {
        std::unique_lock<std::mutex> lock(sweep_mutex_);
        while (!sweep_stop_) {
            sweep_cv_.wait_for(lock, std::chrono::milliseconds(constants::server::SWEEP_INTERVAL_MS),
                               [this] { return sweep_stop_; });
            if (sweep_stop_) break;
            lock.unlock();
            size_t removed = registry_.cleanup_expired();
            if (removed > 0) {
                LOG_SESSION("Retention sweep removed " + std::to_string(removed) + " session(s)");
            }
            // Quiet servers see no accepts, so join finished workers here too
            reap_finished();
            lock.lock();
        }
    }

    void stop_sweeper() {
        {
            std::lock_guard<std::mutex> lock(sweep_mutex_);
            sweep_stop_ = true;
        }
        sweep_cv_.notify_all();
        if (sweeper_.joinable()) sweeper_.join();
    }

    Config config_;
    session::SessionRegistry registry_;
    ServerContext context_;

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::atomic<bool> stopping_;

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool sweep_stop_ = false;
    std::thread sweeper_;
};

VoiceServer::VoiceServer(const Config& config, session::Engines engines)
    : impl_(std::make_unique<Impl>(config, engines)) {}

VoiceServer::~VoiceServer() = default;

Result<void> VoiceServer::start() {
    return impl_->start();
}

void VoiceServer::run() {
    impl_->run();
}

void VoiceServer::stop() {
    impl_->stop();
}

uint16_t VoiceServer::port() const {
    return impl_->port();
}

size_t VoiceServer::active_connections() const {
    return impl_->active_connections();
}

} // namespace server
} // namespace samaira
