#pragma once

#include "broadcast_gateway.hpp"
#include "room_registry.hpp"
#include "server_config.hpp"
#include "session.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace roomcast {

// Accepts TLS connections and implements the broadcast gateway on top of them.
// Room membership for emit_to_room comes from the registry.
class Server : public BroadcastGateway {
public:
    Server(boost::asio::io_context& io_context, const ServerConfig& config, RoomRegistry& registry);

    void set_handler(ConnectionHandler* handler) { handler_ = handler; }

    void listen();
    // Closes the acceptor and every session; on_done then runs on the control strand
    void shutdown(std::function<void()> on_done = nullptr);

    // Runs task every interval on the control strand until shutdown()
    void start_sweeping(std::chrono::seconds interval, std::function<void()> task);

    // --- BroadcastGateway ---
    bool emit_to(const std::string& connection_id, const wire::MessageWrapper& msg) override;
    void emit_to_room(const std::string& room_code, const wire::MessageWrapper& msg,
                      const std::set<std::string>& exclude = {}) override;
    bool when_writable(const std::string& connection_id, std::function<void()> task) override;

    uint64_t max_frame_bytes() const { return config_.max_frame_bytes(); }
    // Bound port after listen(); differs from the configured one when that was 0
    unsigned short local_port() const;
    size_t session_count() const;

private:
    void do_accept();
    void schedule_sweep();
    std::string next_connection_id();

    // Called by Session on its strand
    void session_ready(const std::string& connection_id);
    void dispatch(const std::string& connection_id, const wire::MessageWrapper& msg);
    void remove_session(const std::string& connection_id, bool was_ready);

    boost::asio::io_context& io_context_;
    // Serializes the acceptor and the sweep timer against shutdown()
    boost::asio::strand<boost::asio::io_context::executor_type> control_strand_;
    ServerConfig config_;
    ssl::context ssl_context_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    RoomRegistry& registry_;
    ConnectionHandler* handler_ = nullptr;

    // Sessions waiting for their handshake, then ready ones reachable by emit_to
    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> pending_sessions_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::atomic<uint64_t> connection_counter_{0};

    boost::asio::steady_timer sweep_timer_;
    std::chrono::seconds sweep_interval_{0};
    std::function<void()> sweep_task_;

    friend class Session; // Give Session access to Server's private methods
};

} // namespace roomcast
