#include "server.hpp"
#include "roomcast/events.hpp"
#include <iostream>
#include <vector>

namespace roomcast {

Server::Server(boost::asio::io_context& io_context, const ServerConfig& config, RoomRegistry& registry)
    : io_context_(io_context),
      control_strand_(boost::asio::make_strand(io_context)),
      config_(config),
      ssl_context_(ssl::context::tls_server),
      registry_(registry),
      sweep_timer_(control_strand_) {
    ssl_context_.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 | ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use);
    ssl_context_.use_certificate_chain_file(config_.certificate_file);
    ssl_context_.use_private_key_file(config_.private_key_file, ssl::context::pem);
}

void Server::listen() {
    tcp::endpoint endpoint(boost::asio::ip::make_address(config_.bind_address), config_.port);
    acceptor_ = std::make_unique<tcp::acceptor>(control_strand_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();

    std::cout << "[Server] Listening on " << endpoint << std::endl;
    do_accept();
}

void Server::shutdown(std::function<void()> on_done) {
    std::vector<std::shared_ptr<Session>> open;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& entry : pending_sessions_) open.push_back(entry.second);
        for (auto& entry : sessions_) open.push_back(entry.second);
    }
    for (auto& session : open) {
        session->stop();
    }

    boost::asio::post(control_strand_, [this, on_done = std::move(on_done)]() {
        if (acceptor_ && acceptor_->is_open()) {
            boost::system::error_code ignored;
            acceptor_->close(ignored);
        }
        sweep_timer_.cancel();
        sweep_task_ = nullptr;
        if (on_done) {
            on_done();
        }
    });
}

void Server::do_accept() {
    acceptor_->async_accept(boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!acceptor_->is_open()) {
                return;
            }
            if (!ec) {
                std::string connection_id = next_connection_id();
                std::cout << "[Server] Accepted " << connection_id << " from "
                          << socket.remote_endpoint(ec) << std::endl;
                auto session = std::make_shared<Session>(std::move(socket), ssl_context_, *this, connection_id);
                {
                    std::lock_guard<std::mutex> lock(sessions_mutex_);
                    pending_sessions_[connection_id] = session;
                }
                session->start();
            } else {
                std::cerr << "[Server] Accept error: " << ec.message() << std::endl;
            }
            do_accept();
        });
}

std::string Server::next_connection_id() {
    return "c-" + std::to_string(++connection_counter_);
}

void Server::session_ready(const std::string& connection_id) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = pending_sessions_.find(connection_id);
        if (it == pending_sessions_.end()) {
            return;
        }
        sessions_[connection_id] = it->second;
        pending_sessions_.erase(it);
    }
    if (handler_) {
        handler_->on_connect(connection_id);
    }
}

void Server::dispatch(const std::string& connection_id, const wire::MessageWrapper& msg) {
    if (handler_) {
        handler_->on_message(connection_id, msg);
    }
}

void Server::remove_session(const std::string& connection_id, bool was_ready) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        pending_sessions_.erase(connection_id);
        sessions_.erase(connection_id);
        std::cout << "[Server] Session " << connection_id << " closed. Total sessions: "
                  << sessions_.size() << std::endl;
    }
    if (was_ready && handler_) {
        handler_->on_disconnect(connection_id);
    }
}

unsigned short Server::local_port() const {
    return acceptor_ ? acceptor_->local_endpoint().port() : 0;
}

size_t Server::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

// --- BroadcastGateway ---

bool Server::emit_to(const std::string& connection_id, const wire::MessageWrapper& msg) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(connection_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
    }
    session->deliver(msg);
    return true;
}

void Server::emit_to_room(const std::string& room_code, const wire::MessageWrapper& msg,
                          const std::set<std::string>& exclude) {
    for (const auto& connection_id : registry_.connections(room_code)) {
        if (exclude.count(connection_id)) {
            continue;
        }
        if (!emit_to(connection_id, msg)) {
            std::cerr << "[Server] " << events::event_name(msg) << " not delivered to "
                      << connection_id << ": no session" << std::endl;
        }
    }
}

bool Server::when_writable(const std::string& connection_id, std::function<void()> task) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(connection_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
    }
    session->when_writable(std::move(task));
    return true;
}

// --- Periodic maintenance ---

void Server::start_sweeping(std::chrono::seconds interval, std::function<void()> task) {
    boost::asio::post(control_strand_, [this, interval, task = std::move(task)]() mutable {
        sweep_interval_ = interval;
        sweep_task_ = std::move(task);
        schedule_sweep();
    });
}

void Server::schedule_sweep() {
    sweep_timer_.expires_after(sweep_interval_);
    sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !sweep_task_) {
            return;
        }
        sweep_task_();
        schedule_sweep();
    });
}

} // namespace roomcast
