#include "session.hpp"
#include "server.hpp"
#include "roomcast/events.hpp"
#include <iostream>

namespace roomcast {

Session::Session(tcp::socket socket, ssl::context& ssl_context, Server& server, std::string connection_id)
    : socket_(std::move(socket), ssl_context),
      server_(server),
      connection_id_(std::move(connection_id)) {}

void Session::start() {
    auto self(shared_from_this());
    boost::asio::dispatch(socket_.get_executor(), [this, self]() { do_handshake(); });
}

void Session::stop() {
    auto self(shared_from_this());
    boost::asio::dispatch(socket_.get_executor(), [this, self]() { close(); });
}

void Session::close() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    write_queue_.clear();
    writable_waiters_.clear();

    // Gracefully shut down the SSL connection
    if (socket_.lowest_layer().is_open()) {
        socket_.async_shutdown([self = shared_from_this()](const boost::system::error_code&) {
            // After shutdown, we can safely close the socket
            if (self->socket_.lowest_layer().is_open()) {
                boost::system::error_code ignored;
                self->socket_.lowest_layer().close(ignored);
            }
        });
    }

    // Remove ourselves from the active session list in Server.
    server_.remove_session(connection_id_, ready_);
}

void Session::do_handshake() {
    auto self(shared_from_this());
    socket_.async_handshake(ssl::stream_base::server,
        [this, self](const boost::system::error_code& ec) {
            if (stopped_) {
                return;
            }
            if (ec) {
                std::cerr << "[Session] " << connection_id_ << " SSL handshake failed: " << ec.message() << std::endl;
                close();
                return;
            }
            std::cout << "[Session] " << connection_id_ << " SSL handshake successful." << std::endl;
            ready_ = true;
            server_.session_ready(connection_id_);
            do_read_header();
        });
}

void Session::do_read_header() {
    auto self(shared_from_this());
    boost::asio::async_read(socket_, boost::asio::buffer(header_buffer_),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (stopped_) {
                return;
            }
            if (ec) {
                if (ec != boost::asio::error::eof && ec != ssl::error::stream_truncated) {
                    std::cerr << "[Session] " << connection_id_ << " read error: " << ec.message() << std::endl;
                }
                close();
                return;
            }
            uint32_t size = frame::decode_header(header_buffer_);
            if (size == 0 || size > server_.max_frame_bytes()) {
                std::cerr << "[Session] " << connection_id_ << " sent an invalid frame size " << size << std::endl;
                close();
                return;
            }
            do_read_body(size);
        });
}

void Session::do_read_body(uint32_t size) {
    auto self(shared_from_this());
    body_buffer_.resize(size);
    boost::asio::async_read(socket_, boost::asio::buffer(body_buffer_),
        [this, self](boost::system::error_code ec, std::size_t length) {
            if (stopped_) {
                return;
            }
            if (ec) {
                std::cerr << "[Session] " << connection_id_ << " read error: " << ec.message() << std::endl;
                close();
                return;
            }

            wire::MessageWrapper msg;
            if (!msg.ParseFromArray(body_buffer_.data(), static_cast<int>(length))) {
                std::cerr << "[Session] " << connection_id_ << " failed to parse message." << std::endl;
                close();
                return;
            }
            body_buffer_.clear();
            body_buffer_.shrink_to_fit();

            try {
                server_.dispatch(connection_id_, msg);
            } catch (const std::exception& e) {
                std::cerr << "[Session] " << connection_id_ << " handler for '" << events::event_name(msg)
                          << "' failed: " << e.what() << std::endl;
                close();
                return;
            }
            do_read_header(); // Continue reading
        });
}

void Session::deliver(const wire::MessageWrapper& msg) {
    // Use a shared_ptr for the buffer so it lives until it is queued on the strand
    auto framed = std::make_shared<std::string>(frame::encode(msg));
    auto self(shared_from_this());
    boost::asio::post(socket_.get_executor(), [this, self, framed]() {
        if (stopped_) {
            return;
        }
        bool writing = !write_queue_.empty();
        write_queue_.push_back(std::move(*framed));
        if (!writing) {
            do_write();
        }
    });
}

void Session::do_write() {
    auto self(shared_from_this());
    boost::asio::async_write(socket_, boost::asio::buffer(write_queue_.front()),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (stopped_) {
                return;
            }
            if (ec) {
                std::cerr << "[Session] " << connection_id_ << " write error: " << ec.message() << std::endl;
                close(); // Stop the session on a write error
                return;
            }
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                do_write();
            }
            if (write_queue_.size() < MAX_QUEUED_FRAMES) {
                notify_writable();
            }
        });
}

void Session::when_writable(std::function<void()> task) {
    auto self(shared_from_this());
    boost::asio::post(socket_.get_executor(), [this, self, task = std::move(task)]() mutable {
        if (stopped_) {
            return;
        }
        if (write_queue_.size() < MAX_QUEUED_FRAMES) {
            task();
            return;
        }
        writable_waiters_.push_back(std::move(task));
    });
}

void Session::notify_writable() {
    std::deque<std::function<void()>> waiters;
    waiters.swap(writable_waiters_);
    for (auto& task : waiters) {
        task();
    }
}

} // namespace roomcast
