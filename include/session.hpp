#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "broadcast_gateway.hpp"
#include "roomcast.pb.h"
#include "roomcast/frame.hpp"
#include <array>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace roomcast {

namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

class Server; // Forward declaration

// One TLS connection. All socket work runs on the socket's strand, so deliver()
// may be called from any thread and frames go out in the order they were delivered.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, ssl::context& ssl_context, Server& server, std::string connection_id);

    void start();
    void stop();

    void deliver(const wire::MessageWrapper& msg);
    // Runs task on the strand once the write queue is below MAX_QUEUED_FRAMES
    void when_writable(std::function<void()> task);

    const std::string& connection_id() const { return connection_id_; }

private:
    void do_handshake();
    void do_read_header();
    void do_read_body(uint32_t size);
    void do_write();
    void notify_writable();
    void close();

    ssl::stream<tcp::socket> socket_;
    std::array<uint8_t, frame::HEADER_SIZE> header_buffer_;
    std::vector<char> body_buffer_;
    std::deque<std::string> write_queue_;
    std::deque<std::function<void()>> writable_waiters_;
    Server& server_;
    std::string connection_id_;
    bool ready_ = false;
    bool stopped_ = false;
};

} // namespace roomcast
