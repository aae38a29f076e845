#pragma once

#include "roomcast.pb.h"
#include <cstddef>
#include <functional>
#include <set>
#include <string>

namespace roomcast {

// Outbound frames a connection may have waiting before streams stop feeding it
const size_t MAX_QUEUED_FRAMES = 8;

// Transport contract the room service relies on. Delivery is fire-and-forget:
// nothing here waits for the peer to acknowledge.
class BroadcastGateway {
public:
    virtual ~BroadcastGateway() = default;

    // Queues the event for one connection. Returns false when the connection is unknown.
    virtual bool emit_to(const std::string& connection_id, const wire::MessageWrapper& msg) = 0;

    // Best effort to every current member of the room except the excluded connections
    virtual void emit_to_room(const std::string& room_code, const wire::MessageWrapper& msg,
                              const std::set<std::string>& exclude = {}) = 0;

    // Runs task once fewer than MAX_QUEUED_FRAMES frames are waiting for the connection.
    // Returns false when the connection is unknown; the task is then dropped.
    virtual bool when_writable(const std::string& connection_id, std::function<void()> task) = 0;
};

// Receives transport notifications; implemented by the room service
class ConnectionHandler {
public:
    virtual ~ConnectionHandler() = default;

    virtual void on_connect(const std::string& connection_id) = 0;
    virtual void on_disconnect(const std::string& connection_id) = 0;
    virtual void on_message(const std::string& connection_id, const wire::MessageWrapper& msg) = 0;
};

// Runs a task later, off the current call stack
using Scheduler = std::function<void(std::function<void()>)>;

} // namespace roomcast
