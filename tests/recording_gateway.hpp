#pragma once

#include "broadcast_gateway.hpp"
#include "room_registry.hpp"
#include "roomcast/events.hpp"
#include <deque>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace roomcast {
namespace test_support {

struct SentEvent {
    std::string connection_id;
    std::string name;
    wire::MessageWrapper msg;
};

// In-memory gateway: records every delivery, resolves rooms through the registry
class RecordingGateway : public BroadcastGateway {
public:
    explicit RecordingGateway(const RoomRegistry& registry) : registry_(registry) {}

    void connect(const std::string& connection_id) { connected_.insert(connection_id); }
    void disconnect(const std::string& connection_id) {
        connected_.erase(connection_id);
        congested_.erase(connection_id);
        waiting_.erase(connection_id);
    }

    // While congested, when_writable tasks wait for drain()
    void set_congested(const std::string& connection_id, bool congested) {
        if (congested) {
            congested_.insert(connection_id);
        } else {
            congested_.erase(connection_id);
            drain(connection_id);
        }
    }

    void drain(const std::string& connection_id) {
        auto it = waiting_.find(connection_id);
        if (it == waiting_.end()) {
            return;
        }
        std::vector<std::function<void()>> tasks = std::move(it->second);
        waiting_.erase(it);
        for (auto& task : tasks) {
            task();
        }
    }

    size_t waiting(const std::string& connection_id) const {
        auto it = waiting_.find(connection_id);
        return it == waiting_.end() ? 0 : it->second.size();
    }

    bool emit_to(const std::string& connection_id, const wire::MessageWrapper& msg) override {
        if (!connected_.count(connection_id)) {
            return false;
        }
        sent_.push_back({connection_id, events::event_name(msg), msg});
        return true;
    }

    void emit_to_room(const std::string& room_code, const wire::MessageWrapper& msg,
                      const std::set<std::string>& exclude = {}) override {
        for (const auto& connection_id : registry_.connections(room_code)) {
            if (!exclude.count(connection_id)) {
                emit_to(connection_id, msg);
            }
        }
    }

    bool when_writable(const std::string& connection_id, std::function<void()> task) override {
        if (!connected_.count(connection_id)) {
            return false;
        }
        if (congested_.count(connection_id)) {
            waiting_[connection_id].push_back(std::move(task));
            return true;
        }
        task();
        return true;
    }

    const std::vector<SentEvent>& sent() const { return sent_; }
    void clear() { sent_.clear(); }

    std::vector<SentEvent> events_for(const std::string& connection_id) const {
        std::vector<SentEvent> result;
        for (const auto& event : sent_) {
            if (event.connection_id == connection_id) {
                result.push_back(event);
            }
        }
        return result;
    }

    std::vector<std::string> names_for(const std::string& connection_id) const {
        std::vector<std::string> names;
        for (const auto& event : events_for(connection_id)) {
            names.push_back(event.name);
        }
        return names;
    }

    size_t count(const std::string& connection_id, const std::string& name) const {
        size_t n = 0;
        for (const auto& event : sent_) {
            if (event.connection_id == connection_id && event.name == name) {
                ++n;
            }
        }
        return n;
    }

private:
    const RoomRegistry& registry_;
    std::set<std::string> connected_;
    std::set<std::string> congested_;
    std::map<std::string, std::vector<std::function<void()>>> waiting_;
    std::vector<SentEvent> sent_;
};

// Holds scheduled tasks until the test runs them
class QueueScheduler {
public:
    Scheduler scheduler() {
        return [this](std::function<void()> task) { tasks_.push_back(std::move(task)); };
    }

    bool run_one() {
        if (tasks_.empty()) {
            return false;
        }
        auto task = std::move(tasks_.front());
        tasks_.pop_front();
        task();
        return true;
    }

    size_t run_all() {
        size_t ran = 0;
        while (run_one()) {
            ++ran;
        }
        return ran;
    }

    size_t pending() const { return tasks_.size(); }

private:
    std::deque<std::function<void()>> tasks_;
};

} // namespace test_support
} // namespace roomcast
