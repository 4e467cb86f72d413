#pragma once

#include <ktree/events/bounded_queue.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ktree::events {

enum class EventKind { EntryAdded, EntryUpdated, EntryDeleted, EntryMoved };

// "entryAdded", "entryUpdated", "entryDeleted", "entryMoved"
std::string_view toString(EventKind kind) noexcept;
std::optional<EventKind> parseEventKind(std::string_view name) noexcept;

struct ChangeEvent {
    EventKind kind = EventKind::EntryUpdated;
    nlohmann::json payload = nlohmann::json::object();

    // {"type": <kind>, ...payload}
    nlohmann::json toJson() const;
};

/**
 * Receiver of engine change notifications. Called after a mutation has been committed;
 * implementations must not throw and must not block on slow consumers.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;
    virtual void notify(EventKind kind, const nlohmann::json& payload) noexcept = 0;
};

class ISubscriber {
public:
    virtual ~ISubscriber() = default;

    virtual bool isOpen() const = 0;

    // False when the event could not be accepted; the subscriber is then dropped
    virtual bool deliver(const ChangeEvent& event) = 0;
};

/**
 * Subscriber backed by a bounded queue drained by its consumer. A full queue means the
 * consumer stopped keeping up.
 */
class QueuedSubscriber : public ISubscriber {
public:
    explicit QueuedSubscriber(std::size_t capacity = 256);

    bool isOpen() const override { return open_.load(std::memory_order_acquire); }
    bool deliver(const ChangeEvent& event) override;

    void close() { open_.store(false, std::memory_order_release); }
    bool tryPop(ChangeEvent& out) { return queue_.try_pop(out); }
    std::size_t pending() const { return queue_.size(); }

private:
    BoundedQueue<ChangeEvent> queue_;
    std::atomic<bool> open_{true};
};

// Writes every event to the default spdlog logger
class LogSubscriber : public ISubscriber {
public:
    bool isOpen() const override { return true; }
    bool deliver(const ChangeEvent& event) override;
};

/**
 * Explicit registry of live subscribers; fan-out is synchronous but never blocks on a
 * subscriber. Closed, full or throwing subscribers are pruned during broadcast.
 */
class SubscriberRegistry : public INotificationSink {
public:
    using SubscriberId = std::uint64_t;

    SubscriberId add(std::shared_ptr<ISubscriber> subscriber);
    bool remove(SubscriberId id);

    // Number of subscribers that accepted the event
    std::size_t broadcast(const ChangeEvent& event);

    void notify(EventKind kind, const nlohmann::json& payload) noexcept override;

    std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::map<SubscriberId, std::shared_ptr<ISubscriber>> subscribers_;
    SubscriberId nextId_{1};
};

} // namespace ktree::events
