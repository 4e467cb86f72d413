#include <ktree/events/change_notifier.h>

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace ktree::events {

using json = nlohmann::json;

std::string_view toString(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::EntryAdded:
            return "entryAdded";
        case EventKind::EntryUpdated:
            return "entryUpdated";
        case EventKind::EntryDeleted:
            return "entryDeleted";
        case EventKind::EntryMoved:
            return "entryMoved";
    }
    return "entryUpdated";
}

std::optional<EventKind> parseEventKind(std::string_view name) noexcept {
    for (auto kind : {EventKind::EntryAdded, EventKind::EntryUpdated, EventKind::EntryDeleted,
                      EventKind::EntryMoved}) {
        if (toString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

json ChangeEvent::toJson() const {
    json message = json::object();
    message["type"] = std::string(toString(kind));
    if (payload.is_object()) {
        message.update(payload);
    } else if (!payload.is_null()) {
        message["data"] = payload;
    }
    return message;
}

QueuedSubscriber::QueuedSubscriber(std::size_t capacity) : queue_(capacity) {}

bool QueuedSubscriber::deliver(const ChangeEvent& event) {
    if (!isOpen()) {
        return false;
    }
    return queue_.try_push(event);
}

bool LogSubscriber::deliver(const ChangeEvent& event) {
    spdlog::debug("Change event: {}", event.toJson().dump());
    return true;
}

SubscriberRegistry::SubscriberId SubscriberRegistry::add(std::shared_ptr<ISubscriber> subscriber) {
    std::lock_guard<std::mutex> lk(mu_);
    auto id = nextId_++;
    subscribers_.emplace(id, std::move(subscriber));
    return id;
}

bool SubscriberRegistry::remove(SubscriberId id) {
    std::lock_guard<std::mutex> lk(mu_);
    return subscribers_.erase(id) > 0;
}

std::size_t SubscriberRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return subscribers_.size();
}

std::size_t SubscriberRegistry::broadcast(const ChangeEvent& event) {
    // Deliver from a snapshot so subscribers may add or remove themselves
    std::vector<std::pair<SubscriberId, std::shared_ptr<ISubscriber>>> snapshot;
    {
        std::lock_guard<std::mutex> lk(mu_);
        snapshot.assign(subscribers_.begin(), subscribers_.end());
    }

    std::size_t delivered = 0;
    std::vector<SubscriberId> dead;
    for (const auto& [id, subscriber] : snapshot) {
        if (!subscriber || !subscriber->isOpen()) {
            dead.push_back(id);
            continue;
        }
        try {
            if (subscriber->deliver(event)) {
                ++delivered;
            } else {
                spdlog::warn("Subscriber {} not keeping up, dropping it", id);
                dead.push_back(id);
            }
        } catch (const std::exception& e) {
            spdlog::warn("Subscriber {} failed to receive {}: {}", id, toString(event.kind),
                         e.what());
            dead.push_back(id);
        }
    }

    if (!dead.empty()) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto id : dead) {
            subscribers_.erase(id);
        }
        spdlog::debug("Pruned {} subscribers, {} remaining", dead.size(), subscribers_.size());
    }
    return delivered;
}

void SubscriberRegistry::notify(EventKind kind, const json& payload) noexcept {
    try {
        broadcast(ChangeEvent{kind, payload});
    } catch (const std::exception& e) {
        spdlog::warn("Failed to broadcast {}: {}", toString(kind), e.what());
    }
}

} // namespace ktree::events
