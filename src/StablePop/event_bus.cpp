#include "event_bus.h"

#include <crossguid/guid.hpp>
#include <mutex>

namespace spop {

std::unique_ptr<EventSubscriber>
DefaultEventBus::subscribe(EventType event_id,
                           std::function<void(std::shared_ptr<EventMessage> message)> function) {
    auto handle_id = std::string{};
    {
        std::unique_lock<mutex_type> lock(subscribe_mutex_);
        handle_id = xg::newGuid().str();
        subscribers_.emplace(handle_id, std::move(function));
        registry_.emplace(static_cast<int>(event_id), handle_id);
    }

    return std::make_unique<EventSubscriberHandler>(handle_id, this);
}

void DefaultEventBus::publish(std::unique_ptr<EventMessage> message) const {
    std::shared_lock<mutex_type> lock(subscribe_mutex_);
    std::shared_ptr<EventMessage> shared_message = std::move(message);

    // Only call the functions registered for the event type
    auto [begin_id, end_id] = registry_.equal_range(shared_message->id());
    for (; begin_id != end_id; ++begin_id) {
        subscribers_.at(begin_id->second)(shared_message);
    }
}

bool DefaultEventBus::unsubscribe(const EventSubscriber &subscriber) {
    std::unique_lock<mutex_type> lock(subscribe_mutex_);
    auto sub_id = subscriber.id().str();
    if (!subscribers_.contains(sub_id)) {
        return false;
    }

    for (auto it = registry_.begin(); it != registry_.end(); ++it) {
        if (it->second == sub_id) {
            registry_.erase(it);
            break;
        }
    }

    subscribers_.erase(sub_id);
    return true;
}

std::size_t DefaultEventBus::count() const {
    std::shared_lock<mutex_type> lock(subscribe_mutex_);
    return registry_.size();
}

void DefaultEventBus::clear() {
    std::unique_lock<mutex_type> lock(subscribe_mutex_);
    registry_.clear();
    subscribers_.clear();
}
} // namespace spop
