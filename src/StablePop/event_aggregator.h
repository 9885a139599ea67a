#pragma once
#include "event_message.h"

#include <functional>
#include <memory>
#include <stdexcept>

namespace spop {

/// @brief Name of one subscription on an event bus, never empty
struct EventHandlerIdentifier {
    EventHandlerIdentifier() = delete;

    /// @throws std::invalid_argument for empty name
    EventHandlerIdentifier(std::string identifier) : identifier_{std::move(identifier)} {
        if (identifier_.empty()) {
            throw std::invalid_argument("Event handler identifier must not be empty.");
        }
    }

    const std::string &str() const noexcept { return identifier_; }

    auto operator<=>(const EventHandlerIdentifier &other) const = default;

  private:
    std::string identifier_;
};

/// @brief Subscription handle returned by EventAggregator::subscribe
///
/// @details Implementations end the subscription when destroyed, the handle must
/// not outlive the bus it came from.
class EventSubscriber {
  public:
    EventSubscriber() = default;
    EventSubscriber(const EventSubscriber &) = delete;
    EventSubscriber(EventSubscriber &&) = delete;
    EventSubscriber &operator=(const EventSubscriber &) = delete;
    EventSubscriber &operator=(EventSubscriber &&) = delete;
    virtual ~EventSubscriber() = default;

    /// @brief Stops the handler receiving further messages
    virtual void unsubscribe() const = 0;

    [[nodiscard]] virtual EventHandlerIdentifier id() const noexcept = 0;
};

/// @brief Message bus used by long-running searches to report progress without console I/O
class EventAggregator {
  public:
    EventAggregator() = default;
    EventAggregator(const EventAggregator &) = delete;
    EventAggregator &operator=(const EventAggregator &) = delete;
    EventAggregator(EventAggregator &&) = delete;
    EventAggregator &operator=(EventAggregator &&) = delete;
    virtual ~EventAggregator() = default;

    /// @brief Registers a handler for one message type
    /// @param event_id The message type
    /// @param handler Function called for every published message of the type
    /// @return The subscription handle
    [[nodiscard]] virtual std::unique_ptr<EventSubscriber>
    subscribe(EventType event_id,
              std::function<void(std::shared_ptr<EventMessage> message)> handler) = 0;

    /// @brief Removes a subscription
    /// @return false when the subscription is not registered
    virtual bool unsubscribe(const EventSubscriber &subscriber) = 0;

    /// @brief Delivers a message to the handlers of its type, on the calling thread
    ///
    /// Handlers run while the subscription registry is locked for reading, so a
    /// handler must not subscribe or unsubscribe on the same aggregator.
    virtual void publish(std::unique_ptr<EventMessage> message) const = 0;
};

} // namespace spop
