#pragma once
#include "event_aggregator.h"

#include <memory>
#include <vector>

namespace spop {

/// @brief Writes every event bus message to the terminal, synchronously
class EventLogger final : public EventMessageVisitor {
  public:
    EventLogger() = delete;

    /// @brief Initialises a new instance of the EventLogger class, subscribing to all events.
    /// @param event_bus The message bus instance to monitor, must outlive the logger
    explicit EventLogger(EventAggregator &event_bus);

    /// @brief Gets the number of messages written so far
    std::size_t count() const noexcept { return count_; }

    void visit(const InfoEventMessage &message) override;
    void visit(const ErrorEventMessage &message) override;
    void visit(const ResultEventMessage &message) override;

  private:
    std::vector<std::unique_ptr<EventSubscriber>> handlers_;
    std::size_t count_{};
};
} // namespace spop
