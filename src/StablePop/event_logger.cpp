#include "event_logger.h"
#include "error_message.h"
#include "info_message.h"
#include "result_message.h"

#include <fmt/color.h>
#include <fmt/core.h>

namespace spop {

EventLogger::EventLogger(EventAggregator &event_bus) {
    for (auto event_type : {EventType::info, EventType::result, EventType::error}) {
        handlers_.emplace_back(event_bus.subscribe(
            event_type, [this](const std::shared_ptr<EventMessage> &message) {
                message->accept(*this);
            }));
    }
}

void EventLogger::visit(const InfoEventMessage &message) {
    fmt::print(fg(fmt::color::light_blue), "{}\n", message.to_string());
    count_++;
}

void EventLogger::visit(const ErrorEventMessage &message) {
    fmt::print(fg(fmt::color::red), "{}\n", message.to_string());
    count_++;
}

void EventLogger::visit(const ResultEventMessage &message) {
    fmt::print(fg(fmt::color::light_green), "{}\n", message.to_string());
    count_++;
}
} // namespace spop
