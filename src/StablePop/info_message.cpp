#include "info_message.h"
#include <fmt/format.h>

#include <utility>

namespace spop {

InfoEventMessage::InfoEventMessage(std::string sender, OptimiserAction action,
                                   unsigned int evaluation, unsigned int iteration) noexcept
    : InfoEventMessage(std::move(sender), action, evaluation, iteration, std::string{}) {}

InfoEventMessage::InfoEventMessage(std::string sender, OptimiserAction source_action,
                                   unsigned int evaluation, unsigned int search_iteration,
                                   std::string msg) noexcept
    : EventMessage{std::move(sender), evaluation}, action{source_action},
      iteration{search_iteration}, message{std::move(msg)} {}

int InfoEventMessage::id() const noexcept { return static_cast<int>(EventType::info); }

std::string InfoEventMessage::to_string() const {
    if (message.empty()) {
        return fmt::format("Source: {}, {}, iteration: {}, evaluations: {}", source,
                           detail::optimiser_action_str(action), iteration, evaluations);
    }

    return fmt::format("Source: {}, {}, iteration: {}, evaluations: {} - {}", source,
                       detail::optimiser_action_str(action), iteration, evaluations, message);
}

void InfoEventMessage::accept(EventMessageVisitor &visitor) const { visitor.visit(*this); }

namespace detail {

std::string optimiser_action_str(OptimiserAction action) {
    switch (action) {
    case OptimiserAction::update:
        return "update";
    case OptimiserAction::start:
        return "start";
    case OptimiserAction::stop:
        return "stop";
    default:
        return "unknown";
    }
}
} // namespace detail
} // namespace spop
