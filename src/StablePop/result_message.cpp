#include "result_message.h"
#include <fmt/format.h>

namespace spop {

ResultEventMessage::ResultEventMessage(std::string sender, StabilisationResult result) noexcept
    : EventMessage{std::move(sender), result.evaluations}, content{result} {}

int ResultEventMessage::id() const noexcept { return static_cast<int>(EventType::result); }

std::string ResultEventMessage::to_string() const {
    return fmt::format("Source: {}, target TFR: {:.6f}, cost: {:.6g}, {} after {} iterations, "
                       "evaluations: {}",
                       source, content.parameters.target_total_fertility_rate, content.cost,
                       content.converged ? "converged" : "not converged", content.iterations,
                       evaluations);
}

void ResultEventMessage::accept(EventMessageVisitor &visitor) const { visitor.visit(*this); }
} // namespace spop
