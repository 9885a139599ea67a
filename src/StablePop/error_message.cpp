#include "error_message.h"
#include <fmt/format.h>

namespace spop {

ErrorEventMessage::ErrorEventMessage(std::string sender, unsigned int evaluation,
                                     std::string what) noexcept
    : EventMessage{std::move(sender), evaluation}, message{std::move(what)} {}

int ErrorEventMessage::id() const noexcept { return static_cast<int>(EventType::error); }

std::string ErrorEventMessage::to_string() const {
    return fmt::format("Source: {}, evaluations: {}, cause: {}", source, evaluations, message);
}

void ErrorEventMessage::accept(EventMessageVisitor &visitor) const { visitor.visit(*this); }
} // namespace spop
