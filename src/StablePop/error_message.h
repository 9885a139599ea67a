#pragma once
#include "event_message.h"

namespace spop {

/// @brief Implements the optimiser error event message data type
struct ErrorEventMessage final : public EventMessage {

    ErrorEventMessage() = delete;

    /// @brief Initialises a new instance of the ErrorEventMessage structure.
    /// @param sender The sender identifier
    /// @param evaluation Number of simulations evaluated so far
    /// @param what The associated error message
    ErrorEventMessage(std::string sender, unsigned int evaluation, std::string what) noexcept;

    /// @brief Gets the error message
    const std::string message;

    int id() const noexcept override;

    std::string to_string() const override;

    void accept(EventMessageVisitor &visitor) const override;
};
} // namespace spop
