#pragma once
#include "event_message.h"
#include "stabilisation_result.h"

namespace spop {

/// @brief Implements the stabilisation result event message data type
struct ResultEventMessage final : public EventMessage {

    ResultEventMessage() = delete;

    /// @brief Initialises a new instance of the ResultEventMessage structure.
    /// @param sender The sender identifier
    /// @param result The stabilisation result content
    ResultEventMessage(std::string sender, StabilisationResult result) noexcept;

    /// @brief Gets the stabilisation result content
    const StabilisationResult content;

    int id() const noexcept override;

    std::string to_string() const override;

    void accept(EventMessageVisitor &visitor) const override;
};
} // namespace spop
