#pragma once
#include "event_message.h"

namespace spop {

/// @brief Enumerates optimiser actions
enum class OptimiserAction {
    /// @brief Search has started
    start,

    /// @brief Search iteration has completed
    update,

    /// @brief Search has stopped
    stop
};

/// @brief Implements the optimiser information event message data type
struct InfoEventMessage final : public EventMessage {

    InfoEventMessage() = delete;

    /// @brief Initialises a new instance of the InfoEventMessage structure.
    /// @param sender The sender identifier
    /// @param action Source action identification
    /// @param evaluation Number of simulations evaluated so far
    /// @param iteration Current search iteration
    InfoEventMessage(std::string sender, OptimiserAction action, unsigned int evaluation,
                     unsigned int iteration) noexcept;

    /// @brief Initialises a new instance of the InfoEventMessage structure.
    /// @param sender The sender identifier
    /// @param action Source action identification
    /// @param evaluation Number of simulations evaluated so far
    /// @param iteration Current search iteration
    /// @param msg The notification message
    InfoEventMessage(std::string sender, OptimiserAction action, unsigned int evaluation,
                     unsigned int iteration, std::string msg) noexcept;

    /// @brief Gets the source action value
    const OptimiserAction action{};

    /// @brief Gets the associated search iteration
    const unsigned int iteration{};

    /// @brief Gets the notification message
    const std::string message;

    int id() const noexcept override;

    std::string to_string() const override;

    void accept(EventMessageVisitor &visitor) const override;
};

namespace detail {
/// @brief Converts enumeration to string, not pretty but no support in C++
std::string optimiser_action_str(OptimiserAction action);
} // namespace detail
} // namespace spop
