#pragma once

#include "event_visitor.h"
#include <cstdint>
#include <string>
#include <utility>

namespace spop {

/// @brief Kinds of messages published by the stabilisation search
enum struct EventType : uint8_t {
    /// @brief Search start, progress and stop
    info,

    /// @brief Final search outcome
    result,

    /// @brief Search aborted by a failure
    error
};

/// @brief Base of the immutable messages published on the event bus
struct EventMessage {
    EventMessage() = delete;

    /// @param sender Name of the publishing search
    /// @param evaluation Simulations run by the search when publishing
    EventMessage(std::string sender, unsigned int evaluation)
        : source{std::move(sender)}, evaluations{evaluation} {}

    EventMessage(const EventMessage &) = delete;
    EventMessage(EventMessage &&) = delete;
    EventMessage &operator=(const EventMessage &) = delete;
    EventMessage &operator=(EventMessage &&) = delete;
    virtual ~EventMessage() = default;

    const std::string source;

    const unsigned int evaluations{};

    /// @brief Gets the EventType value of the message, as int
    virtual int id() const noexcept = 0;

    virtual std::string to_string() const = 0;

    /// @brief Calls the visitor overload for the concrete message type
    virtual void accept(EventMessageVisitor &visitor) const = 0;
};
} // namespace spop
