#pragma once
namespace spop {

struct InfoEventMessage;
struct ErrorEventMessage;
struct ResultEventMessage;

/// @brief Handles each concrete event message type, see EventMessage::accept
class EventMessageVisitor {
  public:
    EventMessageVisitor() = default;
    EventMessageVisitor(const EventMessageVisitor &) = delete;
    EventMessageVisitor &operator=(const EventMessageVisitor &) = delete;
    EventMessageVisitor(EventMessageVisitor &&) = delete;
    EventMessageVisitor &operator=(EventMessageVisitor &&) = delete;
    virtual ~EventMessageVisitor() = default;

    virtual void visit(const InfoEventMessage &message) = 0;

    virtual void visit(const ErrorEventMessage &message) = 0;

    virtual void visit(const ResultEventMessage &message) = 0;
};
} // namespace spop
