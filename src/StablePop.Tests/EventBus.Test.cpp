#include "pch.h"

#include "StablePop/error_message.h"
#include "StablePop/event_bus.h"
#include "StablePop/event_logger.h"
#include "StablePop/info_message.h"
#include "StablePop/result_message.h"

#include <atomic>
#include <oneapi/tbb/parallel_for.h>

namespace {
class CountingVisitor final : public spop::EventMessageVisitor {
  public:
    int info{};
    int error{};
    int result{};

    void visit(const spop::InfoEventMessage &) override { info++; }
    void visit(const spop::ErrorEventMessage &) override { error++; }
    void visit(const spop::ResultEventMessage &) override { result++; }
};
} // anonymous namespace

TEST(TestStablePop_EventBus, CreateMessages) {
    using namespace spop;

    auto info = InfoEventMessage{"optimiser", OptimiserAction::update, 12, 5, "best"};
    ASSERT_EQ(static_cast<int>(EventType::info), info.id());
    ASSERT_EQ("optimiser", info.source);
    ASSERT_EQ(12u, info.evaluations);
    ASSERT_EQ(5u, info.iteration);
    ASSERT_EQ(OptimiserAction::update, info.action);
    ASSERT_EQ("Source: optimiser, update, iteration: 5, evaluations: 12 - best", info.to_string());

    auto error = ErrorEventMessage{"optimiser", 3, "bad cost"};
    ASSERT_EQ(static_cast<int>(EventType::error), error.id());
    ASSERT_EQ("Source: optimiser, evaluations: 3, cause: bad cost", error.to_string());

    auto content = StabilisationResult{};
    content.evaluations = 40;
    content.converged = true;
    auto result = ResultEventMessage{"optimiser", content};
    ASSERT_EQ(static_cast<int>(EventType::result), result.id());
    ASSERT_EQ(40u, result.evaluations);
    ASSERT_TRUE(result.content.converged);
}

TEST(TestStablePop_EventBus, VisitorDispatch) {
    using namespace spop;

    auto visitor = CountingVisitor{};
    InfoEventMessage{"a", OptimiserAction::start, 0, 0}.accept(visitor);
    ErrorEventMessage{"a", 0, "oops"}.accept(visitor);
    ResultEventMessage{"a", StabilisationResult{}}.accept(visitor);
    InfoEventMessage{"a", OptimiserAction::stop, 0, 0}.accept(visitor);

    ASSERT_EQ(2, visitor.info);
    ASSERT_EQ(1, visitor.error);
    ASSERT_EQ(1, visitor.result);
}

TEST(TestStablePop_EventBus, SubscribeAndPublishByType) {
    using namespace spop;

    auto bus = DefaultEventBus{};
    auto info_count = 0;
    auto error_count = 0;
    auto info_handler = bus.subscribe(EventType::info, [&info_count](auto) { info_count++; });
    auto error_handler = bus.subscribe(EventType::error, [&error_count](auto) { error_count++; });
    ASSERT_EQ(2u, bus.count());
    ASSERT_NE(info_handler->id(), error_handler->id());

    // canonical guid text: 8-4-4-4-12 hex digits
    ASSERT_EQ(36u, info_handler->id().str().size());
    ASSERT_EQ('-', info_handler->id().str()[8]);

    bus.publish(std::make_unique<InfoEventMessage>("test", OptimiserAction::start, 0u, 0u));
    bus.publish(std::make_unique<InfoEventMessage>("test", OptimiserAction::stop, 1u, 1u));
    bus.publish(std::make_unique<ErrorEventMessage>("test", 1u, "failure"));
    bus.publish(std::make_unique<ResultEventMessage>("test", StabilisationResult{}));

    ASSERT_EQ(2, info_count);
    ASSERT_EQ(1, error_count);
}

TEST(TestStablePop_EventBus, UnsubscribeStopsDelivery) {
    using namespace spop;

    auto bus = DefaultEventBus{};
    auto received = 0;
    auto handler = bus.subscribe(EventType::info, [&received](auto) { received++; });

    bus.publish(std::make_unique<InfoEventMessage>("test", OptimiserAction::start, 0u, 0u));
    handler->unsubscribe();
    bus.publish(std::make_unique<InfoEventMessage>("test", OptimiserAction::stop, 0u, 0u));

    ASSERT_EQ(1, received);
    ASSERT_EQ(0u, bus.count());
    ASSERT_FALSE(bus.unsubscribe(*handler));
}

TEST(TestStablePop_EventBus, HandlerUnsubscribesOnDestruction) {
    using namespace spop;

    auto bus = DefaultEventBus{};
    {
        auto handler = bus.subscribe(EventType::result, [](auto) {});
        ASSERT_EQ(1u, bus.count());
    }

    ASSERT_EQ(0u, bus.count());
}

TEST(TestStablePop_EventBus, ClearRemovesSubscribers) {
    using namespace spop;

    auto bus = DefaultEventBus{};
    auto received = 0;
    auto first = bus.subscribe(EventType::info, [&received](auto) { received++; });
    auto second = bus.subscribe(EventType::info, [&received](auto) { received++; });

    bus.publish(std::make_unique<InfoEventMessage>("test", OptimiserAction::start, 0u, 0u));
    ASSERT_EQ(2, received);

    bus.clear();
    bus.publish(std::make_unique<InfoEventMessage>("test", OptimiserAction::stop, 0u, 0u));
    ASSERT_EQ(2, received);
    ASSERT_EQ(0u, bus.count());
}

TEST(TestStablePop_EventBus, ConcurrentPublish) {
    using namespace spop;

    auto bus = DefaultEventBus{};
    auto received = std::atomic<int>{0};
    auto handler = bus.subscribe(EventType::info, [&received](auto) { received++; });

    tbb::parallel_for(0, 200, [&bus](int index) {
        bus.publish(std::make_unique<InfoEventMessage>("worker", OptimiserAction::update,
                                                       static_cast<unsigned int>(index), 0u));
    });

    ASSERT_EQ(200, received.load());
}

TEST(TestStablePop_EventBus, LoggerPrintsEveryMessage) {
    using namespace spop;

    auto bus = DefaultEventBus{};
    auto logger = EventLogger{bus};
    ASSERT_EQ(3u, bus.count());

    bus.publish(std::make_unique<InfoEventMessage>("logger", OptimiserAction::start, 0u, 0u));
    bus.publish(std::make_unique<ErrorEventMessage>("logger", 2u, "cost failure"));
    bus.publish(std::make_unique<ResultEventMessage>("logger", StabilisationResult{}));
    ASSERT_EQ(3u, logger.count());
}
