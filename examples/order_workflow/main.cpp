#include "DFSM.h"
#include <array>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

enum class OrderState { Created, Paid, Packed, Shipped, Delivered, Cancelled, Returned };

namespace DFSM {
template <> struct StateTraits<OrderState> {
    static constexpr std::array<std::pair<OrderState, std::string_view>, 7> names{{
        {OrderState::Created, "Created"},
        {OrderState::Paid, "Paid"},
        {OrderState::Packed, "Packed"},
        {OrderState::Shipped, "Shipped"},
        {OrderState::Delivered, "Delivered"},
        {OrderState::Cancelled, "Cancelled"},
        {OrderState::Returned, "Returned"},
    }};
};
}  // namespace DFSM

struct OrderContext {
    bool paymentReceived = false;
    bool packingComplete = false;
    bool shipped = false;
    bool delivered = false;
    bool cancelRequested = false;
    bool returnRequested = false;
};

using OrderRegistry = DFSM::TransitionRegistry<OrderState, OrderContext>;
using OrderBuilder = DFSM::FiniteStateMachineBuilder<OrderState, OrderContext>;
using OrderMachine = DFSM::FiniteStateMachine<OrderState, OrderContext>;

static std::shared_ptr<OrderRegistry> createRegistry() {
    auto registry = std::make_shared<OrderRegistry>();
    registry->registerCondition("PaymentReceived", [](const OrderContext &ctx) { return ctx.paymentReceived; });
    registry->registerCondition("PackingComplete", [](const OrderContext &ctx) { return ctx.packingComplete; });
    registry->registerCondition("Shipped", [](const OrderContext &ctx) { return ctx.shipped; });
    registry->registerCondition("Delivered", [](const OrderContext &ctx) { return ctx.delivered; });
    registry->registerCondition("CancelRequested", [](const OrderContext &ctx) { return ctx.cancelRequested; });
    registry->registerCondition("ReturnRequested", [](const OrderContext &ctx) { return ctx.returnRequested; });

    auto notify = [](OrderContext &, OrderState from, OrderState to) {
        std::cout << "  Customer notified: " << DFSM::stateName(from) << " -> " << DFSM::stateName(to) << "\n";
    };
    registry->registerSideEffect("NotifyShipment", notify);
    registry->registerSideEffect("NotifyDelivery", notify);
    registry->registerSideEffect("NotifyCancel", notify);
    registry->registerSideEffect("NotifyReturn", notify);
    return registry;
}

static OrderBuilder createBuilder(std::shared_ptr<const OrderRegistry> registry) {
    auto builder = OrderBuilder::create("Order");
    builder.withInitialState(OrderState::Created)
        .withRegistry(std::move(registry))
        .addTransition(OrderState::Created, OrderState::Paid)
        .when("PaymentReceived")
        .done()
        .addTransition(OrderState::Paid, OrderState::Packed)
        .when("PackingComplete")
        .done()
        .addTransition(OrderState::Packed, OrderState::Shipped)
        .when("Shipped")
        .withSideEffect("NotifyShipment")
        .done()
        .addTransition(OrderState::Shipped, OrderState::Delivered)
        .when("Delivered")
        .withSideEffect("NotifyDelivery")
        .done();

    for (OrderState from : {OrderState::Created, OrderState::Paid, OrderState::Packed, OrderState::Shipped}) {
        builder.addTransition(from, OrderState::Cancelled).when("CancelRequested").withSideEffect("NotifyCancel").done();
    }

    builder.addTransition(OrderState::Delivered, OrderState::Returned)
        .when("ReturnRequested")
        .withSideEffect("NotifyReturn")
        .done();
    return builder;
}

static void attempt(OrderMachine &machine, OrderState target, OrderContext &context) {
    bool moved = machine.tryTransitionTo(target, context);
    std::cout << "  -> " << DFSM::stateName(target) << ": " << (moved ? "ok" : "rejected") << ", now "
              << DFSM::stateName(machine.current()) << "\n";
}

int main() {
    DFSM::Logger::initialize();
    DFSM::Logger::setLevel(DFSM::LogLevel::Warn);

    try {
        auto registry = createRegistry();
        OrderBuilder builder = createBuilder(registry);

        std::string persisted = DFSM::DefinitionJsonCodec::toJson(builder.toSerializable());
        std::cout << "=== Persisted definition ===\n" << persisted << "\n\n";

        // Reload from the persisted form and run the happy path
        auto definition =
            OrderBuilder::fromSerializable(DFSM::DefinitionJsonCodec::fromJson(persisted), registry).build();
        OrderMachine machine(definition);
        OrderContext context;

        std::cout << "=== Order lifecycle ===\n";
        attempt(machine, OrderState::Packed, context);

        context.paymentReceived = true;
        attempt(machine, OrderState::Paid, context);

        context.packingComplete = true;
        attempt(machine, OrderState::Packed, context);

        context.shipped = true;
        attempt(machine, OrderState::Shipped, context);

        context.delivered = true;
        attempt(machine, OrderState::Delivered, context);

        context.returnRequested = true;
        attempt(machine, OrderState::Returned, context);
    } catch (const DFSM::FsmException &e) {
        std::cerr << "Order workflow failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
