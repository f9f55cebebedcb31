#include "fixtures/TestStates.h"
#include "runtime/FiniteStateMachineBuilder.h"
#include <gtest/gtest.h>

namespace DFSM {

using Test::TicketContext;
using Test::TicketState;

using TicketBuilder = FiniteStateMachineBuilder<TicketState, TicketContext>;
using TicketRegistry = TransitionRegistry<TicketState, TicketContext>;

class FiniteStateMachineBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto registry = std::make_shared<TicketRegistry>();
        registry->registerCondition("AgentAssigned", [](const TicketContext &ctx) { return ctx.agentAssigned; });
        registry->registerSideEffect("Notify", [](TicketContext &ctx) { ctx.notifications++; });
        registry_ = registry;
    }

    template <typename Fn> static void expectError(ErrorCode expected, Fn &&fn) {
        try {
            fn();
            FAIL() << "expected " << errorCodeToString(expected);
        } catch (const FsmException &e) {
            EXPECT_EQ(expected, e.code()) << e.what();
        }
    }

    std::shared_ptr<const TicketRegistry> registry_;
};

TEST_F(FiniteStateMachineBuilderTest, CreateSetsEntityLabel) {
    auto builder = TicketBuilder::create("Ticket");
    auto definition = builder.withInitialState(TicketState::Open).build();

    EXPECT_EQ("Ticket", definition->entityLabel());
    EXPECT_EQ("Open", definition->initialState().name());
}

TEST_F(FiniteStateMachineBuilderTest, BuildWithoutInitialStateFailsRegardlessOfTransitions) {
    auto builder = TicketBuilder::create("Ticket");
    expectError(ErrorCode::MissingInitialState, [&] { (void)builder.build(); });

    builder.addTransition(TicketState::Open, TicketState::InProgress).done();
    builder.addTransition(TicketState::InProgress, TicketState::Resolved).done();
    expectError(ErrorCode::MissingInitialState, [&] { (void)builder.build(); });
    expectError(ErrorCode::MissingInitialState, [&] { (void)builder.toSerializable(); });
}

TEST_F(FiniteStateMachineBuilderTest, InitialStateIsAlwaysInStateSet) {
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Resolved).withInitialState(TicketState::Resolved);
    auto definition = builder.build();

    ASSERT_EQ(1u, definition->states().size());
    EXPECT_TRUE(definition->hasState(definition->initialState()));
}

TEST_F(FiniteStateMachineBuilderTest, AddTransitionAddsBothEndpointsOnce) {
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Open)
        .addTransition(TicketState::Open, TicketState::InProgress)
        .done()
        .addTransition(TicketState::InProgress, TicketState::Open)
        .done();
    auto definition = builder.build();

    ASSERT_EQ(2u, definition->states().size());
    EXPECT_EQ("Open", definition->states()[0].name());
    EXPECT_EQ("InProgress", definition->states()[1].name());
    EXPECT_EQ(2u, definition->transitions().size());
}

TEST_F(FiniteStateMachineBuilderTest, TransitionWithoutDoneIsDiscarded) {
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Open);
    builder.addTransition(TicketState::Open, TicketState::Closed);

    auto definition = builder.build();
    EXPECT_TRUE(definition->transitions().empty());
    // The endpoints were still registered as states
    EXPECT_TRUE(definition->hasState(TicketState::Closed));
}

TEST_F(FiniteStateMachineBuilderTest, InlineGuardAndSideEffectKeepTheirNames) {
    bool effectCalled = false;
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Open)
        .addTransition(TicketState::Open, TicketState::InProgress)
        .when([](const TicketContext &ctx) { return ctx.agentAssigned; }, "AgentAssigned")
        .withSideEffect([&](TicketContext &, TicketState, TicketState) { effectCalled = true; }, "Effect")
        .done();

    auto definition = builder.build();
    ASSERT_EQ(1u, definition->transitions().size());
    const auto &transition = definition->transitions().front();

    TicketContext context;
    context.agentAssigned = true;
    EXPECT_TRUE(transition.isEligible(context));
    transition.apply(context);
    EXPECT_TRUE(effectCalled);
    EXPECT_EQ(std::optional<std::string>("AgentAssigned"), transition.conditionName());
    EXPECT_EQ(std::optional<std::string>("Effect"), transition.sideEffectName());
}

TEST_F(FiniteStateMachineBuilderTest, UnnamedInlineGuardHasNoName) {
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Open)
        .addTransition(TicketState::Open, TicketState::InProgress)
        .when([](const TicketContext &) { return false; })
        .done();

    auto definition = builder.build();
    EXPECT_FALSE(definition->transitions().front().conditionName().has_value());
    EXPECT_FALSE(definition->transitions().front().isEligible(TicketContext{}));
}

TEST_F(FiniteStateMachineBuilderTest, NamedGuardAndSideEffectResolveThroughRegistry) {
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Open)
        .withRegistry(registry_)
        .addTransition(TicketState::Open, TicketState::InProgress)
        .when("AgentAssigned")
        .withSideEffect("Notify")
        .done();

    auto definition = builder.build();
    const auto &transition = definition->transitions().front();
    TicketContext context;
    EXPECT_FALSE(transition.isEligible(context));
    context.agentAssigned = true;
    EXPECT_TRUE(transition.isEligible(context));

    transition.apply(context);
    EXPECT_EQ(1, context.notifications);
    EXPECT_EQ(std::optional<std::string>("AgentAssigned"), transition.conditionName());
    EXPECT_EQ(std::optional<std::string>("Notify"), transition.sideEffectName());
}

TEST_F(FiniteStateMachineBuilderTest, NullRegistryIsInvalidConfiguration) {
    auto builder = TicketBuilder::create("Ticket");
    expectError(ErrorCode::InvalidConfiguration, [&] { builder.withRegistry(nullptr); });
}

TEST_F(FiniteStateMachineBuilderTest, NameOnlyOverloadsRequireRegistry) {
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Open);

    expectError(ErrorCode::InvalidConfiguration,
                [&] { builder.addTransition(TicketState::Open, TicketState::InProgress).when("AgentAssigned"); });
    expectError(ErrorCode::InvalidConfiguration,
                [&] { builder.addTransition(TicketState::Open, TicketState::InProgress).withSideEffect("Notify"); });
}

TEST_F(FiniteStateMachineBuilderTest, UnknownNamesAreRejected) {
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Open).withRegistry(registry_);

    expectError(ErrorCode::UnknownCondition,
                [&] { builder.addTransition(TicketState::Open, TicketState::InProgress).when("Missing"); });
    expectError(ErrorCode::UnknownSideEffect,
                [&] { builder.addTransition(TicketState::Open, TicketState::InProgress).withSideEffect("Missing"); });
    EXPECT_TRUE(builder.transitions().empty());
}

TEST_F(FiniteStateMachineBuilderTest, BuildSnapshotsAreIndependent) {
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Open).addTransition(TicketState::Open, TicketState::InProgress).done();
    auto first = builder.build();

    builder.addTransition(TicketState::InProgress, TicketState::Resolved).done();
    auto second = builder.build();

    EXPECT_NE(first.get(), second.get());
    EXPECT_EQ(1u, first->transitions().size());
    EXPECT_EQ(2u, first->states().size());
    EXPECT_EQ(2u, second->transitions().size());
    EXPECT_EQ(3u, second->states().size());
}

TEST_F(FiniteStateMachineBuilderTest, ToSerializableWritesNamesOnly) {
    auto builder = TicketBuilder::create("Ticket");
    builder.withInitialState(TicketState::Open)
        .withRegistry(registry_)
        .addTransition(TicketState::Open, TicketState::InProgress)
        .when("AgentAssigned")
        .done()
        .addTransition(TicketState::InProgress, TicketState::Resolved)
        .when([](const TicketContext &) { return true; })
        .withSideEffect("Notify")
        .done();

    SerializableStateMachine dto = builder.toSerializable();

    EXPECT_EQ("Ticket", dto.entityLabel);
    EXPECT_EQ("Open", dto.initialState);
    EXPECT_EQ((std::vector<std::string>{"Open", "InProgress", "Resolved"}), dto.states);
    ASSERT_EQ(2u, dto.transitions.size());
    EXPECT_EQ("Open", dto.transitions[0].from);
    EXPECT_EQ("InProgress", dto.transitions[0].to);
    EXPECT_EQ(std::optional<std::string>("AgentAssigned"), dto.transitions[0].conditionName);
    EXPECT_FALSE(dto.transitions[0].sideEffectName.has_value());
    EXPECT_FALSE(dto.transitions[1].conditionName.has_value());
    EXPECT_EQ(std::optional<std::string>("Notify"), dto.transitions[1].sideEffectName);
}

}  // namespace DFSM
