#include "common/FsmError.h"
#include "fixtures/TestStates.h"
#include "runtime/FiniteStateMachine.h"
#include "runtime/FiniteStateMachineBuilder.h"
#include "serialization/DefinitionJsonCodec.h"
#include <gtest/gtest.h>

namespace DFSM {

using Test::TicketContext;
using Test::TicketState;

class DefinitionJsonCodecTest : public ::testing::Test {
protected:
    static SerializableStateMachine sampleDto() {
        SerializableStateMachine dto;
        dto.entityLabel = "Ticket";
        dto.initialState = "Open";
        dto.states = {"Open", "InProgress", "Resolved"};
        dto.transitions = {
            SerializableTransition{"Open", "InProgress", "AgentAssigned", std::nullopt},
            SerializableTransition{"InProgress", "Resolved", std::nullopt, "Notify"},
            SerializableTransition{"Resolved", "Open", std::nullopt, std::nullopt},
        };
        return dto;
    }

    static void expectMalformed(const std::string &text) {
        try {
            (void)DefinitionJsonCodec::fromJson(text);
            FAIL() << "expected MalformedDocument for: " << text;
        } catch (const FsmException &e) {
            EXPECT_EQ(ErrorCode::MalformedDocument, e.code()) << e.what();
        }
    }
};

TEST_F(DefinitionJsonCodecTest, EncodesDocumentedFieldNames) {
    json value = DefinitionJsonCodec::toJsonValue(sampleDto());

    EXPECT_EQ("Ticket", value["entityLabel"]);
    EXPECT_EQ("Open", value["initialState"]);
    ASSERT_TRUE(value["states"].is_array());
    EXPECT_EQ("InProgress", value["states"][1]);
    ASSERT_EQ(3u, value["transitions"].size());
    EXPECT_EQ("AgentAssigned", value["transitions"][0]["conditionName"]);
    EXPECT_EQ("Notify", value["transitions"][1]["sideEffectName"]);
}

TEST_F(DefinitionJsonCodecTest, AbsentNamesAreOmitted) {
    json value = DefinitionJsonCodec::toJsonValue(sampleDto());

    EXPECT_FALSE(value["transitions"][0].contains("sideEffectName"));
    EXPECT_FALSE(value["transitions"][2].contains("conditionName"));
    EXPECT_FALSE(value["transitions"][2].contains("sideEffectName"));
}

TEST_F(DefinitionJsonCodecTest, DecodeOfEncodeIsIdentity) {
    SerializableStateMachine dto = sampleDto();

    EXPECT_EQ(dto, DefinitionJsonCodec::fromJson(DefinitionJsonCodec::toJson(dto)));
    EXPECT_EQ(dto, DefinitionJsonCodec::fromJson(DefinitionJsonCodec::toJson(dto, false)));
}

TEST_F(DefinitionJsonCodecTest, NullNamesAndMissingTransitionsAreAccepted) {
    auto dto = DefinitionJsonCodec::fromJson(R"({
        "entityLabel": "Ticket",
        "initialState": "Open",
        "states": ["Open"]
    })");
    EXPECT_TRUE(dto.transitions.empty());

    dto = DefinitionJsonCodec::fromJson(R"({
        "entityLabel": "Ticket",
        "initialState": "Open",
        "states": ["Open", "Closed"],
        "transitions": [{"from": "Open", "to": "Closed", "conditionName": null, "sideEffectName": null}]
    })");
    ASSERT_EQ(1u, dto.transitions.size());
    EXPECT_FALSE(dto.transitions[0].conditionName.has_value());
    EXPECT_FALSE(dto.transitions[0].sideEffectName.has_value());
}

TEST_F(DefinitionJsonCodecTest, MalformedDocumentsAreRejected) {
    expectMalformed("");
    expectMalformed("{not json");
    expectMalformed("[]");
    expectMalformed(R"({"initialState": "Open", "states": []})");
    expectMalformed(R"({"entityLabel": "T", "initialState": 3, "states": []})");
    expectMalformed(R"({"entityLabel": "T", "initialState": "Open", "states": "Open"})");
    expectMalformed(R"({"entityLabel": "T", "initialState": "Open", "states": [], "transitions": [{"from": "Open"}]})");
    expectMalformed(
        R"({"entityLabel": "T", "initialState": "Open", "states": [], "transitions": [{"from": "Open", "to": "Open", "conditionName": 1}]})");
}

TEST_F(DefinitionJsonCodecTest, InvalidUtf8IsReportedAsMalformedOnEncode) {
    SerializableStateMachine dto = sampleDto();
    dto.entityLabel = "Ticket\xff";

    for (bool pretty : {true, false}) {
        try {
            (void)DefinitionJsonCodec::toJson(dto, pretty);
            FAIL() << "expected MalformedDocument";
        } catch (const FsmException &e) {
            EXPECT_EQ(ErrorCode::MalformedDocument, e.code()) << e.what();
        }
    }

    dto = sampleDto();
    dto.transitions[0].conditionName = std::string("Agent\xc3");
    EXPECT_THROW((void)DefinitionJsonCodec::toJson(dto), FsmException);
}

TEST_F(DefinitionJsonCodecTest, PersistedTicketWorkflowRunsAfterReload) {
    auto registry = std::make_shared<TransitionRegistry<TicketState, TicketContext>>();
    registry->registerCondition("AgentAssigned", [](const TicketContext &ctx) { return ctx.agentAssigned; });

    auto builder = FiniteStateMachineBuilder<TicketState, TicketContext>::create("Ticket");
    builder.withInitialState(TicketState::Open)
        .withRegistry(registry)
        .addTransition(TicketState::Open, TicketState::InProgress)
        .when("AgentAssigned")
        .done()
        .addTransition(TicketState::InProgress, TicketState::Resolved)
        .done();

    std::string persisted = DefinitionJsonCodec::toJson(builder.toSerializable());
    auto reloaded = FiniteStateMachineBuilder<TicketState, TicketContext>::fromSerializable(
        DefinitionJsonCodec::fromJson(persisted), registry);

    FiniteStateMachine<TicketState, TicketContext> machine(reloaded.build());
    TicketContext context;
    EXPECT_FALSE(machine.tryTransitionTo(TicketState::InProgress, context));
    context.agentAssigned = true;
    EXPECT_TRUE(machine.tryTransitionTo(TicketState::InProgress, context));
    EXPECT_TRUE(machine.tryTransitionTo(TicketState::Resolved, context));
}

}  // namespace DFSM
