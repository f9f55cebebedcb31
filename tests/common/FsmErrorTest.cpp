#include "common/FsmError.h"
#include <gtest/gtest.h>
#include <string>

namespace DFSM {

TEST(FsmErrorTest, WhatIsPrefixedWithCodeName) {
    FsmException error(ErrorCode::UnknownCondition, "Condition 'Paid' not found in registry");

    EXPECT_EQ(ErrorCode::UnknownCondition, error.code());
    EXPECT_STREQ("UnknownCondition: Condition 'Paid' not found in registry", error.what());
}

TEST(FsmErrorTest, EveryCodeHasAName) {
    const ErrorCode codes[] = {ErrorCode::InvalidConfiguration, ErrorCode::MissingInitialState,
                               ErrorCode::UnknownCondition,     ErrorCode::UnknownSideEffect,
                               ErrorCode::UnknownStateName,     ErrorCode::NullContext,
                               ErrorCode::StructuralIntegrity,  ErrorCode::MalformedDocument};

    for (ErrorCode code : codes) {
        EXPECT_NE(std::string("Unknown"), errorCodeToString(code));
    }
    EXPECT_STREQ("NullContext", errorCodeToString(ErrorCode::NullContext));
}

TEST(FsmErrorTest, CatchableAsRuntimeError) {
    try {
        throw FsmException(ErrorCode::MissingInitialState, "no initial state");
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("MissingInitialState"));
        return;
    }
    FAIL() << "FsmException not caught as std::runtime_error";
}

}  // namespace DFSM
