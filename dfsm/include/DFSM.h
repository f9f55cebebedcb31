// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

/**
 * @file DFSM.h
 * @brief Convenience header pulling in the public DFSM API
 */

#include "common/FsmError.h"
#include "common/Logger.h"
#include "model/State.h"
#include "model/StateMachineDefinition.h"
#include "model/Transition.h"
#include "model/TransitionRegistry.h"
#include "runtime/FiniteStateMachine.h"
#include "runtime/FiniteStateMachineBuilder.h"
#include "runtime/IStateMachine.h"
#include "serialization/DefinitionJsonCodec.h"
#include "serialization/LoadOptions.h"
#include "serialization/SerializableStateMachine.h"
