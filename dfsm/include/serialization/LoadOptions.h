// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 DFSM contributors
//
// This file is part of DFSM (Declarative Finite State Machine).

#pragma once

namespace DFSM {

/**
 * @brief How loadFrom() treats guard/side-effect names missing from the registry
 */
enum class NameResolution {
    Lenient,  // Missing condition -> always eligible, missing side effect -> no-op, logged as a warning
    Strict    // Missing names throw UnknownCondition / UnknownSideEffect
};

struct LoadOptions {
    NameResolution nameResolution = NameResolution::Lenient;
};

}  // namespace DFSM
