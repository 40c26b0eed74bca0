// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-WFE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of WFE (Workflow Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE in the repository root

#pragma once

#include "model/WorkflowTypes.h"
#include "runtime/TransitionOutcome.h"
#include <memory>
#include <string>

namespace WFE {

class EventDefinition;
class StateDefinition;

/**
 * @brief Runs one event against one WorkflowInstance
 *
 * Resolution happens first and throws before any routine runs:
 * UndefinedTransitionError if the current state has no such event,
 * UnresolvedTargetError if the event points at an undeclared state.
 *
 * The firing sequence is fixed:
 *  1. clear the instance's halt status
 *  2. run the event action (may halt)
 *  3. stop here if halted
 *  4. run every on_transition hook in registration order
 *  5. run on_exit of the source state
 *  6. move the instance to the target state and notify its state-change listener
 *  7. run on_entry of the target state
 *
 * Any other exception raised by a routine propagates to the caller. The
 * state is unchanged if it escapes before step 6.
 */
class TransitionExecutor {
public:
    /**
     * @brief Resolved firing plan for an event in the instance's current state
     */
    struct Resolution {
        const StateDefinition *source = nullptr;
        const StateDefinition *target = nullptr;
        std::shared_ptr<const EventDefinition> event;
    };

    /**
     * @brief Look up the event and its target without running anything
     * @throws UndefinedTransitionError, UnresolvedTargetError
     */
    static Resolution resolve(const WorkflowInstance &instance, const std::string &eventName);

    /**
     * @brief Fire an event and report the outcome
     * @param instance Instance to transition
     * @param eventName Event to fire
     * @param args Arguments shared by every routine of this firing
     * @return Outcome; halted outcomes convert to false
     * @throws UndefinedTransitionError, UnresolvedTargetError, or whatever a routine throws
     */
    static TransitionOutcome execute(WorkflowInstance &instance, const std::string &eventName, EventArgs &args);
};

}  // namespace WFE
