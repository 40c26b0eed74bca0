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

#include <any>
#include <functional>
#include <string>
#include <vector>

namespace WFE {

class ActionContext;
class WorkflowInstance;

/**
 * @brief Arguments handed to fire()
 *
 * One container is shared by reference with the action and every hook of a
 * single firing, so a routine that modifies an element (or an object an
 * element points to) is observed by the routines that run after it.
 */
using EventArgs = std::vector<std::any>;

/**
 * @brief Event action, run before any transition hook
 *
 * May abort the transition through ActionContext::halt().
 */
using ActionRoutine = std::function<void(ActionContext &context)>;

/**
 * @brief State entry hook
 * @param priorState State the instance came from
 */
using EntryRoutine = std::function<void(WorkflowInstance &instance, const std::string &priorState,
                                        const std::string &eventName, EventArgs &args)>;

/**
 * @brief State exit hook
 * @param newState State the instance is about to enter
 */
using ExitRoutine = std::function<void(WorkflowInstance &instance, const std::string &newState,
                                       const std::string &eventName, EventArgs &args)>;

/**
 * @brief Specification-wide hook fired for every non-halted transition
 */
using TransitionRoutine = std::function<void(WorkflowInstance &instance, const std::string &fromState,
                                             const std::string &toState, const std::string &eventName,
                                             EventArgs &args)>;

}  // namespace WFE
