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
#include <any>
#include <cstddef>
#include <optional>
#include <string>

namespace WFE {

class EventDefinition;

namespace detail {

/**
 * @brief Unwinds an action after halt(); caught by TransitionExecutor only
 *
 * Deliberately not a std::exception so that action code catching
 * std::exception does not intercept it.
 */
struct HaltSignal {};

}  // namespace detail

/**
 * @brief Execution scope handed to an event action
 *
 * Gives the action its instance, the event being fired, the shared argument
 * list, and the halt capability.
 *
 * @code
 * s.event("accept", "accepted", {}, [](WFE::ActionContext &ctx) {
 *     if (!ctx.arg<Review>(0).approved) {
 *         ctx.halt("review not approved");
 *     }
 * });
 * @endcode
 */
class ActionContext {
public:
    ActionContext(WorkflowInstance &instance, const EventDefinition &event, EventArgs &args);

    ActionContext(const ActionContext &) = delete;
    ActionContext &operator=(const ActionContext &) = delete;

    WorkflowInstance &getInstance() {
        return instance_;
    }

    const std::string &getEventName() const;

    /**
     * @brief State the instance is leaving
     */
    const std::string &getFromState() const;

    /**
     * @brief State the event transitions to if the action does not halt
     */
    const std::string &getToState() const;

    EventArgs &getArgs() {
        return args_;
    }

    /**
     * @brief Typed access to one argument, by reference into the shared list
     * @throws std::out_of_range if index is past the end
     * @throws std::bad_any_cast if the argument does not hold a T
     */
    template <typename T> T &arg(size_t index) {
        return std::any_cast<T &>(args_.at(index));
    }

    /**
     * @brief Abort the transition without a reason
     *
     * Marks the instance halted and leaves the action immediately. No hook
     * runs and the current state stays as it was.
     */
    [[noreturn]] void halt();

    /**
     * @brief Abort the transition, recording why
     * @param reason Reported by WorkflowInstance::getHaltedReason()
     */
    [[noreturn]] void halt(const std::string &reason);

private:
    [[noreturn]] void raiseHalt(std::optional<std::string> reason);

    WorkflowInstance &instance_;
    const EventDefinition &event_;
    EventArgs &args_;
};

}  // namespace WFE
