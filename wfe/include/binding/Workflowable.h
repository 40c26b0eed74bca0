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

#include "builder/SpecificationRegistry.h"
#include "runtime/WorkflowInstance.h"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace WFE {

/**
 * @brief Base class giving a host object its own workflow instance
 *
 * The host names a registered specification and exposes the event surface
 * through fire()/fireOrThrow(). Routines reach the host with hostOf().
 *
 * @code
 * class Article : public WFE::Workflowable {
 * public:
 *     Article() : Workflowable("Article") {}
 *
 * protected:
 *     void persistWorkflowState(const std::string &state) override { db_.saveState(id_, state); }
 * };
 *
 * Article article;
 * article.fire("submit");
 * article.is("awaiting_review");  // true
 * @endcode
 */
class Workflowable {
public:
    /**
     * @brief Bind to a specification by name
     * @throws WorkflowError if the registry has no specification of that name
     */
    explicit Workflowable(const std::string &specificationName,
                          SpecificationRegistry &registry = SpecificationRegistry::getInstance());

    explicit Workflowable(std::shared_ptr<const Specification> specification);

    Workflowable(const Workflowable &other);
    Workflowable &operator=(const Workflowable &other);

    virtual ~Workflowable() = default;

    /**
     * @brief Fire an event; a halt is reported through the returned outcome
     *
     * Arguments are handed to every routine by reference, so changes made by a
     * routine are visible to the caller afterwards.
     *
     * @throws UndefinedTransitionError if the event is not legal in the current state
     */
    TransitionOutcome fire(const std::string &eventName);
    TransitionOutcome fire(const std::string &eventName, EventArgs &args);
    TransitionOutcome fire(const std::string &eventName, EventArgs &&args);

    /**
     * @brief Fire an event; a halt is reported by throwing HaltedError
     */
    TransitionOutcome fireOrThrow(const std::string &eventName);
    TransitionOutcome fireOrThrow(const std::string &eventName, EventArgs &args);
    TransitionOutcome fireOrThrow(const std::string &eventName, EventArgs &&args);

    const std::string &currentState() const {
        return workflow_.getCurrentState();
    }

    bool is(const std::string &stateName) const {
        return workflow_.isState(stateName);
    }

    bool can(const std::string &eventName) const {
        return workflow_.canFire(eventName);
    }

    bool isHalted() const {
        return workflow_.isHalted();
    }

    const std::optional<std::string> &haltedBecause() const {
        return workflow_.getHaltedReason();
    }

    std::vector<std::string> availableEvents() const {
        return workflow_.getAvailableEvents();
    }

    /**
     * @brief Set the current state from storage before the first fire
     * @throws UnknownStateError if the state is not declared
     */
    void loadWorkflowState(const std::string &stateName);

    WorkflowInstance &workflow() {
        return workflow_;
    }

    const WorkflowInstance &workflow() const {
        return workflow_;
    }

    /**
     * @brief Recover the host object inside a routine
     * @throws std::bad_cast if the instance belongs to a host of another type
     * @throws std::invalid_argument if the instance has no Workflowable host
     */
    template <typename Host> static Host &hostOf(WorkflowInstance &instance) {
        Workflowable *host = instance.getHost<Workflowable>();
        if (!host) {
            throw std::invalid_argument("Workflow instance of '" + instance.getSpecificationName() +
                                        "' is not owned by a Workflowable");
        }
        return dynamic_cast<Host &>(*host);
    }

protected:
    /**
     * @brief Called with the new state as soon as a transition moves the instance
     *
     * Runs after on_exit of the source state and before on_entry of the target.
     * Not called for halted firings or loadWorkflowState(). Default does nothing;
     * override to write the state to a backing record.
     */
    virtual void persistWorkflowState(const std::string &stateName);

private:
    void bindHost();

    WorkflowInstance workflow_;
};

}  // namespace WFE
