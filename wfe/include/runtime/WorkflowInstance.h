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

#include "model/Specification.h"
#include "model/WorkflowTypes.h"
#include "runtime/TransitionOutcome.h"
#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace WFE {

/**
 * @brief A Specification bound to one current state
 *
 * Typically embedded in a host object (see Workflowable). The current state
 * only changes through fire()/fireOrThrow(), or through restoreState() when
 * a persistence layer loads a stored state before the first fire.
 *
 * Not thread-safe: concurrent fire() calls on one instance need external
 * synchronization.
 */
class WorkflowInstance {
public:
    /**
     * @brief Bind a specification, starting in its initial state
     * @throws std::invalid_argument if specification is null
     * @throws WorkflowError if the specification declares no states
     */
    explicit WorkflowInstance(std::shared_ptr<const Specification> specification);

    /**
     * @brief Bind a specification, starting in a previously stored state
     * @throws UnknownStateError if stateName is not declared
     */
    WorkflowInstance(std::shared_ptr<const Specification> specification, const std::string &stateName);

    const std::string &getCurrentState() const {
        return currentState_;
    }

    const StateDefinition &getCurrentStateDefinition() const;

    bool isState(const std::string &stateName) const {
        return currentState_ == stateName;
    }

    /**
     * @brief Whether the current state was declared before the given one
     * @throws UnknownStateError if stateName is not declared
     */
    bool isBefore(const std::string &stateName) const;

    /**
     * @brief Whether the current state was declared after the given one
     * @throws UnknownStateError if stateName is not declared
     */
    bool isAfter(const std::string &stateName) const;

    /**
     * @brief Whether the last fire attempt was halted by its action
     */
    bool isHalted() const {
        return halted_;
    }

    /**
     * @brief Reason passed to halt() in the last fire attempt, if any
     */
    const std::optional<std::string> &getHaltedReason() const {
        return haltedReason_;
    }

    /**
     * @brief Whether the current state defines the event
     */
    bool canFire(const std::string &eventName) const;

    /**
     * @brief Events legal in the current state, in declaration order
     */
    std::vector<std::string> getAvailableEvents() const;

    /**
     * @brief Fire an event, reporting a halt through the returned outcome
     * @throws UndefinedTransitionError if the event is not legal in the current state
     * @throws UnresolvedTargetError if the event's target state is not declared
     */
    TransitionOutcome fire(const std::string &eventName);
    TransitionOutcome fire(const std::string &eventName, EventArgs &args);
    TransitionOutcome fire(const std::string &eventName, EventArgs &&args);

    /**
     * @brief Fire an event, reporting a halt by throwing HaltedError
     *
     * isHalted()/getHaltedReason() are set exactly as with fire().
     */
    TransitionOutcome fireOrThrow(const std::string &eventName);
    TransitionOutcome fireOrThrow(const std::string &eventName, EventArgs &args);
    TransitionOutcome fireOrThrow(const std::string &eventName, EventArgs &&args);

    /**
     * @brief Set the current state from external storage, running no hooks
     * @throws UnknownStateError if stateName is not declared
     */
    void restoreState(const std::string &stateName);

    const std::shared_ptr<const Specification> &getSpecification() const {
        return specification_;
    }

    const std::string &getSpecificationName() const {
        return specification_->getName();
    }

    /**
     * @brief Attach the object that owns this instance, for use by routines
     * @param host Typically a pointer to the owning object
     */
    void setHost(std::any host) {
        host_ = std::move(host);
    }

    /**
     * @brief Owning object stored as a T*
     * @return The host pointer, nullptr if none is set or it is not a T*
     */
    template <typename T> T *getHost() const {
        const auto *host = std::any_cast<T *>(&host_);
        return host ? *host : nullptr;
    }

    /**
     * @brief Called with the new state right after a transition moves the instance
     *
     * Runs after on_exit of the source and before on_entry of the target, so the
     * stored state matches the instance even when on_entry fails. restoreState()
     * does not call it.
     */
    using StateChangeListener = std::function<void(const std::string &stateName)>;

    void setStateChangeListener(StateChangeListener listener) {
        stateChangeListener_ = std::move(listener);
    }

private:
    friend class ActionContext;
    friend class TransitionExecutor;

    void clearHalt();
    void markHalted(std::optional<std::string> reason);
    void moveTo(const std::string &stateName);
    void notifyStateChanged();

    std::shared_ptr<const Specification> specification_;
    std::string currentState_;
    bool halted_ = false;
    std::optional<std::string> haltedReason_;
    std::any host_;
    StateChangeListener stateChangeListener_;
};

}  // namespace WFE
