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

#include "runtime/WorkflowInstance.h"
#include "common/WorkflowErrors.h"
#include "runtime/TransitionExecutor.h"
#include <stdexcept>

namespace WFE {

namespace {
std::shared_ptr<const Specification> requireStates(std::shared_ptr<const Specification> specification) {
    if (!specification) {
        throw std::invalid_argument("WorkflowInstance: specification cannot be null");
    }
    if (specification->getStateCount() == 0) {
        throw WorkflowError("Workflow '" + specification->getName() + "' declares no states");
    }
    return specification;
}
}  // namespace

WorkflowInstance::WorkflowInstance(std::shared_ptr<const Specification> specification)
    : specification_(requireStates(std::move(specification))) {
    currentState_ = specification_->getInitialState();
}

WorkflowInstance::WorkflowInstance(std::shared_ptr<const Specification> specification, const std::string &stateName)
    : specification_(requireStates(std::move(specification))) {
    restoreState(stateName);
}

const StateDefinition &WorkflowInstance::getCurrentStateDefinition() const {
    const StateDefinition *state = specification_->findState(currentState_);
    if (!state) {
        throw UnknownStateError(specification_->getName(), currentState_);
    }
    return *state;
}

bool WorkflowInstance::isBefore(const std::string &stateName) const {
    return specification_->compareStates(currentState_, stateName) < 0;
}

bool WorkflowInstance::isAfter(const std::string &stateName) const {
    return specification_->compareStates(currentState_, stateName) > 0;
}

bool WorkflowInstance::canFire(const std::string &eventName) const {
    return getCurrentStateDefinition().hasEvent(eventName);
}

std::vector<std::string> WorkflowInstance::getAvailableEvents() const {
    return getCurrentStateDefinition().getEventNames();
}

TransitionOutcome WorkflowInstance::fire(const std::string &eventName) {
    EventArgs args;
    return fire(eventName, args);
}

TransitionOutcome WorkflowInstance::fire(const std::string &eventName, EventArgs &args) {
    return TransitionExecutor::execute(*this, eventName, args);
}

TransitionOutcome WorkflowInstance::fire(const std::string &eventName, EventArgs &&args) {
    return fire(eventName, args);
}

TransitionOutcome WorkflowInstance::fireOrThrow(const std::string &eventName) {
    EventArgs args;
    return fireOrThrow(eventName, args);
}

TransitionOutcome WorkflowInstance::fireOrThrow(const std::string &eventName, EventArgs &args) {
    TransitionOutcome outcome = fire(eventName, args);
    if (outcome.halted()) {
        throw HaltedError(outcome.fromState, outcome.eventName, outcome.haltedReason);
    }
    return outcome;
}

TransitionOutcome WorkflowInstance::fireOrThrow(const std::string &eventName, EventArgs &&args) {
    return fireOrThrow(eventName, args);
}

void WorkflowInstance::restoreState(const std::string &stateName) {
    if (!specification_->hasState(stateName)) {
        throw UnknownStateError(specification_->getName(), stateName);
    }
    currentState_ = stateName;
    clearHalt();
}

void WorkflowInstance::clearHalt() {
    halted_ = false;
    haltedReason_.reset();
}

void WorkflowInstance::markHalted(std::optional<std::string> reason) {
    halted_ = true;
    haltedReason_ = std::move(reason);
}

void WorkflowInstance::moveTo(const std::string &stateName) {
    currentState_ = stateName;
}

void WorkflowInstance::notifyStateChanged() {
    if (stateChangeListener_) {
        stateChangeListener_(currentState_);
    }
}

}  // namespace WFE
