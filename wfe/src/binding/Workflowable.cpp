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

#include "binding/Workflowable.h"
#include "common/Logger.h"
#include "common/WorkflowErrors.h"

namespace WFE {

namespace {
std::shared_ptr<const Specification> lookup(const std::string &specificationName, SpecificationRegistry &registry) {
    auto specification = registry.find(specificationName);
    if (!specification) {
        throw WorkflowError("No workflow named '" + specificationName + "' has been declared");
    }
    return specification;
}
}  // namespace

Workflowable::Workflowable(const std::string &specificationName, SpecificationRegistry &registry)
    : workflow_(lookup(specificationName, registry)) {
    bindHost();
}

Workflowable::Workflowable(std::shared_ptr<const Specification> specification) : workflow_(std::move(specification)) {
    bindHost();
}

Workflowable::Workflowable(const Workflowable &other) : workflow_(other.workflow_) {
    bindHost();
}

Workflowable &Workflowable::operator=(const Workflowable &other) {
    if (this != &other) {
        workflow_ = other.workflow_;
        bindHost();
    }
    return *this;
}

TransitionOutcome Workflowable::fire(const std::string &eventName) {
    return workflow_.fire(eventName);
}

TransitionOutcome Workflowable::fire(const std::string &eventName, EventArgs &args) {
    return workflow_.fire(eventName, args);
}

TransitionOutcome Workflowable::fire(const std::string &eventName, EventArgs &&args) {
    return workflow_.fire(eventName, args);
}

TransitionOutcome Workflowable::fireOrThrow(const std::string &eventName) {
    return workflow_.fireOrThrow(eventName);
}

TransitionOutcome Workflowable::fireOrThrow(const std::string &eventName, EventArgs &args) {
    return workflow_.fireOrThrow(eventName, args);
}

TransitionOutcome Workflowable::fireOrThrow(const std::string &eventName, EventArgs &&args) {
    return workflow_.fireOrThrow(eventName, args);
}

void Workflowable::loadWorkflowState(const std::string &stateName) {
    workflow_.restoreState(stateName);
    LOG_DEBUG("Workflowable: '{}' instance restored to state '{}'", workflow_.getSpecificationName(), stateName);
}

void Workflowable::persistWorkflowState([[maybe_unused]] const std::string &stateName) {}

// Copies carry the other host's bindings, so both are always reset to this object
void Workflowable::bindHost() {
    workflow_.setHost(this);
    workflow_.setStateChangeListener([this](const std::string &stateName) { persistWorkflowState(stateName); });
}

}  // namespace WFE
