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

#include "builder/SpecBuilder.h"
#include "common/Logger.h"
#include <stdexcept>

namespace WFE {

StateScope::StateScope(SpecBuilder &builder, std::string stateName)
    : builder_(builder), stateName_(std::move(stateName)) {}

StateScope &StateScope::event(const std::string &name, const std::string &transitionsTo, MetaDictionary meta,
                              ActionRoutine action) {
    builder_.declareEvent(stateName_, name, transitionsTo, std::move(action), std::move(meta));
    return *this;
}

StateScope &StateScope::onEntry(EntryRoutine routine) {
    builder_.declareOnEntry(stateName_, std::move(routine));
    return *this;
}

StateScope &StateScope::onExit(ExitRoutine routine) {
    builder_.declareOnExit(stateName_, std::move(routine));
    return *this;
}

StateScope &StateScope::meta(const MetaDictionary &meta) {
    builder_.declareMeta(stateName_, meta);
    return *this;
}

SpecBuilder::SpecBuilder(const std::string &name, SpecificationRegistry &registry)
    : registry_(registry), staging_(std::make_unique<Specification>(name)) {}

SpecBuilder &SpecBuilder::state(const std::string &name, const StateBody &body) {
    declareState(name);
    if (body) {
        StateScope scope(*this, name);
        body(scope);
    }
    return *this;
}

SpecBuilder &SpecBuilder::state(const std::string &name, const MetaDictionary &meta, const StateBody &body) {
    declareState(name);
    declareMeta(name, meta);
    return state(name, body);
}

SpecBuilder &SpecBuilder::onTransition(TransitionRoutine routine) {
    return declareOnTransition(std::move(routine));
}

SpecBuilder &SpecBuilder::declareState(const std::string &name) {
    staging_->obtainState(name);
    return *this;
}

SpecBuilder &SpecBuilder::declareEvent(const std::string &state, const std::string &name,
                                       const std::string &transitionsTo, ActionRoutine action, MetaDictionary meta) {
    auto event = std::make_shared<const EventDefinition>(name, transitionsTo, std::move(action), std::move(meta));
    if (!staging_->obtainState(state).putEvent(std::move(event))) {
        LOG_WARN("SpecBuilder '{}': event '{}' declared twice for state '{}', keeping the last declaration",
                 getName(), name, state);
    }
    return *this;
}

SpecBuilder &SpecBuilder::declareOnEntry(const std::string &state, EntryRoutine routine) {
    if (!routine) {
        throw std::invalid_argument("SpecBuilder: on_entry routine for state '" + state + "' cannot be empty");
    }
    staging_->obtainState(state).setOnEntry(std::move(routine));
    return *this;
}

SpecBuilder &SpecBuilder::declareOnExit(const std::string &state, ExitRoutine routine) {
    if (!routine) {
        throw std::invalid_argument("SpecBuilder: on_exit routine for state '" + state + "' cannot be empty");
    }
    staging_->obtainState(state).setOnExit(std::move(routine));
    return *this;
}

SpecBuilder &SpecBuilder::declareOnTransition(TransitionRoutine routine) {
    staging_->addOnTransition(std::move(routine));
    return *this;
}

SpecBuilder &SpecBuilder::declareMeta(const std::string &state, const MetaDictionary &meta) {
    staging_->obtainState(state).mergeMeta(meta);
    return *this;
}

SpecBuilder &SpecBuilder::declareEventMeta(const std::string &state, const std::string &event,
                                           const MetaDictionary &meta) {
    StateDefinition *staged = staging_->findState(state);
    auto existing = staged ? staged->findEvent(event) : nullptr;
    if (!existing) {
        throw std::invalid_argument("SpecBuilder: event '" + event + "' of state '" + state +
                                    "' must be declared before its meta");
    }

    MetaDictionary merged = existing->getMeta();
    merged.merge(meta);
    staged->putEvent(std::make_shared<const EventDefinition>(existing->getName(), existing->getTransitionsTo(),
                                                             existing->getAction(), std::move(merged)));
    return *this;
}

std::shared_ptr<Specification> SpecBuilder::build() {
    LOG_DEBUG("SpecBuilder '{}': building {} state(s) and {} transition hook(s)", getName(),
              staging_->getStateCount(), staging_->getOnTransitionHooks().size());

    auto specification = registry_.declare(*staging_);

    // Reset so that a second build() does not merge the same statements twice
    staging_ = std::make_unique<Specification>(specification->getName());
    return specification;
}

}  // namespace WFE
