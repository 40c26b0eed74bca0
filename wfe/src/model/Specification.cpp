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

#include "model/Specification.h"
#include "common/Logger.h"
#include "common/WorkflowErrors.h"
#include <stdexcept>

namespace WFE {

Specification::Specification(const std::string &name) : name_(name) {
    if (name_.empty()) {
        throw std::invalid_argument("Specification: name cannot be empty");
    }
}

StateDefinition &Specification::obtainState(const std::string &stateName) {
    if (StateDefinition *existing = findState(stateName)) {
        return *existing;
    }

    auto state = std::make_unique<StateDefinition>(stateName, states_.size());
    stateIndex_.emplace(stateName, states_.size());
    states_.push_back(std::move(state));

    if (initialState_.empty()) {
        initialState_ = stateName;
    }
    return *states_.back();
}

const StateDefinition *Specification::findState(const std::string &stateName) const {
    auto it = stateIndex_.find(stateName);
    if (it == stateIndex_.end()) {
        return nullptr;
    }
    return states_[it->second].get();
}

StateDefinition *Specification::findState(const std::string &stateName) {
    auto it = stateIndex_.find(stateName);
    if (it == stateIndex_.end()) {
        return nullptr;
    }
    return states_[it->second].get();
}

bool Specification::hasState(const std::string &stateName) const {
    return stateIndex_.contains(stateName);
}

std::vector<std::string> Specification::getStateNames() const {
    std::vector<std::string> names;
    names.reserve(states_.size());
    for (const auto &state : states_) {
        names.push_back(state->getName());
    }
    return names;
}

void Specification::addOnTransition(TransitionRoutine routine) {
    if (!routine) {
        throw std::invalid_argument("Specification: on_transition hook of '" + name_ + "' cannot be empty");
    }
    onTransition_.push_back(std::move(routine));
}

int Specification::compareStates(const std::string &lhs, const std::string &rhs) const {
    const StateDefinition *left = findState(lhs);
    if (!left) {
        throw UnknownStateError(name_, lhs);
    }
    const StateDefinition *right = findState(rhs);
    if (!right) {
        throw UnknownStateError(name_, rhs);
    }

    if (left->getIndex() < right->getIndex()) {
        return -1;
    }
    return left->getIndex() > right->getIndex() ? 1 : 0;
}

void Specification::merge(const Specification &patch) {
    if (&patch == this) {
        return;
    }

    size_t addedStates = 0;
    size_t addedEvents = 0;

    for (const auto &incoming : patch.getStates()) {
        bool isNewState = !hasState(incoming->getName());
        StateDefinition &target = obtainState(incoming->getName());
        if (isNewState) {
            ++addedStates;
        }

        for (const auto &event : incoming->getEvents()) {
            if (target.putEvent(event)) {
                ++addedEvents;
            } else {
                LOG_WARN("Specification '{}': event '{}' of state '{}' redeclared, the new definition replaces it",
                         name_, event->getName(), target.getName());
            }
        }

        if (incoming->getOnEntry()) {
            if (!isNewState && target.getOnEntry()) {
                LOG_WARN("Specification '{}': on_entry of state '{}' redeclared", name_, target.getName());
            }
            target.setOnEntry(incoming->getOnEntry());
        }

        if (incoming->getOnExit()) {
            if (!isNewState && target.getOnExit()) {
                LOG_WARN("Specification '{}': on_exit of state '{}' redeclared", name_, target.getName());
            }
            target.setOnExit(incoming->getOnExit());
        }

        target.mergeMeta(incoming->getMeta());
    }

    for (const auto &hook : patch.getOnTransitionHooks()) {
        onTransition_.push_back(hook);
    }

    LOG_DEBUG("Specification '{}': merged {} new state(s), {} new event(s), {} transition hook(s); initial state '{}'",
              name_, addedStates, addedEvents, patch.getOnTransitionHooks().size(), initialState_);
}

}  // namespace WFE
