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

#include "model/StateDefinition.h"
#include "model/WorkflowTypes.h"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace WFE {

/**
 * @brief Compiled workflow graph: ordered states plus transition hooks
 *
 * The first state ever added becomes the initial state and stays so for the
 * lifetime of the object, however many patches are merged in later.
 *
 * A Specification is shared by every WorkflowInstance bound to it. Adding
 * states or merging patches while transitions run on those instances
 * requires external synchronization.
 */
class Specification {
public:
    /**
     * @brief Constructor
     * @param name Specification name
     * @throws std::invalid_argument if name is empty
     */
    explicit Specification(const std::string &name);

    Specification(const Specification &) = delete;
    Specification &operator=(const Specification &) = delete;

    const std::string &getName() const {
        return name_;
    }

    /**
     * @brief Return the state of the given name, declaring it if needed
     * @return The existing or newly appended state
     */
    StateDefinition &obtainState(const std::string &stateName);

    /**
     * @brief Find a state by name
     * @return State definition or nullptr if undeclared
     */
    const StateDefinition *findState(const std::string &stateName) const;
    StateDefinition *findState(const std::string &stateName);

    bool hasState(const std::string &stateName) const;

    /**
     * @brief States in declaration order
     */
    const std::vector<std::unique_ptr<StateDefinition>> &getStates() const {
        return states_;
    }

    std::vector<std::string> getStateNames() const;

    size_t getStateCount() const {
        return states_.size();
    }

    /**
     * @brief Name of the first state ever declared, empty if there is none
     */
    const std::string &getInitialState() const {
        return initialState_;
    }

    void addOnTransition(TransitionRoutine routine);

    /**
     * @brief Transition hooks in registration order
     */
    const std::vector<TransitionRoutine> &getOnTransitionHooks() const {
        return onTransition_;
    }

    /**
     * @brief Order two states by declaration position
     * @return Negative if lhs was declared before rhs, zero if equal, positive otherwise
     * @throws UnknownStateError if either state is undeclared
     */
    int compareStates(const std::string &lhs, const std::string &rhs) const;

    /**
     * @brief Additively merge another graph into this one
     *
     * New states and events are appended in patch order. An event redeclared
     * under an existing name replaces the old definition in place, redeclared
     * entry/exit hooks replace the old ones, state meta is merged key by key
     * and transition hooks are appended. The initial state never changes.
     *
     * @param patch Graph to merge, typically a SpecBuilder staging area
     */
    void merge(const Specification &patch);

private:
    std::string name_;
    std::string initialState_;
    std::vector<std::unique_ptr<StateDefinition>> states_;
    std::unordered_map<std::string, size_t> stateIndex_;
    std::vector<TransitionRoutine> onTransition_;
};

}  // namespace WFE
