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

#include "model/MetaDictionary.h"
#include "model/Specification.h"
#include <string>
#include <vector>

namespace WFE {

/**
 * @brief Read-only view of a Specification for tooling and admin UIs
 *
 * Never fires a transition and never validates event targets: an event whose
 * target is not declared yet is reported as-is, since a later patch may add
 * the state.
 */
class SpecificationReflector {
public:
    /**
     * @brief An event whose target state is not declared
     */
    struct DanglingEvent {
        std::string state;
        std::string event;
        std::string target;

        bool operator==(const DanglingEvent &other) const = default;
    };

    explicit SpecificationReflector(const Specification &specification);

    const std::string &getName() const;
    const std::string &getInitialState() const;

    /**
     * @brief State names in declaration order
     */
    std::vector<std::string> getStateNames() const;

    bool hasState(const std::string &state) const;
    bool hasEvent(const std::string &state, const std::string &event) const;

    /**
     * @brief Event names of a state in declaration order
     * @throws UnknownStateError if the state is not declared
     */
    std::vector<std::string> getEventNames(const std::string &state) const;

    /**
     * @brief Target state name of an event
     * @throws UnknownStateError if the state is not declared
     * @throws std::out_of_range if the state has no such event
     */
    const std::string &getEventTarget(const std::string &state, const std::string &event) const;

    /**
     * @throws UnknownStateError if the state is not declared
     */
    const MetaDictionary &getStateMeta(const std::string &state) const;

    /**
     * @throws UnknownStateError if the state is not declared
     * @throws std::out_of_range if the state has no such event
     */
    const MetaDictionary &getEventMeta(const std::string &state, const std::string &event) const;

    /**
     * @brief Whether the state runs an entry or exit hook
     */
    bool hasOnEntry(const std::string &state) const;
    bool hasOnExit(const std::string &state) const;

    size_t getOnTransitionHookCount() const;

    /**
     * @brief Events pointing at undeclared states, in declaration order
     */
    std::vector<DanglingEvent> findUnresolvedTargets() const;

    /**
     * @brief Whole graph as an ordered JSON document
     *
     * Layout matches what SpecificationJsonParser reads, plus the initial
     * state and hook flags.
     */
    MetaValue toJson() const;

    /**
     * @brief Graphviz digraph, one node per state and one edge per event
     */
    std::string toDot() const;

private:
    const StateDefinition &requireState(const std::string &state) const;
    const EventDefinition &requireEvent(const std::string &state, const std::string &event) const;

    const Specification &specification_;
};

}  // namespace WFE
