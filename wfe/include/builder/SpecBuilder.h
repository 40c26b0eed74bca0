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
#include "model/MetaDictionary.h"
#include "model/Specification.h"
#include "model/WorkflowTypes.h"
#include <functional>
#include <memory>
#include <string>

namespace WFE {

class SpecBuilder;

/**
 * @brief Statements available inside a state body
 *
 * Handed to the callback of SpecBuilder::state(); every call is recorded
 * against that state.
 */
class StateScope {
public:
    StateScope(SpecBuilder &builder, std::string stateName);

    /**
     * @brief Declare an event of this state
     * @param name Event name
     * @param transitionsTo Target state, which may be declared later or in another batch
     * @param meta Event metadata
     * @param action Optional action, run before any hook and able to halt
     */
    StateScope &event(const std::string &name, const std::string &transitionsTo, MetaDictionary meta = {},
                      ActionRoutine action = nullptr);

    StateScope &onEntry(EntryRoutine routine);
    StateScope &onExit(ExitRoutine routine);
    StateScope &meta(const MetaDictionary &meta);

    const std::string &getStateName() const {
        return stateName_;
    }

private:
    SpecBuilder &builder_;
    std::string stateName_;
};

/**
 * @brief Compiles declarative statements into a registered Specification
 *
 * Statements are recorded into a staging graph in the order they are made;
 * build() merges that graph into the registry under the builder's name.
 * Building a name for the first time registers it and fixes its initial
 * state (the first state declared); building it again only adds to it.
 * Event targets are not checked here.
 *
 * @code
 * WFE::SpecBuilder("Article")
 *     .state("new", [](WFE::StateScope &s) { s.event("submit", "awaiting_review"); })
 *     .state("awaiting_review", [](WFE::StateScope &s) { s.event("review", "being_reviewed"); })
 *     .state("being_reviewed", [](WFE::StateScope &s) {
 *         s.event("accept", "accepted");
 *         s.event("reject", "rejected");
 *     })
 *     .state("accepted")
 *     .state("rejected")
 *     .build();
 * @endcode
 */
class SpecBuilder {
public:
    using StateBody = std::function<void(StateScope &scope)>;

    /**
     * @brief Start a batch of declarations for a specification
     * @param name Specification name
     * @param registry Registry receiving the result
     * @throws std::invalid_argument if name is empty
     */
    explicit SpecBuilder(const std::string &name,
                         SpecificationRegistry &registry = SpecificationRegistry::getInstance());

    SpecBuilder(const SpecBuilder &) = delete;
    SpecBuilder &operator=(const SpecBuilder &) = delete;

    /**
     * @brief Declare a state with an optional body
     */
    SpecBuilder &state(const std::string &name, const StateBody &body = nullptr);

    /**
     * @brief Declare a state with metadata and an optional body
     */
    SpecBuilder &state(const std::string &name, const MetaDictionary &meta, const StateBody &body = nullptr);

    /**
     * @brief Register a specification-wide transition hook
     */
    SpecBuilder &onTransition(TransitionRoutine routine);

    // Flat statement form; each statement implicitly declares the state it names
    SpecBuilder &declareState(const std::string &name);
    SpecBuilder &declareEvent(const std::string &state, const std::string &name, const std::string &transitionsTo,
                              ActionRoutine action = nullptr, MetaDictionary meta = {});
    SpecBuilder &declareOnEntry(const std::string &state, EntryRoutine routine);
    SpecBuilder &declareOnExit(const std::string &state, ExitRoutine routine);
    SpecBuilder &declareOnTransition(TransitionRoutine routine);
    SpecBuilder &declareMeta(const std::string &state, const MetaDictionary &meta);

    /**
     * @brief Add meta to an event already declared in this batch
     *
     * Event definitions are immutable, so the event is redeclared with the
     * merged meta.
     *
     * @throws std::invalid_argument if the event was not declared in this batch
     */
    SpecBuilder &declareEventMeta(const std::string &state, const std::string &event, const MetaDictionary &meta);

    /**
     * @brief The graph recorded so far, before it is merged
     */
    const Specification &getStaging() const {
        return *staging_;
    }

    const std::string &getName() const {
        return staging_->getName();
    }

    /**
     * @brief Merge the recorded statements into the registry
     * @return The registered specification, shared with every instance bound to it
     */
    std::shared_ptr<Specification> build();

private:
    SpecificationRegistry &registry_;
    std::unique_ptr<Specification> staging_;
};

}  // namespace WFE
