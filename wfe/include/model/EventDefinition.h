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
#include "model/WorkflowTypes.h"
#include <string>

namespace WFE {

/**
 * @brief One event of a state: its name, target state, action and meta
 *
 * Immutable once constructed. Redeclaring an event replaces the whole
 * definition, so a firing that already holds a reference keeps a consistent
 * view. The target is a plain state name and is only checked when the event
 * is fired.
 */
class EventDefinition {
public:
    /**
     * @brief Constructor
     * @param name Event name, unique within its state
     * @param transitionsTo Name of the target state (may not be declared yet)
     * @param action Optional action routine
     * @param meta Application metadata
     * @throws std::invalid_argument if name or transitionsTo is empty
     */
    EventDefinition(const std::string &name, const std::string &transitionsTo, ActionRoutine action = nullptr,
                    MetaDictionary meta = {});

    const std::string &getName() const {
        return name_;
    }

    const std::string &getTransitionsTo() const {
        return transitionsTo_;
    }

    bool hasAction() const {
        return static_cast<bool>(action_);
    }

    const ActionRoutine &getAction() const {
        return action_;
    }

    const MetaDictionary &getMeta() const {
        return meta_;
    }

private:
    std::string name_;
    std::string transitionsTo_;
    ActionRoutine action_;
    MetaDictionary meta_;
};

}  // namespace WFE
