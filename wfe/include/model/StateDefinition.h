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

#include "model/EventDefinition.h"
#include "model/MetaDictionary.h"
#include "model/WorkflowTypes.h"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace WFE {

/**
 * @brief A named node of a Specification
 *
 * Owns the events legal in this state (unique by name, kept in declaration
 * order), the optional entry/exit hooks and the state's meta.
 */
class StateDefinition {
public:
    /**
     * @brief Constructor
     * @param name State name, unique within its Specification
     * @param index Position in the Specification's declaration order
     * @throws std::invalid_argument if name is empty
     */
    StateDefinition(const std::string &name, size_t index);

    const std::string &getName() const {
        return name_;
    }

    /**
     * @brief Declaration position, used to order states
     */
    size_t getIndex() const {
        return index_;
    }

    /**
     * @brief Add an event, or replace the event of the same name in place
     * @return true if the event was new, false if it replaced an existing one
     */
    bool putEvent(std::shared_ptr<const EventDefinition> event);

    /**
     * @brief Find an event by name
     * @return Event definition or nullptr if the state has no such event
     */
    std::shared_ptr<const EventDefinition> findEvent(const std::string &eventName) const;

    bool hasEvent(const std::string &eventName) const;

    /**
     * @brief Events in declaration order
     */
    const std::vector<std::shared_ptr<const EventDefinition>> &getEvents() const {
        return events_;
    }

    std::vector<std::string> getEventNames() const;

    void setOnEntry(EntryRoutine routine);
    const EntryRoutine &getOnEntry() const {
        return onEntry_;
    }

    void setOnExit(ExitRoutine routine);
    const ExitRoutine &getOnExit() const {
        return onExit_;
    }

    void mergeMeta(const MetaDictionary &meta);
    const MetaDictionary &getMeta() const {
        return meta_;
    }

private:
    std::string name_;
    size_t index_;
    std::vector<std::shared_ptr<const EventDefinition>> events_;
    std::unordered_map<std::string, size_t> eventIndex_;
    EntryRoutine onEntry_;
    ExitRoutine onExit_;
    MetaDictionary meta_;
};

}  // namespace WFE
