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

#include "model/StateDefinition.h"
#include <stdexcept>

namespace WFE {

StateDefinition::StateDefinition(const std::string &name, size_t index) : name_(name), index_(index) {
    if (name_.empty()) {
        throw std::invalid_argument("StateDefinition: state name cannot be empty");
    }
}

bool StateDefinition::putEvent(std::shared_ptr<const EventDefinition> event) {
    if (!event) {
        throw std::invalid_argument("StateDefinition: cannot add a null event to state '" + name_ + "'");
    }

    auto existing = eventIndex_.find(event->getName());
    if (existing != eventIndex_.end()) {
        events_[existing->second] = std::move(event);
        return false;
    }

    eventIndex_.emplace(event->getName(), events_.size());
    events_.push_back(std::move(event));
    return true;
}

std::shared_ptr<const EventDefinition> StateDefinition::findEvent(const std::string &eventName) const {
    auto it = eventIndex_.find(eventName);
    if (it == eventIndex_.end()) {
        return nullptr;
    }
    return events_[it->second];
}

bool StateDefinition::hasEvent(const std::string &eventName) const {
    return eventIndex_.contains(eventName);
}

std::vector<std::string> StateDefinition::getEventNames() const {
    std::vector<std::string> names;
    names.reserve(events_.size());
    for (const auto &event : events_) {
        names.push_back(event->getName());
    }
    return names;
}

void StateDefinition::setOnEntry(EntryRoutine routine) {
    onEntry_ = std::move(routine);
}

void StateDefinition::setOnExit(ExitRoutine routine) {
    onExit_ = std::move(routine);
}

void StateDefinition::mergeMeta(const MetaDictionary &meta) {
    meta_.merge(meta);
}

}  // namespace WFE
