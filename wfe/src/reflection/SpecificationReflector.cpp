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

#include "reflection/SpecificationReflector.h"
#include "common/WorkflowErrors.h"
#include <sstream>
#include <stdexcept>

namespace WFE {

namespace {

std::string quoteDot(const std::string &text) {
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// States may carry a "label" meta entry for display
std::string displayName(const std::string &name, const MetaDictionary &meta) {
    const MetaValue *label = meta.find("label");
    if (label && label->is_string()) {
        return label->get<std::string>();
    }
    return name;
}

}  // namespace

SpecificationReflector::SpecificationReflector(const Specification &specification) : specification_(specification) {}

const std::string &SpecificationReflector::getName() const {
    return specification_.getName();
}

const std::string &SpecificationReflector::getInitialState() const {
    return specification_.getInitialState();
}

std::vector<std::string> SpecificationReflector::getStateNames() const {
    return specification_.getStateNames();
}

bool SpecificationReflector::hasState(const std::string &state) const {
    return specification_.hasState(state);
}

bool SpecificationReflector::hasEvent(const std::string &state, const std::string &event) const {
    const StateDefinition *found = specification_.findState(state);
    return found && found->hasEvent(event);
}

std::vector<std::string> SpecificationReflector::getEventNames(const std::string &state) const {
    return requireState(state).getEventNames();
}

const std::string &SpecificationReflector::getEventTarget(const std::string &state, const std::string &event) const {
    return requireEvent(state, event).getTransitionsTo();
}

const MetaDictionary &SpecificationReflector::getStateMeta(const std::string &state) const {
    return requireState(state).getMeta();
}

const MetaDictionary &SpecificationReflector::getEventMeta(const std::string &state, const std::string &event) const {
    return requireEvent(state, event).getMeta();
}

bool SpecificationReflector::hasOnEntry(const std::string &state) const {
    return static_cast<bool>(requireState(state).getOnEntry());
}

bool SpecificationReflector::hasOnExit(const std::string &state) const {
    return static_cast<bool>(requireState(state).getOnExit());
}

size_t SpecificationReflector::getOnTransitionHookCount() const {
    return specification_.getOnTransitionHooks().size();
}

std::vector<SpecificationReflector::DanglingEvent> SpecificationReflector::findUnresolvedTargets() const {
    std::vector<DanglingEvent> dangling;
    for (const auto &state : specification_.getStates()) {
        for (const auto &event : state->getEvents()) {
            if (!specification_.hasState(event->getTransitionsTo())) {
                dangling.push_back({state->getName(), event->getName(), event->getTransitionsTo()});
            }
        }
    }
    return dangling;
}

MetaValue SpecificationReflector::toJson() const {
    MetaValue document = MetaValue::object();
    document["name"] = specification_.getName();
    document["initial_state"] = specification_.getInitialState();
    document["states"] = MetaValue::array();

    for (const auto &state : specification_.getStates()) {
        MetaValue stateJson = MetaValue::object();
        stateJson["name"] = state->getName();
        if (!state->getMeta().empty()) {
            stateJson["meta"] = state->getMeta().toJson();
        }
        stateJson["on_entry"] = static_cast<bool>(state->getOnEntry());
        stateJson["on_exit"] = static_cast<bool>(state->getOnExit());
        stateJson["events"] = MetaValue::array();

        for (const auto &event : state->getEvents()) {
            MetaValue eventJson = MetaValue::object();
            eventJson["name"] = event->getName();
            eventJson["transitions_to"] = event->getTransitionsTo();
            if (!event->getMeta().empty()) {
                eventJson["meta"] = event->getMeta().toJson();
            }
            eventJson["action"] = event->hasAction();
            stateJson["events"].push_back(std::move(eventJson));
        }

        document["states"].push_back(std::move(stateJson));
    }

    document["on_transition_hooks"] = specification_.getOnTransitionHooks().size();
    return document;
}

std::string SpecificationReflector::toDot() const {
    std::ostringstream dot;
    dot << "digraph " << quoteDot(specification_.getName()) << " {\n";
    dot << "  rankdir=LR;\n";
    dot << "  node [shape=box, style=rounded];\n";

    for (const auto &state : specification_.getStates()) {
        dot << "  " << quoteDot(state->getName())
            << " [label=" << quoteDot(displayName(state->getName(), state->getMeta()));
        if (state->getName() == specification_.getInitialState()) {
            dot << ", style=\"rounded,bold\"";
        }
        dot << "];\n";
    }

    for (const auto &state : specification_.getStates()) {
        for (const auto &event : state->getEvents()) {
            dot << "  " << quoteDot(state->getName()) << " -> " << quoteDot(event->getTransitionsTo())
                << " [label=" << quoteDot(displayName(event->getName(), event->getMeta()));
            if (!specification_.hasState(event->getTransitionsTo())) {
                dot << ", style=dashed";
            }
            dot << "];\n";
        }
    }

    dot << "}\n";
    return dot.str();
}

const StateDefinition &SpecificationReflector::requireState(const std::string &state) const {
    const StateDefinition *found = specification_.findState(state);
    if (!found) {
        throw UnknownStateError(specification_.getName(), state);
    }
    return *found;
}

const EventDefinition &SpecificationReflector::requireEvent(const std::string &state, const std::string &event) const {
    auto found = requireState(state).findEvent(event);
    if (!found) {
        throw std::out_of_range("State '" + state + "' of workflow '" + specification_.getName() +
                                "' has no event '" + event + "'");
    }
    return *found;
}

}  // namespace WFE
