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

#include "runtime/ActionContext.h"
#include "model/EventDefinition.h"
#include "runtime/WorkflowInstance.h"

namespace WFE {

ActionContext::ActionContext(WorkflowInstance &instance, const EventDefinition &event, EventArgs &args)
    : instance_(instance), event_(event), args_(args) {}

const std::string &ActionContext::getEventName() const {
    return event_.getName();
}

const std::string &ActionContext::getFromState() const {
    return instance_.getCurrentState();
}

const std::string &ActionContext::getToState() const {
    return event_.getTransitionsTo();
}

void ActionContext::halt() {
    raiseHalt(std::nullopt);
}

void ActionContext::halt(const std::string &reason) {
    raiseHalt(reason);
}

void ActionContext::raiseHalt(std::optional<std::string> reason) {
    instance_.markHalted(std::move(reason));
    throw detail::HaltSignal{};
}

}  // namespace WFE
