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

#include "model/EventDefinition.h"
#include <stdexcept>

namespace WFE {

EventDefinition::EventDefinition(const std::string &name, const std::string &transitionsTo, ActionRoutine action,
                                 MetaDictionary meta)
    : name_(name), transitionsTo_(transitionsTo), action_(std::move(action)), meta_(std::move(meta)) {
    if (name_.empty()) {
        throw std::invalid_argument("EventDefinition: event name cannot be empty");
    }
    if (transitionsTo_.empty()) {
        throw std::invalid_argument("EventDefinition: event '" + name_ + "' needs a target state");
    }
}

}  // namespace WFE
