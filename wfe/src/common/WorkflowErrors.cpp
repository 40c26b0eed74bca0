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

#include "common/WorkflowErrors.h"
#include <format>

namespace WFE {

std::string formatNameList(const std::vector<std::string> &names) {
    std::string joined = "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += names[i];
    }
    joined += "]";
    return joined;
}

UndefinedTransitionError::UndefinedTransitionError(const std::string &specificationName, const std::string &stateName,
                                                   const std::string &eventName,
                                                   std::vector<std::string> availableEvents)
    : WorkflowError(std::format("There is no event '{}' defined for the '{}' state of workflow '{}'. "
                                "Events available in '{}': {}",
                                eventName, stateName, specificationName, stateName, formatNameList(availableEvents))),
      specificationName_(specificationName), stateName_(stateName), eventName_(eventName),
      availableEvents_(std::move(availableEvents)) {}

HaltedError::HaltedError(const std::string &stateName, const std::string &eventName,
                         std::optional<std::string> reason)
    : WorkflowError(reason ? std::format("Event '{}' halted in state '{}': {}", eventName, stateName, *reason)
                           : std::format("Event '{}' halted in state '{}'", eventName, stateName)),
      stateName_(stateName), eventName_(eventName), reason_(std::move(reason)) {}

UnresolvedTargetError::UnresolvedTargetError(const std::string &specificationName, const std::string &stateName,
                                             const std::string &eventName, const std::string &targetName)
    : WorkflowError(std::format("Event '{}' of state '{}' transitions to '{}', which workflow '{}' does not declare",
                                eventName, stateName, targetName, specificationName)),
      stateName_(stateName), eventName_(eventName), targetName_(targetName) {}

UnknownStateError::UnknownStateError(const std::string &specificationName, const std::string &stateName)
    : WorkflowError(std::format("Workflow '{}' has no state named '{}'", specificationName, stateName)),
      stateName_(stateName) {}

}  // namespace WFE
