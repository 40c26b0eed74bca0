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

#include <optional>
#include <string>

namespace WFE {

/**
 * @brief Result of one fire() call
 *
 * Converts to false when the event's action halted the transition; in that
 * case toState equals fromState and haltedReason carries the reason passed
 * to halt(), if any.
 */
struct TransitionOutcome {
    enum class Status { Transitioned, Halted };

    Status status = Status::Transitioned;
    std::string fromState;
    std::string toState;
    std::string eventName;
    std::optional<std::string> haltedReason;

    bool succeeded() const {
        return status == Status::Transitioned;
    }

    bool halted() const {
        return status == Status::Halted;
    }

    explicit operator bool() const {
        return succeeded();
    }
};

}  // namespace WFE
