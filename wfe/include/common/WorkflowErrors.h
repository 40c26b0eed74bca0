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
#include <stdexcept>
#include <string>
#include <vector>

namespace WFE {

/**
 * @brief Base class of every error raised by the workflow engine
 */
class WorkflowError : public std::runtime_error {
public:
    explicit WorkflowError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief The fired event is not defined for the instance's current state
 *
 * Carries everything needed for an actionable diagnostic: the state the
 * instance is in and the events that would have been legal there.
 */
class UndefinedTransitionError : public WorkflowError {
public:
    UndefinedTransitionError(const std::string &specificationName, const std::string &stateName,
                             const std::string &eventName, std::vector<std::string> availableEvents);

    const std::string &getSpecificationName() const {
        return specificationName_;
    }

    const std::string &getStateName() const {
        return stateName_;
    }

    const std::string &getEventName() const {
        return eventName_;
    }

    /**
     * @brief Events legal in the current state, in declaration order
     */
    const std::vector<std::string> &getAvailableEvents() const {
        return availableEvents_;
    }

private:
    std::string specificationName_;
    std::string stateName_;
    std::string eventName_;
    std::vector<std::string> availableEvents_;
};

/**
 * @brief An action halted the transition (raised by fireOrThrow only)
 */
class HaltedError : public WorkflowError {
public:
    HaltedError(const std::string &stateName, const std::string &eventName, std::optional<std::string> reason);

    const std::string &getStateName() const {
        return stateName_;
    }

    const std::string &getEventName() const {
        return eventName_;
    }

    const std::optional<std::string> &getReason() const {
        return reason_;
    }

private:
    std::string stateName_;
    std::string eventName_;
    std::optional<std::string> reason_;
};

/**
 * @brief An event points at a state the specification does not declare
 *
 * This is an authoring defect in the specification, reported separately
 * from UndefinedTransitionError.
 */
class UnresolvedTargetError : public WorkflowError {
public:
    UnresolvedTargetError(const std::string &specificationName, const std::string &stateName,
                          const std::string &eventName, const std::string &targetName);

    const std::string &getStateName() const {
        return stateName_;
    }

    const std::string &getEventName() const {
        return eventName_;
    }

    const std::string &getTargetName() const {
        return targetName_;
    }

private:
    std::string stateName_;
    std::string eventName_;
    std::string targetName_;
};

/**
 * @brief A state name that the specification does not declare
 */
class UnknownStateError : public WorkflowError {
public:
    UnknownStateError(const std::string &specificationName, const std::string &stateName);

    const std::string &getStateName() const {
        return stateName_;
    }

private:
    std::string stateName_;
};

/**
 * @brief Join names as "[a, b, c]" for diagnostics
 */
std::string formatNameList(const std::vector<std::string> &names);

}  // namespace WFE
