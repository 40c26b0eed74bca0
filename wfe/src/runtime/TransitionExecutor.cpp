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

#include "runtime/TransitionExecutor.h"
#include "common/Logger.h"
#include "common/WorkflowErrors.h"
#include "model/EventDefinition.h"
#include "model/StateDefinition.h"
#include "runtime/ActionContext.h"
#include "runtime/WorkflowInstance.h"
#include <exception>
#include <vector>

namespace WFE {

TransitionExecutor::Resolution TransitionExecutor::resolve(const WorkflowInstance &instance,
                                                           const std::string &eventName) {
    const Specification &specification = *instance.getSpecification();

    Resolution resolution;
    resolution.source = &instance.getCurrentStateDefinition();
    resolution.event = resolution.source->findEvent(eventName);
    if (!resolution.event) {
        throw UndefinedTransitionError(specification.getName(), resolution.source->getName(), eventName,
                                       resolution.source->getEventNames());
    }

    resolution.target = specification.findState(resolution.event->getTransitionsTo());
    if (!resolution.target) {
        throw UnresolvedTargetError(specification.getName(), resolution.source->getName(), eventName,
                                    resolution.event->getTransitionsTo());
    }

    return resolution;
}

TransitionOutcome TransitionExecutor::execute(WorkflowInstance &instance, const std::string &eventName,
                                              EventArgs &args) {
    Resolution resolution;
    try {
        resolution = resolve(instance, eventName);
    } catch (const WorkflowError &e) {
        LOG_DEBUG("Workflow '{}': {}", instance.getSpecificationName(), e.what());
        throw;
    }

    const std::string fromState = resolution.source->getName();
    const std::string toState = resolution.target->getName();
    const EventDefinition &event = *resolution.event;

    TransitionOutcome outcome;
    outcome.fromState = fromState;
    outcome.toState = toState;
    outcome.eventName = eventName;

    LOG_DEBUG("Workflow '{}': firing '{}' from '{}' to '{}' with {} argument(s)", instance.getSpecificationName(),
              eventName, fromState, toState, args.size());

    instance.clearHalt();

    if (event.hasAction()) {
        ActionContext context(instance, event, args);
        try {
            event.getAction()(context);
        } catch (const detail::HaltSignal &) {
            // halt() already recorded the status on the instance
        } catch (const std::exception &e) {
            LOG_ERROR("Workflow '{}': action of event '{}' failed in state '{}': {}", instance.getSpecificationName(),
                      eventName, fromState, e.what());
            throw;
        }
    }

    if (instance.isHalted()) {
        LOG_INFO("Workflow '{}': event '{}' halted in state '{}'{}", instance.getSpecificationName(), eventName,
                 fromState, instance.getHaltedReason() ? ": " + *instance.getHaltedReason() : std::string());
        outcome.status = TransitionOutcome::Status::Halted;
        outcome.toState = fromState;
        outcome.haltedReason = instance.getHaltedReason();
        return outcome;
    }

    try {
        // Copy so a hook that re-opens the specification cannot invalidate the iteration
        const std::vector<TransitionRoutine> hooks = instance.getSpecification()->getOnTransitionHooks();
        for (const auto &hook : hooks) {
            hook(instance, fromState, toState, eventName, args);
        }

        // Held by value: a routine may re-open the specification and replace itself
        const ExitRoutine onExit = resolution.source->getOnExit();
        if (onExit) {
            onExit(instance, toState, eventName, args);
        }
    } catch (const std::exception &e) {
        LOG_ERROR("Workflow '{}': hook failed before leaving '{}' on '{}', state unchanged: {}",
                  instance.getSpecificationName(), fromState, eventName, e.what());
        throw;
    }

    instance.moveTo(toState);

    try {
        instance.notifyStateChanged();

        const EntryRoutine onEntry = resolution.target->getOnEntry();
        if (onEntry) {
            onEntry(instance, fromState, eventName, args);
        }
    } catch (const std::exception &e) {
        LOG_ERROR("Workflow '{}': routine failed after entering '{}' on '{}': {}", instance.getSpecificationName(),
                  toState, eventName, e.what());
        throw;
    }

    LOG_DEBUG("Workflow '{}': '{}' -> '{}' on '{}'", instance.getSpecificationName(), fromState, toState, eventName);
    return outcome;
}

}  // namespace WFE
