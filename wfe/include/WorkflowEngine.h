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

/**
 * @file WorkflowEngine.h
 * @brief Single include for the public WFE API
 */

#include "binding/Workflowable.h"
#include "builder/SpecBuilder.h"
#include "builder/SpecificationRegistry.h"
#include "common/Logger.h"
#include "common/WorkflowErrors.h"
#include "model/MetaDictionary.h"
#include "model/Specification.h"
#include "parsing/SpecificationJsonParser.h"
#include "reflection/SpecificationReflector.h"
#include "runtime/ActionContext.h"
#include "runtime/TransitionOutcome.h"
#include "runtime/WorkflowInstance.h"
