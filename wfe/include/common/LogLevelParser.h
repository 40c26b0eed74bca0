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

#include "common/ILoggerBackend.h"
#include <optional>
#include <string>

namespace WFE {

/**
 * @brief Map a level name ("trace", "warn", "err", ...) to a LogLevel
 * @param name Case-insensitive level name as accepted by SPDLOG_LEVEL
 * @return Matching level, nullopt for unknown names
 */
std::optional<LogLevel> parseLogLevel(const std::string &name);

/**
 * @brief Read SPDLOG_LEVEL from the environment
 * @return Parsed level, nullopt if unset or unrecognized
 */
std::optional<LogLevel> logLevelFromEnvironment();

}  // namespace WFE
