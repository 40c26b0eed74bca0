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

#include "common/LogLevelParser.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace WFE {

std::optional<LogLevel> parseLogLevel(const std::string &name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") {
        return LogLevel::Trace;
    }
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "err" || lowered == "error") {
        return LogLevel::Error;
    }
    if (lowered == "critical") {
        return LogLevel::Critical;
    }
    if (lowered == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

std::optional<LogLevel> logLevelFromEnvironment() {
    const char *value = std::getenv("SPDLOG_LEVEL");
    if (!value) {
        return std::nullopt;
    }
    return parseLogLevel(value);
}

}  // namespace WFE
