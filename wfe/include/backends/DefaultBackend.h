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
#include <mutex>
#include <string>

namespace WFE {

/**
 * @brief Console backend used when WFE is built with WFE_USE_SPDLOG=OFF
 *
 * Writes "[HH:MM:SS.mmm] [level] message" lines to stderr under a mutex.
 * There is no file output; inject a custom ILoggerBackend for that.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel threshold_;
    std::mutex mutex_;

    static const char *levelName(LogLevel level);
    static std::string timestamp();
};

}  // namespace WFE
