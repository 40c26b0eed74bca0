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
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace WFE {

/**
 * @brief Process-wide logging facade used by every WFE component
 *
 * Records are routed to a single ILoggerBackend. Unless the application
 * injects its own backend, the first log call installs the built-in one
 * (spdlog when WFE_USE_SPDLOG is enabled, DefaultBackend otherwise).
 *
 * @code
 * WFE::Logger::initialize("/var/log/orders", true);
 * LOG_INFO("Order workflow ready with {} states", spec->getStateCount());
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the active backend
     * @param backend New backend, ownership is transferred
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Install the built-in console backend if none is active
     */
    static void initialize();

    /**
     * @brief Install the built-in backend with an optional file sink
     * @param logDir Directory receiving wfe.log
     * @param logToFile Whether the file sink is enabled
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void log(LogLevel level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static std::string functionPrefix(const std::source_location &loc);
};

}  // namespace WFE

#define LOG_TRACE(...) WFE::Logger::log(WFE::LogLevel::Trace, std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) WFE::Logger::log(WFE::LogLevel::Debug, std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) WFE::Logger::log(WFE::LogLevel::Info, std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) WFE::Logger::log(WFE::LogLevel::Warn, std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) WFE::Logger::log(WFE::LogLevel::Error, std::format(__VA_ARGS__), std::source_location::current())
