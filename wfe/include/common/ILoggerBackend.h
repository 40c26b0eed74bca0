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

#include <source_location>
#include <string>

namespace WFE {

/**
 * @brief Log severity, ordered from most to least verbose
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Pluggable sink for the WFE Logger facade
 *
 * Applications that already own a logging system implement this interface
 * and hand it to Logger::setBackend(). The engine itself never talks to a
 * concrete logging library directly.
 *
 * @code
 * class AuditLogBackend : public WFE::ILoggerBackend {
 * public:
 *     void log(WFE::LogLevel level, const std::string &message, const std::source_location &loc) override {
 *         audit_.write(static_cast<int>(level), message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(WFE::LogLevel level) override { audit_.setThreshold(static_cast<int>(level)); }
 *     void flush() override { audit_.sync(); }
 * };
 *
 * WFE::Logger::setBackend(std::make_unique<AuditLogBackend>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Emit one record
     * @param level Severity of the record
     * @param message Fully formatted text, already prefixed with the calling function
     * @param loc Call site of the LOG_* macro
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Drop records below the given severity
     */
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace WFE
