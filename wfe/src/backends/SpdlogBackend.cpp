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

#include "backends/SpdlogBackend.h"
#include "common/LogLevelParser.h"
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace WFE {

namespace {
constexpr const char *LOGGER_NAME = "WFE";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    // A second backend in the same process reuses the registered logger
    logger_ = spdlog::get(LOGGER_NAME);

    if (!logger_) {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(CONSOLE_PATTERN);
        sinks.push_back(console);

        if (logToFile && !logDir.empty()) {
            std::filesystem::create_directories(logDir);
            auto path = std::filesystem::path(logDir) / "wfe.log";
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
            file->set_pattern(FILE_PATTERN);
            sinks.push_back(file);
        }

        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        spdlog::register_logger(logger_);
    }

    logger_->set_level(toSpdlogLevel(logLevelFromEnvironment().value_or(LogLevel::Info)));
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    logger_->log(toSpdlogLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlogLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace WFE
