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

#include "common/Logger.h"

#ifdef WFE_USE_SPDLOG
#include "backends/SpdlogBackend.h"
#else
#include "backends/DefaultBackend.h"
#endif

#include <cctype>
#include <mutex>

namespace WFE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {
std::mutex backendMutex;

std::unique_ptr<ILoggerBackend> makeBuiltinBackend([[maybe_unused]] const std::string &logDir,
                                                   [[maybe_unused]] bool logToFile) {
#ifdef WFE_USE_SPDLOG
    return std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
    return std::make_unique<DefaultBackend>();
#endif
}
}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = makeBuiltinBackend(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(level, functionPrefix(loc) + "() - " + message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

// Reduce a pretty function signature such as
// "WFE::TransitionOutcome WFE::TransitionExecutor::execute(WFE::WorkflowInstance&, ...)"
// to "WFE::TransitionExecutor::execute".
std::string Logger::functionPrefix(const std::source_location &loc) {
    std::string signature = loc.function_name();

    size_t end = signature.find('(');
    if (end == std::string::npos) {
        return signature.empty() ? "unknown" : signature;
    }

    // Return type is separated by the last space outside template brackets
    size_t start = 0;
    int depth = 0;
    for (size_t i = 0; i < end; ++i) {
        char c = signature[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (c == ' ' && depth == 0) {
            start = i + 1;
        }
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < end; ++i) {
        char c = signature[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0 && c != '*' && c != '&') {
            name += c;
        }
    }

    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
        name.pop_back();
    }
    return name.empty() ? "unknown" : name;
}

}  // namespace WFE
