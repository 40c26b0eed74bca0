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

// wfe_inspect: print the structure of a JSON workflow specification
// as Graphviz, JSON or a plain text summary

#include "WorkflowEngine.h"
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

namespace {

void printUsage(const char *programName) {
    std::cout << "Usage: " << programName << " <spec.json> [--format dot|json|text] [--output <file>]\n\n";
    std::cout << "Load a workflow specification and print its reflection.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --format   dot (Graphviz, default), json, or text\n";
    std::cout << "  --output   Write to a file instead of stdout\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " article.json | dot -Tpng -o article.png\n";
    std::cout << "  " << programName << " article.json --format text\n";
}

std::string renderText(const WFE::SpecificationReflector &reflector) {
    std::string text = "Workflow: " + reflector.getName() + "\n";
    text += "Initial state: " + reflector.getInitialState() + "\n";

    for (const auto &state : reflector.getStateNames()) {
        text += "\n" + state + "\n";
        const auto &meta = reflector.getStateMeta(state);
        for (const auto &[key, value] : meta) {
            text += "  meta " + key + " = " + value.dump() + "\n";
        }
        for (const auto &event : reflector.getEventNames(state)) {
            text += "  " + event + " -> " + reflector.getEventTarget(state, event) + "\n";
        }
    }

    auto dangling = reflector.findUnresolvedTargets();
    if (!dangling.empty()) {
        text += "\nUnresolved targets:\n";
        for (const auto &entry : dangling) {
            text += "  " + entry.state + "." + entry.event + " -> " + entry.target + "\n";
        }
    }
    return text;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string inputPath;
    std::string format = "dot";
    std::string outputPath;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--format") == 0 && i + 1 < argc) {
            format = argv[++i];
        } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            outputPath = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (inputPath.empty() && argv[i][0] != '-') {
            inputPath = argv[i];
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (inputPath.empty() || (format != "dot" && format != "json" && format != "text")) {
        printUsage(argv[0]);
        return 1;
    }

    WFE::Logger::initialize();

    WFE::SpecificationRegistry registry;
    WFE::SpecificationJsonParser parser(registry);
    auto specification = parser.parseFile(inputPath);
    if (!specification) {
        for (const auto &message : parser.getErrorMessages()) {
            std::cerr << "Error: " << message << "\n";
        }
        return 1;
    }

    WFE::SpecificationReflector reflector(*specification);
    std::string rendered;
    if (format == "json") {
        rendered = reflector.toJson().dump(2) + "\n";
    } else if (format == "text") {
        rendered = renderText(reflector);
    } else {
        rendered = reflector.toDot();
    }

    if (outputPath.empty()) {
        std::cout << rendered;
        return 0;
    }

    std::ofstream file(outputPath, std::ios::out | std::ios::binary);
    if (!file) {
        std::cerr << "Error: Failed to create output file: " << outputPath << "\n";
        return 1;
    }
    file << rendered;
    if (!file) {
        std::cerr << "Error: Failed to write output file: " << outputPath << "\n";
        return 1;
    }

    std::cerr << "Wrote " << format << " for workflow '" << reflector.getName() << "' to " << outputPath << "\n";
    return 0;
}
