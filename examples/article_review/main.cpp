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

// Article review walkthrough: structure from JSON, behavior attached in code

#include "WorkflowEngine.h"
#include <iostream>

namespace {

class Article : public WFE::Workflowable {
public:
    explicit Article(std::string title) : Workflowable("Article"), title_(std::move(title)) {}

    const std::string &title() const {
        return title_;
    }

    int reviewRounds = 0;

protected:
    void persistWorkflowState(const std::string &state) override {
        std::cout << "  [store] " << title_ << " saved as '" << state << "'\n";
    }

private:
    std::string title_;
};

}  // namespace

int main(int argc, char **argv) {
    const std::string specPath = argc > 1 ? argv[1] : "examples/specs/article.json";

    WFE::Logger::initialize();
    WFE::Logger::setLevel(WFE::LogLevel::Error);

    WFE::SpecificationJsonParser parser;
    if (!parser.parseFile(specPath)) {
        for (const auto &message : parser.getErrorMessages()) {
            std::cerr << "Error: " << message << "\n";
        }
        return 1;
    }

    // Re-open the specification to attach behavior
    WFE::SpecBuilder("Article")
        .state("being_reviewed",
               [](WFE::StateScope &s) {
                   s.onEntry([](WFE::WorkflowInstance &instance, const std::string &, const std::string &,
                                WFE::EventArgs &) { WFE::Workflowable::hostOf<Article>(instance).reviewRounds++; });
                   s.event("accept", "accepted", {{"role", "editor"}}, [](WFE::ActionContext &ctx) {
                       if (ctx.getArgs().empty() || !std::any_cast<bool>(ctx.getArgs()[0])) {
                           ctx.halt("editor has not signed off");
                       }
                   });
               })
        .onTransition([](WFE::WorkflowInstance &instance, const std::string &from, const std::string &to,
                         const std::string &event, WFE::EventArgs &) {
            std::cout << "  " << WFE::Workflowable::hostOf<Article>(instance).title() << ": " << from << " --"
                      << event << "--> " << to << "\n";
        })
        .build();

    Article article("Declarative state machines in C++");
    std::cout << "Initial state: " << article.currentState() << "\n";

    article.fire("submit");
    article.fire("review");

    if (!article.fire("accept", {false})) {
        std::cout << "Accept halted: " << article.haltedBecause().value_or("no reason") << "\n";
    }

    try {
        article.fire("publish");
    } catch (const WFE::UndefinedTransitionError &e) {
        std::cout << e.what() << "\n";
    }

    article.fire("accept", {true});
    std::cout << "Final state: " << article.currentState() << " after " << article.reviewRounds
              << " review round(s)\n";
    return 0;
}
