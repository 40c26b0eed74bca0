#pragma once

#include "builder/SpecBuilder.h"
#include "builder/SpecificationRegistry.h"
#include "model/Specification.h"
#include "runtime/WorkflowInstance.h"
#include <memory>
#include <string>
#include <vector>

namespace WFE {
namespace Test {
namespace Utils {

/**
 * @brief The article review workflow used across suites
 *
 * new --submit--> awaiting_review --review--> being_reviewed
 *     --accept--> accepted | --reject--> rejected
 */
inline std::shared_ptr<Specification> buildArticleSpecification(SpecificationRegistry &registry,
                                                                 const std::string &name = "Article") {
    return SpecBuilder(name, registry)
        .state("new", [](StateScope &s) { s.event("submit", "awaiting_review"); })
        .state("awaiting_review", [](StateScope &s) { s.event("review", "being_reviewed"); })
        .state("being_reviewed",
               [](StateScope &s) {
                   s.event("accept", "accepted");
                   s.event("reject", "rejected");
               })
        .state("accepted")
        .state("rejected")
        .build();
}

/**
 * @brief Ordered record of routine invocations, shared by the hooks of a test
 */
using CallLog = std::vector<std::string>;

inline EntryRoutine recordEntry(std::shared_ptr<CallLog> log, const std::string &state) {
    return [log, state](WorkflowInstance &, const std::string &prior, const std::string &event, EventArgs &) {
        log->push_back("on_entry:" + state + " from " + prior + " via " + event);
    };
}

inline ExitRoutine recordExit(std::shared_ptr<CallLog> log, const std::string &state) {
    return [log, state](WorkflowInstance &, const std::string &next, const std::string &event, EventArgs &) {
        log->push_back("on_exit:" + state + " to " + next + " via " + event);
    };
}

}  // namespace Utils
}  // namespace Test
}  // namespace WFE
