#include "builder/SpecBuilder.h"
#include "common/Logger.h"
#include "common/TestUtils.h"
#include "common/WorkflowErrors.h"
#include "mocks/CapturingLoggerBackend.h"
#include "runtime/ActionContext.h"
#include "runtime/WorkflowInstance.h"
#include <gtest/gtest.h>

using namespace WFE;
using WFE::Test::Utils::CallLog;

/**
 * @brief Article workflow whose accept action halts unless the first argument is true
 */
class HaltTest : public ::testing::Test {
protected:
    void SetUp() override {
        records_ = std::make_shared<Test::CapturingLoggerBackend::Records>();
        Logger::setBackend(std::make_unique<Test::CapturingLoggerBackend>(records_));

        WFE::Test::Utils::buildArticleSpecification(registry_);

        auto log = log_;
        auto afterHalt = afterHalt_;
        spec_ = SpecBuilder("Article", registry_)
                    .state("being_reviewed",
                           [log, afterHalt](StateScope &s) {
                               s.event("accept", "accepted", {}, [afterHalt](ActionContext &ctx) {
                                   if (ctx.getArgs().empty()) {
                                       ctx.halt();
                                   }
                                   if (!ctx.arg<bool>(0)) {
                                       ctx.halt("coz I said so!");
                                   }
                                   *afterHalt = true;
                               });
                               s.onExit(WFE::Test::Utils::recordExit(log, "being_reviewed"));
                           })
                    .state("accepted", [log](StateScope &s) { s.onEntry(WFE::Test::Utils::recordEntry(log, "accepted")); })
                    .onTransition([log](WorkflowInstance &, const std::string &from, const std::string &to,
                                        const std::string &, EventArgs &) {
                        log->push_back("hook:" + from + "->" + to);
                    })
                    .build();
    }

    void TearDown() override {
        Logger::setBackend(nullptr);
    }

    SpecificationRegistry registry_;
    std::shared_ptr<Specification> spec_;
    std::shared_ptr<Test::CapturingLoggerBackend::Records> records_;
    std::shared_ptr<CallLog> log_ = std::make_shared<CallLog>();
    std::shared_ptr<bool> afterHalt_ = std::make_shared<bool>(false);
};

TEST_F(HaltTest, NonRaisingFormReturnsFalsyOutcome) {
    WorkflowInstance article(spec_, "being_reviewed");

    TransitionOutcome outcome = article.fire("accept", {false});

    EXPECT_FALSE(outcome);
    EXPECT_TRUE(outcome.halted());
    EXPECT_EQ(outcome.fromState, "being_reviewed");
    EXPECT_EQ(outcome.toState, "being_reviewed");
    EXPECT_EQ(outcome.haltedReason, "coz I said so!");

    EXPECT_TRUE(article.isHalted());
    EXPECT_EQ(article.getHaltedReason(), "coz I said so!");
    EXPECT_EQ(article.getCurrentState(), "being_reviewed");
    EXPECT_TRUE(log_->empty());
    EXPECT_FALSE(*afterHalt_);
}

TEST_F(HaltTest, RaisingFormThrowsHaltedError) {
    WorkflowInstance article(spec_, "being_reviewed");

    try {
        article.fireOrThrow("accept", {false});
        FAIL() << "Expected HaltedError";
    } catch (const HaltedError &e) {
        EXPECT_EQ(e.getReason(), "coz I said so!");
        EXPECT_EQ(e.getStateName(), "being_reviewed");
        EXPECT_EQ(e.getEventName(), "accept");
    }

    EXPECT_TRUE(article.isHalted());
    EXPECT_EQ(article.getHaltedReason(), "coz I said so!");
    EXPECT_EQ(article.getCurrentState(), "being_reviewed");
    EXPECT_TRUE(log_->empty());
}

TEST_F(HaltTest, HaltWithoutReason) {
    WorkflowInstance article(spec_, "being_reviewed");

    EXPECT_FALSE(article.fire("accept"));
    EXPECT_TRUE(article.isHalted());
    EXPECT_FALSE(article.getHaltedReason().has_value());

    try {
        article.fireOrThrow("accept");
        FAIL() << "Expected HaltedError";
    } catch (const HaltedError &e) {
        EXPECT_FALSE(e.getReason().has_value());
    }
}

TEST_F(HaltTest, NextFiringResetsHaltStatus) {
    WorkflowInstance article(spec_, "being_reviewed");

    article.fire("accept", {false});
    ASSERT_TRUE(article.isHalted());

    TransitionOutcome outcome = article.fire("accept", {true});

    EXPECT_TRUE(outcome);
    EXPECT_FALSE(article.isHalted());
    EXPECT_FALSE(article.getHaltedReason().has_value());
    EXPECT_EQ(article.getCurrentState(), "accepted");
    EXPECT_TRUE(*afterHalt_);
    EXPECT_EQ(*log_, (CallLog{"hook:being_reviewed->accepted", "on_exit:being_reviewed to accepted via accept",
                              "on_entry:accepted from being_reviewed via accept"}));
}

TEST_F(HaltTest, UndefinedEventAfterHaltKeepsHaltStatus) {
    WorkflowInstance article(spec_, "being_reviewed");
    article.fire("accept", {false});

    EXPECT_THROW(article.fire("submit"), UndefinedTransitionError);
    EXPECT_TRUE(article.isHalted());
}

TEST_F(HaltTest, HaltIsLoggedAtInfo) {
    WorkflowInstance article(spec_, "being_reviewed");
    article.fire("accept", {false});

    bool found = false;
    for (const auto &record : *records_) {
        if (record.level == LogLevel::Info && record.message.find("coz I said so!") != std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(HaltTest, RestoreClearsHalt) {
    WorkflowInstance article(spec_, "being_reviewed");
    article.fire("accept", {false});

    article.restoreState("new");
    EXPECT_FALSE(article.isHalted());
    EXPECT_EQ(article.getCurrentState(), "new");
}

TEST_F(HaltTest, HaltCaughtByActionStillHalts) {
    bool resumed = false;
    SpecBuilder("Article", registry_)
        .state("being_reviewed",
               [&resumed](StateScope &s) {
                   s.event("reject", "rejected", {}, [&resumed](ActionContext &ctx) {
                       try {
                           ctx.halt("needs a second reader");
                       } catch (...) {
                           // swallowed on purpose; the instance keeps the halt
                       }
                       resumed = true;
                   });
               })
        .build();

    WorkflowInstance article(spec_, "being_reviewed");
    TransitionOutcome outcome = article.fire("reject");

    EXPECT_TRUE(resumed);
    EXPECT_FALSE(outcome);
    EXPECT_EQ(outcome.haltedReason, "needs a second reader");
    EXPECT_TRUE(article.isHalted());
    EXPECT_EQ(article.getCurrentState(), "being_reviewed");
    EXPECT_TRUE(log_->empty());
    EXPECT_THROW(article.fireOrThrow("reject"), HaltedError);
}
