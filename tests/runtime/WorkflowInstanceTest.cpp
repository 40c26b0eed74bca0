#include "builder/SpecBuilder.h"
#include "common/TestUtils.h"
#include "common/WorkflowErrors.h"
#include "runtime/WorkflowInstance.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace WFE;

class WorkflowInstanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        article_ = WFE::Test::Utils::buildArticleSpecification(registry_);
    }

    SpecificationRegistry registry_;
    std::shared_ptr<Specification> article_;
};

TEST_F(WorkflowInstanceTest, StartsInFirstDeclaredState) {
    WorkflowInstance article(article_);

    EXPECT_EQ(article.getCurrentState(), "new");
    EXPECT_TRUE(article.isState("new"));
    EXPECT_FALSE(article.isHalted());
    EXPECT_EQ(article.getSpecificationName(), "Article");
    EXPECT_EQ(article.getCurrentStateDefinition().getName(), "new");
}

TEST_F(WorkflowInstanceTest, ArticleHappyPath) {
    WorkflowInstance article(article_);

    article.fire("submit");
    EXPECT_EQ(article.getCurrentState(), "awaiting_review");
    article.fire("review");
    EXPECT_EQ(article.getCurrentState(), "being_reviewed");
    article.fireOrThrow("accept");
    EXPECT_EQ(article.getCurrentState(), "accepted");

    WorkflowInstance rejected(article_, "being_reviewed");
    rejected.fire("reject");
    EXPECT_TRUE(rejected.isState("rejected"));
}

TEST_F(WorkflowInstanceTest, UndefinedEventInNewListsSubmit) {
    WorkflowInstance article(article_);

    try {
        article.fire("review");
        FAIL() << "Expected UndefinedTransitionError";
    } catch (const UndefinedTransitionError &e) {
        EXPECT_EQ(e.getAvailableEvents(), (std::vector<std::string>{"submit"}));
        EXPECT_EQ(e.getSpecificationName(), "Article");
    }
    EXPECT_EQ(article.getCurrentState(), "new");
}

TEST_F(WorkflowInstanceTest, ReopenedSpecificationGainsEvents) {
    auto blatter = SpecBuilder("Blatter", registry_)
                       .state("opened", [](StateScope &s) { s.event("close", "closed"); })
                       .state("closed")
                       .build();

    WorkflowInstance page(blatter);
    page.fire("close");
    EXPECT_EQ(page.getCurrentState(), "closed");
    EXPECT_THROW(page.fire("open"), UndefinedTransitionError);

    SpecBuilder("Blatter", registry_).state("closed", [](StateScope &s) { s.event("open", "opened"); }).build();

    page.fire("open");
    EXPECT_EQ(page.getCurrentState(), "opened");
    EXPECT_THROW(page.fire("open"), UndefinedTransitionError);

    WorkflowInstance fresh(registry_.find("Blatter"));
    EXPECT_EQ(fresh.getCurrentState(), "opened");
    fresh.fire("close");
    fresh.fire("open");
    EXPECT_TRUE(fresh.isState("opened"));
}

TEST_F(WorkflowInstanceTest, InitialStateSurvivesReopening) {
    SpecBuilder("Article", registry_).state("archived").state("new", [](StateScope &s) {
        s.event("archive", "archived");
    }).build();

    WorkflowInstance article(article_);
    EXPECT_EQ(article.getCurrentState(), "new");
    EXPECT_EQ(article.getAvailableEvents(), (std::vector<std::string>{"submit", "archive"}));
}

TEST_F(WorkflowInstanceTest, AvailableEventsAndCanFire) {
    WorkflowInstance article(article_, "being_reviewed");

    EXPECT_EQ(article.getAvailableEvents(), (std::vector<std::string>{"accept", "reject"}));
    EXPECT_TRUE(article.canFire("accept"));
    EXPECT_FALSE(article.canFire("submit"));

    article.fire("accept");
    EXPECT_TRUE(article.getAvailableEvents().empty());
}

TEST_F(WorkflowInstanceTest, StateOrderingFollowsDeclaration) {
    WorkflowInstance article(article_, "awaiting_review");

    EXPECT_TRUE(article.isAfter("new"));
    EXPECT_TRUE(article.isBefore("being_reviewed"));
    EXPECT_FALSE(article.isBefore("awaiting_review"));
    EXPECT_FALSE(article.isAfter("awaiting_review"));
    EXPECT_THROW(article.isBefore("published"), UnknownStateError);
}

TEST_F(WorkflowInstanceTest, RestoreStateValidatesName) {
    WorkflowInstance article(article_);

    article.restoreState("being_reviewed");
    EXPECT_EQ(article.getCurrentState(), "being_reviewed");

    EXPECT_THROW(article.restoreState("published"), UnknownStateError);
    EXPECT_EQ(article.getCurrentState(), "being_reviewed");
    EXPECT_THROW(WorkflowInstance(article_, "published"), UnknownStateError);
}

TEST_F(WorkflowInstanceTest, RejectsUnusableSpecifications) {
    EXPECT_THROW(WorkflowInstance(nullptr), std::invalid_argument);

    auto empty = registry_.obtain("Empty");
    try {
        WorkflowInstance instance(empty);
        FAIL() << "Expected WorkflowError";
    } catch (const UnknownStateError &) {
        FAIL() << "An empty specification has no state name to report";
    } catch (const WorkflowError &e) {
        EXPECT_STREQ(e.what(), "Workflow 'Empty' declares no states");
    }
}

TEST_F(WorkflowInstanceTest, InstancesAreIndependent) {
    WorkflowInstance first(article_);
    WorkflowInstance second(article_);

    first.fire("submit");

    EXPECT_EQ(first.getCurrentState(), "awaiting_review");
    EXPECT_EQ(second.getCurrentState(), "new");
}

TEST_F(WorkflowInstanceTest, HostPointerRoundTrip) {
    struct Owner {
        int id = 42;
    } owner;

    WorkflowInstance article(article_);
    EXPECT_EQ(article.getHost<Owner>(), nullptr);

    article.setHost(&owner);
    ASSERT_NE(article.getHost<Owner>(), nullptr);
    EXPECT_EQ(article.getHost<Owner>()->id, 42);
    EXPECT_EQ(article.getHost<int>(), nullptr);
}

TEST_F(WorkflowInstanceTest, StateChangeListenerSeesEveryMove) {
    std::vector<std::string> moves;
    WorkflowInstance article(article_);
    article.setStateChangeListener([&moves](const std::string &state) { moves.push_back(state); });

    article.fire("submit");
    article.fire("review");
    article.restoreState("new");

    EXPECT_EQ(moves, (std::vector<std::string>{"awaiting_review", "being_reviewed"}));
}
