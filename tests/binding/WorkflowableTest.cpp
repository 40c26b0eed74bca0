#include "binding/Workflowable.h"
#include "builder/SpecBuilder.h"
#include "common/TestUtils.h"
#include "common/WorkflowErrors.h"
#include "runtime/ActionContext.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <typeinfo>

using namespace WFE;

namespace {

class Article : public Workflowable {
public:
    explicit Article(SpecificationRegistry &registry) : Workflowable("Article", registry) {}

    int reviewRounds = 0;
    std::vector<std::string> persisted;

protected:
    void persistWorkflowState(const std::string &stateName) override {
        persisted.push_back(stateName);
    }
};

class Ledger : public Workflowable {
public:
    explicit Ledger(SpecificationRegistry &registry) : Workflowable("Ledger", registry) {}

    std::vector<std::string> persisted;

protected:
    void persistWorkflowState(const std::string &stateName) override {
        persisted.push_back(stateName + " while in " + currentState());
    }
};

class Invoice : public Workflowable {
public:
    explicit Invoice(SpecificationRegistry &registry) : Workflowable("Article", registry) {}
};

}  // namespace

class WorkflowableTest : public ::testing::Test {
protected:
    void SetUp() override {
        WFE::Test::Utils::buildArticleSpecification(registry_);
        SpecBuilder("Article", registry_)
            .state("being_reviewed",
                   [](StateScope &s) {
                       s.onEntry([](WorkflowInstance &instance, const std::string &, const std::string &,
                                    EventArgs &) { Workflowable::hostOf<Article>(instance).reviewRounds++; });
                       s.event("accept", "accepted", {}, [](ActionContext &ctx) {
                           if (ctx.getArgs().empty() || !ctx.arg<bool>(0)) {
                               ctx.halt("coz I said so!");
                           }
                       });
                   })
            .build();
    }

    SpecificationRegistry registry_;
};

TEST_F(WorkflowableTest, DelegatesToInstance) {
    Article article(registry_);

    EXPECT_EQ(article.currentState(), "new");
    EXPECT_TRUE(article.is("new"));
    EXPECT_TRUE(article.can("submit"));
    EXPECT_EQ(article.availableEvents(), (std::vector<std::string>{"submit"}));

    EXPECT_TRUE(article.fire("submit"));
    EXPECT_TRUE(article.fire("review"));
    EXPECT_TRUE(article.is("being_reviewed"));
    EXPECT_EQ(article.reviewRounds, 1);
}

TEST_F(WorkflowableTest, PersistsAfterCompletedTransitionsOnly) {
    Article article(registry_);
    article.fire("submit");
    article.fire("review");

    EXPECT_FALSE(article.fire("accept", {false}));
    EXPECT_TRUE(article.isHalted());
    EXPECT_EQ(article.haltedBecause(), "coz I said so!");

    EXPECT_THROW(article.fireOrThrow("accept", {false}), HaltedError);
    EXPECT_THROW(article.fire("submit"), UndefinedTransitionError);

    article.fireOrThrow("accept", {true});
    EXPECT_TRUE(article.is("accepted"));
    EXPECT_FALSE(article.isHalted());
    EXPECT_EQ(article.persisted, (std::vector<std::string>{"awaiting_review", "being_reviewed", "accepted"}));
}

TEST_F(WorkflowableTest, LoadWorkflowStateRestoresWithoutRoutines) {
    Article article(registry_);
    article.loadWorkflowState("being_reviewed");

    EXPECT_TRUE(article.is("being_reviewed"));
    EXPECT_EQ(article.reviewRounds, 0);
    EXPECT_TRUE(article.persisted.empty());
    EXPECT_THROW(article.loadWorkflowState("published"), UnknownStateError);
}

TEST_F(WorkflowableTest, CopiesRebindHost) {
    Article original(registry_);
    original.fire("submit");

    Article copy(original);
    copy.fire("review");

    EXPECT_EQ(copy.reviewRounds, 1);
    EXPECT_EQ(original.reviewRounds, 0);
    EXPECT_TRUE(original.is("awaiting_review"));

    Article assigned(registry_);
    assigned = original;
    assigned.fire("review");
    EXPECT_EQ(assigned.reviewRounds, 1);
    EXPECT_EQ(original.reviewRounds, 0);
}

TEST_F(WorkflowableTest, HostOfRejectsForeignInstances) {
    WorkflowInstance bare(registry_.find("Article"), "awaiting_review");
    EXPECT_THROW(bare.fire("review"), std::invalid_argument);
    EXPECT_TRUE(bare.isState("being_reviewed"));

    Invoice invoice(registry_);
    invoice.fire("submit");
    EXPECT_THROW(invoice.fire("review"), std::bad_cast);
}

TEST_F(WorkflowableTest, UnknownSpecificationNameThrows) {
    class Ghost : public Workflowable {
    public:
        explicit Ghost(SpecificationRegistry &registry) : Workflowable("Ghost", registry) {}
    };

    EXPECT_THROW(Ghost{registry_}, WorkflowError);
}

TEST_F(WorkflowableTest, BindsDirectlyToSpecification) {
    Workflowable plain(registry_.find("Article"));
    plain.fire("submit");

    EXPECT_EQ(plain.currentState(), "awaiting_review");
    EXPECT_EQ(plain.workflow().getSpecificationName(), "Article");
}

TEST_F(WorkflowableTest, ArgumentsAreSharedWithCaller) {
    SpecBuilder("Ledger", registry_)
        .state("open",
               [](StateScope &s) {
                   s.event("post", "open", {}, [](ActionContext &ctx) { ctx.arg<int>(0) += 1; });
               })
        .onTransition([](WorkflowInstance &, const std::string &, const std::string &, const std::string &,
                         EventArgs &args) { std::any_cast<int &>(args.at(0)) *= 10; })
        .build();

    Ledger ledger(registry_);
    EventArgs args{0};

    ledger.fire("post", args);
    EXPECT_EQ(std::any_cast<int>(args.at(0)), 10);

    ledger.fireOrThrow("post", args);
    EXPECT_EQ(std::any_cast<int>(args.at(0)), 110);
}

TEST_F(WorkflowableTest, PersistsBeforeEntryRoutineRuns) {
    SpecBuilder("Ledger", registry_)
        .state("open", [](StateScope &s) { s.event("close", "closed"); })
        .state("closed",
               [](StateScope &s) {
                   s.onEntry([](WorkflowInstance &instance, const std::string &, const std::string &, EventArgs &) {
                       Ledger &ledger = Workflowable::hostOf<Ledger>(instance);
                       EXPECT_EQ(ledger.persisted.size(), 1u);
                       throw std::runtime_error("audit trail unavailable");
                   });
               })
        .build();

    Ledger ledger(registry_);
    EXPECT_THROW(ledger.fire("close"), std::runtime_error);

    EXPECT_TRUE(ledger.is("closed"));
    EXPECT_EQ(ledger.persisted, (std::vector<std::string>{"closed while in closed"}));
}

TEST_F(WorkflowableTest, CopyPersistsThroughItsOwnOverride) {
    SpecBuilder("Ledger", registry_)
        .state("open", [](StateScope &s) { s.event("close", "closed"); })
        .state("closed")
        .build();

    Ledger original(registry_);
    Ledger copy(original);
    copy.fire("close");

    EXPECT_TRUE(original.persisted.empty());
    EXPECT_EQ(copy.persisted, (std::vector<std::string>{"closed while in closed"}));
}
