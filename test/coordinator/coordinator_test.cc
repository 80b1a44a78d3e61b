#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/coordinator/coordinator.h"
#include "../../src/common/errors.h"
#include <atomic>
#include <cmath>
#include <limits>

using namespace Lockstep;
using ::testing::_;
using ::testing::Return;
using ::testing::ReturnRef;

namespace {

// Bids a fixed utility; optionally fails instead.
class FixedAgent : public IAgent {
public:
    FixedAgent(AgentId id, double utility) : id_(std::move(id)), utility_(utility) {}

    const AgentId& Id() const override { return id_; }

    Proposal Propose(const Observation& observation) override {
        ++calls;
        if (fail_with_proposal_error) {
            throw ProposalError(id_ + " has no estimate");
        }
        if (fail_with_runtime_error) {
            throw std::runtime_error(id_ + " crashed");
        }
        Proposal proposal;
        proposal.agent_id = reported_id.empty() ? id_ : reported_id;
        proposal.action["power"] = utility_;
        proposal.utility = utility_;
        proposal.metadata = metadata;
        return proposal;
    }

    bool fail_with_proposal_error = false;
    bool fail_with_runtime_error = false;
    AgentId reported_id;
    AttributeMap metadata;
    std::atomic<int> calls{0};

private:
    AgentId id_;
    double utility_;
};

class MockAgent : public IAgent {
public:
    MOCK_METHOD(const AgentId&, Id, (), (const, override));
    MOCK_METHOD(Proposal, Propose, (const Observation& observation), (override));
};

class RecordingTool : public ITool {
public:
    const std::string& Name() const override { return name_; }
    AttributeMap Call(const AttributeMap& args) override {
        seen = args;
        if (fail) {
            throw std::runtime_error("solver infeasible");
        }
        return AttributeMap{{"status", std::string("optimal")}};
    }

    bool fail = false;
    AttributeMap seen;

private:
    std::string name_ = "solver";
};

} // namespace

class CoordinatorTest : public ::testing::Test {
protected:
    std::shared_ptr<FixedAgent> Add(const AgentId& id, double utility) {
        auto agent = std::make_shared<FixedAgent>(id, utility);
        registry_.RegisterInstance<IAgent>(id, CapabilityKind::kAgent, agent);
        return agent;
    }

    std::unique_ptr<Coordinator> Make(CoordinatorOptions options = {}) {
        return std::make_unique<Coordinator>(registry_, std::make_unique<MaxUtilityPolicy>(), options);
    }

    CapabilityRegistry registry_;
    Transition latest_;
};

TEST_F(CoordinatorTest, CommitsHighestUtility) {
    Add("a", 1.0);
    Add("b", 3.0);
    Add("c", 2.0);
    auto coordinator = Make();

    Plan plan = coordinator->Step(latest_, {"a", "b", "c"});

    EXPECT_EQ(plan.committed, std::vector<AgentId>{"b"});
    ASSERT_TRUE(plan.telemetry.selected.has_value());
    EXPECT_EQ(*plan.telemetry.selected, "b");
    EXPECT_DOUBLE_EQ(GetNumber(plan.actions.at("b"), "power", 0.0), 3.0);
    // Everyone else holds
    EXPECT_TRUE(GetBool(plan.actions.at("a"), kHoldActionKey, false));
    EXPECT_TRUE(GetBool(plan.actions.at("c"), kHoldActionKey, false));

    ASSERT_EQ(plan.telemetry.ranked.size(), 3u);
    EXPECT_EQ(plan.telemetry.ranked[0].agent_id, "b");
    EXPECT_EQ(plan.telemetry.ranked[1].agent_id, "c");
    EXPECT_EQ(plan.telemetry.ranked[2].agent_id, "a");
}

TEST_F(CoordinatorTest, TieGoesToEarlierRegistration) {
    Add("late", 2.0);
    Add("early", 2.0);
    auto coordinator = Make();

    Plan plan = coordinator->Step(latest_, {});
    EXPECT_EQ(plan.committed, std::vector<AgentId>{"late"});
    EXPECT_EQ(plan.actions.size(), 1u);
}

TEST_F(CoordinatorTest, FailingAgentIsExcludedButStillGetsDefault) {
    auto broken = Add("broken", 100.0);
    broken->fail_with_proposal_error = true;
    Add("ok", 0.5);
    auto coordinator = Make();

    Plan plan = coordinator->Step(latest_, {"broken", "ok"});

    EXPECT_EQ(plan.committed, std::vector<AgentId>{"ok"});
    EXPECT_EQ(plan.telemetry.excluded.count("broken"), 1u);
    EXPECT_NE(plan.telemetry.excluded.at("broken").find("no estimate"), std::string::npos);
    EXPECT_EQ(plan.telemetry.utilities.count("broken"), 0u);
    EXPECT_EQ(plan.actions.at("broken"), coordinator->options().default_action);

    // Exclusion lasts one step only
    broken->fail_with_proposal_error = false;
    Plan next = coordinator->Step(latest_, {"broken", "ok"});
    EXPECT_EQ(next.committed, std::vector<AgentId>{"broken"});
    EXPECT_TRUE(next.telemetry.excluded.empty());
}

TEST_F(CoordinatorTest, OutcomesCarryFailureKinds) {
    Add("unavailable", 1.0)->fail_with_proposal_error = true;
    Add("crashed", 1.0)->fail_with_runtime_error = true;
    Add("impostor", 1.0)->reported_id = "someone_else";
    Add("nan", std::numeric_limits<double>::quiet_NaN());
    Add("fine", 1.0);
    Add("inf", std::numeric_limits<double>::infinity());
    Add("neg_inf", -std::numeric_limits<double>::infinity());
    auto coordinator = Make();

    std::vector<ProposalOutcome> outcomes = coordinator->CollectProposals(latest_);
    ASSERT_EQ(outcomes.size(), 7u);
    EXPECT_TRUE(absl::IsUnavailable(outcomes[0].proposal.status()));
    EXPECT_TRUE(absl::IsInternal(outcomes[1].proposal.status()));
    EXPECT_TRUE(absl::IsInvalidArgument(outcomes[2].proposal.status()));
    EXPECT_TRUE(absl::IsInvalidArgument(outcomes[3].proposal.status()));
    EXPECT_TRUE(outcomes[4].proposal.ok());
    // Infinite bids would always win the ranking
    EXPECT_TRUE(absl::IsInvalidArgument(outcomes[5].proposal.status()));
    EXPECT_TRUE(absl::IsInvalidArgument(outcomes[6].proposal.status()));

    Plan plan = coordinator->Step(latest_, {});
    EXPECT_EQ(plan.committed, std::vector<AgentId>{"fine"});
    EXPECT_EQ(plan.telemetry.excluded.count("inf"), 1u);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        EXPECT_EQ(outcomes[i].registry_index, i);
    }
}

TEST_F(CoordinatorTest, AllFailuresYieldAllDefaultPlan) {
    Add("a", 1.0)->fail_with_proposal_error = true;
    Add("b", 1.0)->fail_with_runtime_error = true;
    auto coordinator = Make();

    Plan plan = coordinator->Step(latest_, {"a", "b"});
    EXPECT_TRUE(plan.committed.empty());
    EXPECT_FALSE(plan.telemetry.selected.has_value());
    EXPECT_EQ(plan.actions.size(), 2u);
    EXPECT_EQ(plan.telemetry.excluded.size(), 2u);
}

TEST_F(CoordinatorTest, DefaultsOnlyForKnownOrObservedAgents) {
    Add("a", 1.0);
    latest_.observations["passive"] = Observation{{"snr_db", 3.0}};
    CoordinatorOptions options;
    options.default_action = Action{{"power", 0.0}};
    auto coordinator = Make(options);

    Plan plan = coordinator->Step(latest_, {"a", "passive", "phantom"});
    EXPECT_EQ(plan.actions.count("passive"), 1u);
    EXPECT_DOUBLE_EQ(GetNumber(plan.actions.at("passive"), "power", -1.0), 0.0);
    EXPECT_EQ(plan.actions.count("phantom"), 0u);
}

TEST_F(CoordinatorTest, ParallelCollectionMatchesSequential) {
    for (int i = 0; i < 8; ++i) {
        Add("agent" + std::to_string(i), static_cast<double>((i * 5) % 8));
    }
    CoordinatorOptions parallel;
    parallel.proposal_workers = 4;
    auto concurrent = Make(parallel);
    auto sequential = Make();

    for (int step = 0; step < 5; ++step) {
        Plan a = concurrent->Step(latest_, {});
        Plan b = sequential->Step(latest_, {});
        EXPECT_EQ(a.committed, b.committed);
        EXPECT_EQ(a.actions, b.actions);
        EXPECT_EQ(a.telemetry.ToAttributes(), b.telemetry.ToAttributes());
    }
}

TEST_F(CoordinatorTest, AgentsSeeTheirOwnSlice) {
    auto mock = std::make_shared<MockAgent>();
    AgentId id = "ue1";
    EXPECT_CALL(*mock, Id()).WillRepeatedly(ReturnRef(id));
    Observation slice{{"snr_db", 7.0}};
    latest_.observations["ue1"] = slice;
    latest_.observations["ue2"] = Observation{{"snr_db", 1.0}};
    EXPECT_CALL(*mock, Propose(slice)).WillOnce(Return(Proposal{"ue1", Action{{"power", 1.0}}, 0.1, {}}));
    registry_.RegisterInstance<IAgent>("ue1", CapabilityKind::kAgent, mock);

    auto coordinator = Make();
    Plan plan = coordinator->Step(latest_, {"ue1"});
    EXPECT_EQ(plan.committed, std::vector<AgentId>{"ue1"});
}

TEST_F(CoordinatorTest, AgentIdMustMatchRegistryName) {
    registry_.RegisterInstance<IAgent>("alias", CapabilityKind::kAgent, std::make_shared<FixedAgent>("real", 1.0));
    EXPECT_THROW(Make(), ConfigurationError);
}

TEST_F(CoordinatorTest, OptimizerSeesUtilitiesAndFailureIsRecorded) {
    Add("a", 1.0);
    Add("b", 2.0);
    auto tool = std::make_shared<RecordingTool>();
    registry_.RegisterInstance<ITool>("solver", CapabilityKind::kTool, tool);
    CoordinatorOptions options;
    options.optimizer_tool = "solver";
    auto coordinator = Make(options);

    Plan plan = coordinator->Step(latest_, {});
    EXPECT_DOUBLE_EQ(GetNumber(tool->seen, "utility.a", 0.0), 1.0);
    EXPECT_DOUBLE_EQ(GetNumber(tool->seen, "utility.b", 0.0), 2.0);
    EXPECT_EQ(GetString(plan.telemetry.ToAttributes(), "optimizer.status", ""), "optimal");

    tool->fail = true;
    Plan failed = coordinator->Step(latest_, {});
    EXPECT_EQ(failed.committed, std::vector<AgentId>{"b"});
    EXPECT_EQ(GetString(failed.telemetry.optimizer, "error", ""), "solver infeasible");
}

TEST_F(CoordinatorTest, MissingOptimizerToolFailsConstruction) {
    Add("a", 1.0);
    CoordinatorOptions options;
    options.optimizer_tool = "nowhere";
    EXPECT_THROW(Make(options), UnknownCapabilityError);
}

TEST_F(CoordinatorTest, TelemetryAttributes) {
    Add("a", 1.0)->fail_with_proposal_error = true;
    Add("b", 2.0);
    Add("c", 0.5);
    auto coordinator = Make();

    AttributeMap flat = coordinator->Step(latest_, {}).telemetry.ToAttributes();
    EXPECT_EQ(GetString(flat, "policy", ""), "max_utility");
    EXPECT_EQ(GetString(flat, "selected", ""), "b");
    EXPECT_EQ(GetString(flat, "ranked", ""), "b,c");
    EXPECT_DOUBLE_EQ(GetNumber(flat, "utility.c", 0.0), 0.5);
    EXPECT_EQ(flat.count("excluded.a"), 1u);
}
