#include <gtest/gtest.h>
#include "../../src/orchestrator/builder.h"
#include "../../src/common/errors.h"

using namespace Lockstep;

TEST(BuilderTest, DelegateStepPolicyNames) {
    EXPECT_EQ(ParseDelegateStepPolicy("abort"), DelegateStepPolicy::kAbort);
    EXPECT_EQ(ParseDelegateStepPolicy("skip"), DelegateStepPolicy::kSkip);
    EXPECT_THROW(ParseDelegateStepPolicy("retry"), ConfigurationError);
}

TEST(BuilderTest, BuiltinCapabilitiesAreRegisteredOnce) {
    CapabilityRegistry registry;
    RegisterBuiltinCapabilities(registry);
    RegisterBuiltinCapabilities(registry);
    EXPECT_TRUE(registry.Contains("toy_radio"));
    EXPECT_TRUE(registry.Contains("lockstep.sims.ToyRadioSimulator"));
    EXPECT_TRUE(registry.Contains("power_control"));
}

TEST(BuilderTest, InstantiatedAgentsAreRegisteredUnderTheirIds) {
    CapabilityRegistry registry;
    RegisterBuiltinCapabilities(registry);
    InstantiateAgents({AgentSpec{"ue1", "power_control", {}}, AgentSpec{"idle", "hold", {}}}, registry);
    InstantiateTools({ToolSpec{"alloc", "softmax_allocator", {}}}, registry);

    EXPECT_EQ(registry.ListAgents(), (std::vector<std::string>{"ue1", "idle"}));
    EXPECT_EQ(registry.Resolve<IAgent>("idle")->Id(), "idle");
    EXPECT_EQ(registry.Resolve<ITool>("alloc")->Name(), "alloc");

    EXPECT_THROW(InstantiateAgents({AgentSpec{"ue2", "telepathy", {}}}, registry), UnknownCapabilityError);
    EXPECT_THROW(InstantiateAgents({AgentSpec{"ue1", "hold", {}}}, registry), ConfigurationError);
}
