#include <gtest/gtest.h>
#include "../../src/orchestrator/telemetry.h"
#include "../../src/common/errors.h"
#include <cmath>
#include <stdexcept>
#include <thread>

using namespace Lockstep;

class MetricRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        transition_.observations["ue1"] = Observation{{"snr_db", 10.0}, {"energy_cost", 0.5}};
        transition_.observations["ue2"] = Observation{{"snr_db", 10.0}, {"energy_cost", 1.5}};
        plan_.committed = {"ue1"};
        plan_.telemetry.utilities["ue1"] = 2.0;
        plan_.telemetry.utilities["ue2"] = 1.0;
        plan_.telemetry.excluded["ue3"] = "no estimate";
    }

    Plan plan_;
    Transition transition_;
};

TEST_F(MetricRegistryTest, DefaultKpis) {
    MetricRegistry metrics = MetricRegistry::WithDefaults();
    EXPECT_EQ(metrics.names(), (std::vector<std::string>{"energy", "fairness", "handoff_success", "throughput"}));

    auto values = metrics.Compute(plan_, transition_);
    EXPECT_DOUBLE_EQ(values.at("energy"), 2.0);
    EXPECT_DOUBLE_EQ(values.at("throughput"), 20.0);
    // Equal SNR is perfectly fair
    EXPECT_DOUBLE_EQ(values.at("fairness"), 1.0);
    EXPECT_DOUBLE_EQ(values.at("handoff_success"), 1.0 / 3.0);
}

TEST_F(MetricRegistryTest, FairnessDropsWithImbalance) {
    transition_.observations["ue2"]["snr_db"] = 20.0;
    auto values = MetricRegistry::WithDefaults().Compute(plan_, transition_);
    EXPECT_LT(values.at("fairness"), 1.0);
    EXPECT_GT(values.at("fairness"), 0.5);

    EXPECT_DOUBLE_EQ(MetricRegistry::WithDefaults().Compute(Plan{}, Transition{}).at("fairness"), 0.0);
}

TEST_F(MetricRegistryTest, RegistrationRules) {
    MetricRegistry metrics = MetricRegistry::WithDefaults();
    auto constant = [](const Plan&, const Transition&) { return 42.0; };

    EXPECT_THROW(metrics.Register("energy", constant), ConfigurationError);
    EXPECT_THROW(metrics.Register("", constant), ConfigurationError);
    EXPECT_THROW(metrics.Register("latency", MetricRegistry::MetricFn{}), ConfigurationError);

    metrics.Register("energy", constant, true);
    metrics.Register("latency", constant);
    auto values = metrics.Compute(plan_, transition_);
    EXPECT_DOUBLE_EQ(values.at("energy"), 42.0);
    EXPECT_TRUE(metrics.Contains("latency"));
}

TEST_F(MetricRegistryTest, FailingMetricBecomesNaN) {
    MetricRegistry metrics;
    metrics.Register("broken", [](const Plan&, const Transition&) -> double {
        throw std::runtime_error("division by zero");
    });
    metrics.Register("fine", [](const Plan& plan, const Transition&) {
        return static_cast<double>(plan.committed.size());
    });

    auto values = metrics.Compute(plan_, transition_);
    EXPECT_TRUE(std::isnan(values.at("broken")));
    EXPECT_DOUBLE_EQ(values.at("fine"), 1.0);
}

TEST(MemoryTelemetrySinkTest, KeepsRecordsInOrder) {
    MemoryTelemetrySink sink;
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&sink, t]() {
            for (int i = 0; i < 25; ++i) {
                TelemetryRecord record;
                record.step_index = t * 100 + i;
                sink.Record(record);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    EXPECT_EQ(sink.size(), 100u);

    MemoryTelemetrySink ordered;
    for (int64_t i = 0; i < 3; ++i) {
        TelemetryRecord record;
        record.step_index = i;
        record.rewards["ue1"] = static_cast<double>(i);
        ordered.Record(record);
    }
    auto records = ordered.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2].step_index, 2);
    EXPECT_DOUBLE_EQ(records[1].rewards.at("ue1"), 1.0);
}

TEST(LoggingTelemetrySinkTest, AcceptsRecords) {
    LoggingTelemetrySink sink;
    TelemetryRecord record;
    record.plan_summary = "committed=[ue1]";
    record.rewards["ue1"] = 0.5;
    record.metrics["energy"] = 1.0;
    sink.Record(record);
    sink.Flush();
}
