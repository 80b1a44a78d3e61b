#include <gtest/gtest.h>
#include "../../src/models/model_resolver.h"
#include "../../src/common/errors.h"
#include <cmath>
#include <stdexcept>

using namespace Lockstep;

namespace {

ModelSpec Builtin(const std::string& target, const std::string& alias, AttributeMap params = {}) {
    ModelSpec spec;
    spec.target_id = target;
    spec.ref = BuiltinAlias{alias};
    spec.parameters = std::move(params);
    return spec;
}

ModelSpec Qualified(const std::string& target, const std::string& locator, AttributeMap params = {}) {
    ModelSpec spec;
    spec.target_id = target;
    spec.ref = QualifiedReference{locator};
    spec.parameters = std::move(params);
    return spec;
}

struct ConstantGain {
    double gain;
    double Sample(const LinkState&) { return gain; }
};

struct Stationary {
    Position Advance(const Position& p, double) { return p; }
};

double Mean(std::vector<double>& values) {
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / values.size();
}

double Variance(std::vector<double>& values) {
    double mean = Mean(values);
    double sum = 0.0;
    for (double v : values) sum += (v - mean) * (v - mean);
    return sum / values.size();
}

} // namespace

class ModelResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        context_ = std::make_unique<BuildContext>(17);
        resolver_ = std::make_unique<ModelResolver>(*context_);
    }

    std::vector<double> Draw(FadingModel& model, int n) {
        std::vector<double> samples;
        LinkState link{"ch", 50.0, 10.0, 0};
        for (int i = 0; i < n; ++i) {
            samples.push_back(model.Sample(link));
        }
        return samples;
    }

    std::unique_ptr<BuildContext> context_;
    std::unique_ptr<ModelResolver> resolver_;
};

TEST_F(ModelResolverTest, SameSpecYieldsEquivalentModels) {
    ModelSpec spec = Builtin("ch", "rician", {{"k_factor", 3.0}, {"sigma", 1.0}});
    FadingModel a = resolver_->ResolveFading(spec, 1);
    FadingModel b = resolver_->ResolveFading(spec, 2);

    EXPECT_EQ(a.family(), "rician");
    EXPECT_EQ(a.family(), b.family());
    EXPECT_EQ(ToString(a.parameters()), ToString(b.parameters()));

    // Different seeds, same distribution
    auto xs = Draw(a, 20000);
    auto ys = Draw(b, 20000);
    EXPECT_NEAR(Mean(xs), Mean(ys), 0.05);
    EXPECT_NEAR(Variance(xs), Variance(ys), 0.1);
}

TEST_F(ModelResolverTest, SeedParameterReplaysSequence) {
    ModelSpec spec = Builtin("ch", "rayleigh", {{"seed", int64_t{123}}});
    FadingModel a = resolver_->ResolveFading(spec, 1);
    FadingModel b = resolver_->ResolveFading(spec, 999);
    EXPECT_EQ(Draw(a, 50), Draw(b, 50));
}

TEST_F(ModelResolverTest, AliasesAreCaseInsensitive) {
    FadingModel model = resolver_->ResolveFading(Builtin("ch", "Rayleigh"), 0);
    EXPECT_EQ(model.family(), "rayleigh");
    EXPECT_DOUBLE_EQ(GetNumber(model.parameters(), "sigma", 0.0), 6.0);
}

TEST_F(ModelResolverTest, NakagamiRequiresShapeAndSpread) {
    EXPECT_THROW(resolver_->ResolveFading(Builtin("ch", "nakagami", {{"omega", 1.0}}), 0),
                 InvalidModelParametersError);
    EXPECT_THROW(resolver_->ResolveFading(Builtin("ch", "nakagami", {{"m_factor", 0.0}, {"omega", 1.0}}), 0),
                 InvalidModelParametersError);
    EXPECT_THROW(resolver_->ResolveFading(Builtin("ch", "nakagami", {{"m_factor", 1.0}, {"omega", -2.0}}), 0),
                 InvalidModelParametersError);

    FadingModel ok = resolver_->ResolveFading(
        Builtin("ch", "nakagami", {{"m_factor", 2.0}, {"omega", 1.0}}), 0);
    EXPECT_EQ(ok.family(), "nakagami");
}

TEST_F(ModelResolverTest, RejectsUnknownAndNonNumericParameters) {
    EXPECT_THROW(resolver_->ResolveFading(Builtin("ch", "rician", {{"k", 1.0}}), 0),
                 InvalidModelParametersError);
    EXPECT_THROW(resolver_->ResolveFading(Builtin("ch", "rician", {{"sigma", std::string("wide")}}), 0),
                 InvalidModelParametersError);
    EXPECT_THROW(resolver_->ResolveFading(Builtin("ch", "rician", {{"sigma", true}}), 0),
                 InvalidModelParametersError);
    EXPECT_THROW(resolver_->ResolveMobility(Builtin("ue", "random_walk", {{"seed", 1.5}}), 0),
                 InvalidModelParametersError);
}

TEST_F(ModelResolverTest, UnknownAliasAndMissingReference) {
    EXPECT_THROW(resolver_->ResolveFading(Builtin("ch", "weibull"), 0), UnknownCapabilityError);
    EXPECT_THROW(resolver_->ResolveFading(Qualified("ch", "acme.fading.Weibull"), 0), ResolutionError);
    // A mobility alias is not a fading alias
    EXPECT_THROW(resolver_->ResolveFading(Builtin("ch", "random_walk"), 0), UnknownCapabilityError);
}

TEST_F(ModelResolverTest, RegisteredFactoryReceivesParametersAndSeed) {
    uint64_t seen_seed = 0;
    auto factory = std::make_shared<FadingFactory>(
        [&seen_seed](const AttributeMap& params, uint64_t seed) {
            seen_seed = seed;
            return FadingModel("constant", params, ConstantGain{GetNumber(params, "gain", 0.0)});
        });
    context_->registry().RegisterInstance<FadingFactory>("acme.fading.Constant",
                                                         CapabilityKind::kFactory, factory);

    FadingModel model = resolver_->ResolveFading(Qualified("ch", "acme.fading.Constant", {{"gain", -3.0}}), 42);
    EXPECT_EQ(seen_seed, 42u);
    EXPECT_EQ(model.family(), "constant");
    EXPECT_DOUBLE_EQ(model.Sample(LinkState{}), -3.0);
}

TEST_F(ModelResolverTest, FailingFactoryIsModelResolutionError) {
    context_->registry().RegisterInstance<MobilityFactory>("acme.Broken", CapabilityKind::kFactory,
        std::make_shared<MobilityFactory>([](const AttributeMap&, uint64_t) -> MobilityModel {
            throw std::runtime_error("no such terrain");
        }));
    context_->registry().RegisterInstance<MobilityFactory>("acme.Empty", CapabilityKind::kFactory,
        std::make_shared<MobilityFactory>([](const AttributeMap&, uint64_t) { return MobilityModel(); }));

    EXPECT_THROW(resolver_->ResolveMobility(Qualified("ue", "acme.Broken"), 0), ModelResolutionError);
    EXPECT_THROW(resolver_->ResolveMobility(Qualified("ue", "acme.Empty"), 0), ModelResolutionError);
}

TEST_F(ModelResolverTest, LaterOverrideForSameTargetWins) {
    std::vector<ModelSpec> specs = {
        Builtin("ch1", "rician"),
        Builtin("ch2", "rayleigh"),
        Builtin("ch1", "nakagami", {{"m_factor", 1.0}, {"omega", 2.0}}),
    };
    auto resolved = resolver_->ResolveFadingOverrides(specs, 5);

    ASSERT_EQ(resolved.size(), 2u);
    EXPECT_EQ(resolved.at("ch1").family(), "nakagami");
    EXPECT_EQ(resolved.at("ch2").family(), "rayleigh");
}

TEST_F(ModelResolverTest, OverridesNeedATarget) {
    EXPECT_THROW(resolver_->ResolveMobilityOverrides({Builtin("", "random_walk")}, 0), ConfigurationError);
}

TEST_F(ModelResolverTest, RandomWalkStaysWithinStepBounds) {
    MobilityModel walk = resolver_->ResolveMobility(Builtin("ue", "random_walk", {{"step_size", 2.0}}), 3);
    Position p{0.0, 0.0};
    for (int i = 0; i < 100; ++i) {
        Position next = walk.Advance(p, 0.5);
        EXPECT_LE(std::fabs(next.x - p.x), 1.0 + 1e-12);
        EXPECT_LE(std::fabs(next.y - p.y), 1.0 + 1e-12);
        p = next;
    }

    context_->registry().RegisterInstance<MobilityFactory>("acme.Stationary", CapabilityKind::kFactory,
        std::make_shared<MobilityFactory>([](const AttributeMap& params, uint64_t) {
            return MobilityModel("stationary", params, Stationary{});
        }));
    MobilityModel still = resolver_->ResolveMobility(Qualified("ue", "acme.Stationary"), 0);
    EXPECT_EQ(still.Advance(Position{1.0, 2.0}, 1.0), (Position{1.0, 2.0}));
}
