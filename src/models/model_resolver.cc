#include "model_resolver.h"

#include <cmath>

#include <glog/logging.h>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "models/stochastic_models.h"

namespace Lockstep {

namespace {

constexpr char kRician[] = "rician";
constexpr char kRayleigh[] = "rayleigh";
constexpr char kNakagami[] = "nakagami";
constexpr char kRandomWalk[] = "random_walk";
constexpr char kSeedKey[] = "seed";

// Reads numeric parameters for one built-in family and rejects leftovers.
class ParameterReader {
public:
    ParameterReader(const std::string& family, const AttributeMap& params)
        : family_(family), params_(params) {}

    double Required(const std::string& key) {
        auto it = params_.find(key);
        if (it == params_.end()) {
            throw InvalidModelParametersError(
                absl::StrCat(family_, ": missing required parameter '", key, "'"));
        }
        return Number(key, it->second);
    }

    double Optional(const std::string& key, double fallback) {
        auto it = params_.find(key);
        if (it == params_.end()) {
            return fallback;
        }
        return Number(key, it->second);
    }

    uint64_t Seed(uint64_t fallback) {
        auto it = params_.find(kSeedKey);
        if (it == params_.end()) {
            return fallback;
        }
        consumed_.insert(kSeedKey);
        const auto* seed = std::get_if<int64_t>(&it->second);
        if (seed == nullptr) {
            throw InvalidModelParametersError(absl::StrCat(family_, ": 'seed' must be an integer"));
        }
        return static_cast<uint64_t>(*seed);
    }

    void RequirePositive(const std::string& key, double value) const {
        if (!(value > 0.0)) {
            throw InvalidModelParametersError(
                absl::StrCat(family_, ": '", key, "' must be > 0, got ", value));
        }
    }

    void RequireNonNegative(const std::string& key, double value) const {
        if (!(value >= 0.0)) {
            throw InvalidModelParametersError(
                absl::StrCat(family_, ": '", key, "' must be >= 0, got ", value));
        }
    }

    void Finish() const {
        std::vector<std::string> unknown;
        for (const auto& [key, value] : params_) {
            if (!consumed_.contains(key)) {
                unknown.push_back(key);
            }
        }
        if (!unknown.empty()) {
            throw InvalidModelParametersError(
                absl::StrCat(family_, ": unknown parameter(s) ", absl::StrJoin(unknown, ", ")));
        }
    }

private:
    double Number(const std::string& key, const Attribute& value) {
        consumed_.insert(key);
        auto number = AsNumber(value);
        if (!number.has_value() || std::holds_alternative<bool>(value) || !std::isfinite(*number)) {
            throw InvalidModelParametersError(
                absl::StrCat(family_, ": '", key, "' must be a finite number"));
        }
        return *number;
    }

    std::string family_;
    const AttributeMap& params_;
    absl::flat_hash_set<std::string> consumed_;
};

FadingModel BuildBuiltinFading(const std::string& alias, const AttributeMap& params, uint64_t default_seed) {
    ParameterReader reader(alias, params);
    uint64_t seed = reader.Seed(default_seed);

    if (alias == kRician) {
        double k_factor = reader.Optional("k_factor", 5.0);
        double sigma = reader.Optional("sigma", 2.0);
        reader.RequireNonNegative("k_factor", k_factor);
        reader.RequirePositive("sigma", sigma);
        reader.Finish();
        return FadingModel(kRician, {{"k_factor", k_factor}, {"sigma", sigma}},
                           RicianFading(k_factor, sigma, seed));
    }
    if (alias == kRayleigh) {
        double sigma = reader.Optional("sigma", 6.0);
        reader.RequirePositive("sigma", sigma);
        reader.Finish();
        return FadingModel(kRayleigh, {{"sigma", sigma}}, RayleighFading(sigma, seed));
    }
    // nakagami
    double m_factor = reader.Required("m_factor");
    double omega = reader.Required("omega");
    reader.RequirePositive("m_factor", m_factor);
    reader.RequirePositive("omega", omega);
    reader.Finish();
    return FadingModel(kNakagami, {{"m_factor", m_factor}, {"omega", omega}},
                       NakagamiFading(m_factor, omega, seed));
}

MobilityModel BuildBuiltinMobility(const AttributeMap& params, uint64_t default_seed) {
    ParameterReader reader(kRandomWalk, params);
    uint64_t seed = reader.Seed(default_seed);
    double step_size = reader.Optional("step_size", 0.5);
    reader.RequirePositive("step_size", step_size);
    reader.Finish();
    return MobilityModel(kRandomWalk, {{"step_size", step_size}}, RandomWalkMobility(step_size, seed));
}

// Runs a registered factory, keeping configuration errors as they are and
// wrapping anything else with the model name.
template<typename Model, typename Factory>
Model InvokeFactory(const ModelSpec& spec, const Factory& factory, uint64_t seed) {
    Model model;
    try {
        model = factory(spec.parameters, seed);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ModelResolutionError(
            absl::StrCat("Model '", spec.name(), "' for '", spec.target_id, "' failed to construct: ", e.what()));
    }
    if (!model) {
        throw ModelResolutionError(
            absl::StrCat("Model '", spec.name(), "' for '", spec.target_id, "' returned an empty model"));
    }
    return model;
}

} // namespace

bool ModelResolver::IsBuiltinFading(const std::string& alias) {
    return alias == kRician || alias == kRayleigh || alias == kNakagami;
}

bool ModelResolver::IsBuiltinMobility(const std::string& alias) {
    return alias == kRandomWalk;
}

FadingModel ModelResolver::ResolveFading(const ModelSpec& spec, uint64_t default_seed) const {
    if (spec.is_builtin()) {
        std::string alias = absl::AsciiStrToLower(spec.name());
        if (IsBuiltinFading(alias)) {
            return BuildBuiltinFading(alias, spec.parameters, default_seed);
        }
    }
    auto factory = context_.registry().Resolve<FadingFactory>(spec.name());
    return InvokeFactory<FadingModel>(spec, *factory, default_seed);
}

MobilityModel ModelResolver::ResolveMobility(const ModelSpec& spec, uint64_t default_seed) const {
    if (spec.is_builtin()) {
        std::string alias = absl::AsciiStrToLower(spec.name());
        if (IsBuiltinMobility(alias)) {
            return BuildBuiltinMobility(spec.parameters, default_seed);
        }
    }
    auto factory = context_.registry().Resolve<MobilityFactory>(spec.name());
    return InvokeFactory<MobilityModel>(spec, *factory, default_seed);
}

absl::btree_map<std::string, FadingModel> ModelResolver::ResolveFadingOverrides(
        const std::vector<ModelSpec>& specs, uint64_t base_seed) const {
    absl::btree_map<std::string, FadingModel> resolved;
    for (const ModelSpec& spec : specs) {
        if (spec.target_id.empty()) {
            throw ConfigurationError(absl::StrCat("Fading model '", spec.name(), "' has no channel_id"));
        }
        FadingModel model = ResolveFading(spec, DeriveSeed(base_seed, spec.target_id));
        auto it = resolved.find(spec.target_id);
        if (it != resolved.end()) {
            VLOG(1) << "[ModelResolver] channel '" << spec.target_id << "': " << it->second.family()
                    << " replaced by " << model.family();
            it->second = std::move(model);
        } else {
            resolved.emplace(spec.target_id, std::move(model));
        }
    }
    return resolved;
}

absl::btree_map<std::string, MobilityModel> ModelResolver::ResolveMobilityOverrides(
        const std::vector<ModelSpec>& specs, uint64_t base_seed) const {
    absl::btree_map<std::string, MobilityModel> resolved;
    for (const ModelSpec& spec : specs) {
        if (spec.target_id.empty()) {
            throw ConfigurationError(absl::StrCat("Mobility model '", spec.name(), "' has no agent_id"));
        }
        MobilityModel model = ResolveMobility(spec, DeriveSeed(base_seed, spec.target_id));
        auto it = resolved.find(spec.target_id);
        if (it != resolved.end()) {
            VLOG(1) << "[ModelResolver] agent '" << spec.target_id << "': " << it->second.family()
                    << " replaced by " << model.family();
            it->second = std::move(model);
        } else {
            resolved.emplace(spec.target_id, std::move(model));
        }
    }
    return resolved;
}

} // namespace Lockstep
