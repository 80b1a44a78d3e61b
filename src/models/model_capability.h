#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "common/types.h"

namespace Lockstep {

/**
 * Anything with `double Sample(const LinkState&)`. Held by value; the wrapped
 * implementation is not required to derive from anything.
 *
 * family() and parameters() describe the distribution so that two resolutions
 * of the same spec can be compared without comparing instances.
 */
class FadingModel {
public:
    FadingModel() = default;

    template<typename Impl,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<Impl>, FadingModel>>>
    FadingModel(std::string family, AttributeMap parameters, Impl impl)
        : family_(std::move(family)),
          parameters_(std::move(parameters)),
          self_(std::make_unique<Holder<std::decay_t<Impl>>>(std::move(impl))) {}

    FadingModel(FadingModel&&) = default;
    FadingModel& operator=(FadingModel&&) = default;

    double Sample(const LinkState& link) { return self_->Sample(link); }

    explicit operator bool() const { return self_ != nullptr; }
    const std::string& family() const { return family_; }
    const AttributeMap& parameters() const { return parameters_; }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual double Sample(const LinkState& link) = 0;
    };

    template<typename Impl>
    struct Holder : Concept {
        explicit Holder(Impl i) : impl(std::move(i)) {}
        double Sample(const LinkState& link) override { return impl.Sample(link); }
        Impl impl;
    };

    std::string family_;
    AttributeMap parameters_;
    std::unique_ptr<Concept> self_;
};

/**
 * Anything with `Position Advance(const Position&, double dt)`.
 */
class MobilityModel {
public:
    MobilityModel() = default;

    template<typename Impl,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<Impl>, MobilityModel>>>
    MobilityModel(std::string family, AttributeMap parameters, Impl impl)
        : family_(std::move(family)),
          parameters_(std::move(parameters)),
          self_(std::make_unique<Holder<std::decay_t<Impl>>>(std::move(impl))) {}

    MobilityModel(MobilityModel&&) = default;
    MobilityModel& operator=(MobilityModel&&) = default;

    Position Advance(const Position& position, double dt) { return self_->Advance(position, dt); }

    explicit operator bool() const { return self_ != nullptr; }
    const std::string& family() const { return family_; }
    const AttributeMap& parameters() const { return parameters_; }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual Position Advance(const Position& position, double dt) = 0;
    };

    template<typename Impl>
    struct Holder : Concept {
        explicit Holder(Impl i) : impl(std::move(i)) {}
        Position Advance(const Position& position, double dt) override {
            return impl.Advance(position, dt);
        }
        Impl impl;
    };

    std::string family_;
    AttributeMap parameters_;
    std::unique_ptr<Concept> self_;
};

/**
 * Factory handles stored in the capability registry under a qualified
 * reference. The resolver calls them with the spec's parameters and a seed.
 */
using FadingFactory = std::function<FadingModel(const AttributeMap& parameters, uint64_t seed)>;
using MobilityFactory = std::function<MobilityModel(const AttributeMap& parameters, uint64_t seed)>;

} // namespace Lockstep
