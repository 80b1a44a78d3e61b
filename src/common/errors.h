#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Lockstep {

/**
 * Build-time failure. Raised while turning configuration into live objects;
 * never recoverable, the run aborts before any step executes.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// A plain (unqualified) capability name that nothing registered.
class UnknownCapabilityError : public ConfigurationError {
public:
    explicit UnknownCapabilityError(const std::string& name)
        : ConfigurationError("Unknown capability '" + name + "'"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// A qualified reference that cannot be located, or whose constructor failed.
class ResolutionError : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

class ModelResolutionError : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

class InvalidModelParametersError : public ModelResolutionError {
public:
    using ModelResolutionError::ModelResolutionError;
};

class AgentIdCollisionError : public ConfigurationError {
public:
    AgentIdCollisionError(const std::string& agent_id,
                          const std::string& first_delegate,
                          const std::string& second_delegate)
        : ConfigurationError("Agent id '" + agent_id + "' is claimed by delegates '" +
                             first_delegate + "' and '" + second_delegate + "'"),
          agent_id_(agent_id) {}

    const std::string& agent_id() const { return agent_id_; }

private:
    std::string agent_id_;
};

/**
 * Thrown by agents that cannot produce a proposal this step. The coordinator
 * records it against the agent and keeps going.
 */
class ProposalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A delegate simulator failed inside Step. Carries the delegate name and the
 * orchestrator step index so the failure can be reproduced.
 */
class DelegateStepError : public std::runtime_error {
public:
    DelegateStepError(const std::string& delegate, int64_t step, const std::string& cause)
        : std::runtime_error("Delegate '" + delegate + "' failed at step " +
                             std::to_string(step) + ": " + cause),
          delegate_(delegate), step_(step), cause_(cause) {}

    const std::string& delegate() const { return delegate_; }
    int64_t step() const { return step_; }
    const std::string& cause() const { return cause_; }

private:
    std::string delegate_;
    int64_t step_;
    std::string cause_;
};

class DelegateTimeoutError : public DelegateStepError {
public:
    DelegateTimeoutError(const std::string& delegate, int64_t step, int64_t deadline_ms)
        : DelegateStepError(delegate, step,
                            "step exceeded deadline of " + std::to_string(deadline_ms) + "ms") {}
};

} // namespace Lockstep
