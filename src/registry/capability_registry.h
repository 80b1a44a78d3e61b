#pragma once

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "common/errors.h"

namespace Lockstep {

enum class CapabilityKind {
    kAgent,
    kTool,
    kFactory,
};

const char* CapabilityKindName(CapabilityKind kind);

/**
 * Named handles to agents, tools and model/simulator factories.
 *
 * Each entry is built from its factory at most once; repeated Resolve calls
 * return the cached instance. Entries live as long as the registry and are
 * never evicted. Construction of one entry is serialized by a per-entry lock,
 * lookups of already-built entries only take the shared map lock.
 */
class CapabilityRegistry {
public:
    CapabilityRegistry() = default;
    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    /**
     * Register a factory under name.
     *
     * @throws ConfigurationError if the name is already taken
     */
    template<typename T>
    void Register(const std::string& name, CapabilityKind kind,
                  std::function<std::shared_ptr<T>()> factory) {
        RegisterErased(name, kind, std::type_index(typeid(T)),
            [factory = std::move(factory)]() -> std::shared_ptr<void> {
                return factory();
            });
    }

    // Register an already-constructed handle.
    template<typename T>
    void RegisterInstance(const std::string& name, CapabilityKind kind, std::shared_ptr<T> instance) {
        Register<T>(name, kind, [instance]() { return instance; });
    }

    /**
     * Return the instance registered under name_or_reference, constructing it
     * on first use.
     *
     * @throws UnknownCapabilityError for an unregistered plain alias
     * @throws ResolutionError for an unregistered qualified reference, a type
     *         mismatch, or a factory that throws or returns null
     */
    template<typename T>
    std::shared_ptr<T> Resolve(const std::string& name_or_reference) {
        return std::static_pointer_cast<T>(
            ResolveErased(name_or_reference, std::type_index(typeid(T))));
    }

    bool Contains(const std::string& name) const;

    // Agent names in registration order; stable for the registry's lifetime.
    std::vector<std::string> ListAgents() const;
    std::vector<std::string> List(CapabilityKind kind) const;

    static bool IsQualifiedReference(const std::string& name);

private:
    struct Entry {
        std::string name;
        CapabilityKind kind;
        std::type_index type;
        std::function<std::shared_ptr<void>()> factory;
        absl::Mutex mu;
        std::shared_ptr<void> instance;  // guarded by mu

        Entry(std::string n, CapabilityKind k, std::type_index t,
              std::function<std::shared_ptr<void>()> f)
            : name(std::move(n)), kind(k), type(t), factory(std::move(f)) {}
    };

    void RegisterErased(const std::string& name, CapabilityKind kind, std::type_index type,
                        std::function<std::shared_ptr<void>()> factory);
    std::shared_ptr<void> ResolveErased(const std::string& name, std::type_index type);
    Entry* Find(const std::string& name) const;

    mutable absl::Mutex mu_;
    absl::flat_hash_map<std::string, std::unique_ptr<Entry>> entries_;
    std::vector<Entry*> order_;
};

} // namespace Lockstep
