#include "capability_registry.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/specs.h"

namespace Lockstep {

const char* CapabilityKindName(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::kAgent:
            return "agent";
        case CapabilityKind::kTool:
            return "tool";
        case CapabilityKind::kFactory:
            return "factory";
    }
    return "unknown";
}

bool CapabilityRegistry::IsQualifiedReference(const std::string& name) {
    return ::Lockstep::IsQualifiedReference(name);
}

void CapabilityRegistry::RegisterErased(const std::string& name, CapabilityKind kind,
                                        std::type_index type,
                                        std::function<std::shared_ptr<void>()> factory) {
    if (name.empty()) {
        throw ConfigurationError("Capability name must not be empty");
    }
    if (!factory) {
        throw ConfigurationError(absl::StrCat("Factory for '", name, "' must be callable"));
    }

    absl::MutexLock lock(&mu_);
    if (entries_.contains(name)) {
        throw ConfigurationError(absl::StrCat("Capability '", name, "' is already registered"));
    }
    auto entry = std::make_unique<Entry>(name, kind, type, std::move(factory));
    order_.push_back(entry.get());
    entries_.emplace(name, std::move(entry));
    VLOG(3) << "[CapabilityRegistry] registered " << CapabilityKindName(kind) << " '" << name << "'";
}

CapabilityRegistry::Entry* CapabilityRegistry::Find(const std::string& name) const {
    absl::ReaderMutexLock lock(&mu_);
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : it->second.get();
}

std::shared_ptr<void> CapabilityRegistry::ResolveErased(const std::string& name, std::type_index type) {
    Entry* entry = Find(name);
    if (entry == nullptr) {
        if (IsQualifiedReference(name)) {
            throw ResolutionError(absl::StrCat("Qualified reference '", name, "' cannot be located"));
        }
        throw UnknownCapabilityError(name);
    }
    if (entry->type != type) {
        throw ResolutionError(absl::StrCat("Capability '", name, "' is registered as a ",
                                           CapabilityKindName(entry->kind),
                                           " of a different type"));
    }

    // Entries are never erased, so the pointer stays valid outside mu_.
    absl::MutexLock lock(&entry->mu);
    if (entry->instance) {
        return entry->instance;
    }

    std::shared_ptr<void> instance;
    try {
        instance = entry->factory();
    } catch (const std::exception& e) {
        throw ResolutionError(absl::StrCat("Constructing '", name, "' failed: ", e.what()));
    }
    if (!instance) {
        throw ResolutionError(absl::StrCat("Factory for '", name, "' returned null"));
    }
    entry->instance = instance;
    VLOG(2) << "[CapabilityRegistry] constructed " << CapabilityKindName(entry->kind) << " '" << name << "'";
    return instance;
}

bool CapabilityRegistry::Contains(const std::string& name) const {
    return Find(name) != nullptr;
}

std::vector<std::string> CapabilityRegistry::ListAgents() const {
    return List(CapabilityKind::kAgent);
}

std::vector<std::string> CapabilityRegistry::List(CapabilityKind kind) const {
    absl::ReaderMutexLock lock(&mu_);
    std::vector<std::string> names;
    for (const Entry* entry : order_) {
        if (entry->kind == kind) {
            names.push_back(entry->name);
        }
    }
    return names;
}

} // namespace Lockstep
