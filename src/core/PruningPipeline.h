#pragma once
#include "HostFacts.h"
#include "ModuleRegistry.h"
#include "Options.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hostdiag {

enum class SkipReason {
    NotAnInstance,
    NotApplicableToDistro,
    PerformanceImpact,
    RequiresSudo,
    NotSelected,
    MissingSoftware,
    MissingArgument
};

const char* to_string(SkipReason r);

using SkipHistogram = std::map<SkipReason, size_t>;

// User scope. An empty module list means every module; empty domain/class
// lists are filled from the registry by resolve().
struct Selection {
    std::vector<std::string> modules;
    std::vector<std::string> domains;
    std::vector<std::string> classes;

    void resolve(const ModuleRegistry& registry);
    bool in_scope(const Module& mod) const;
    // Why an out-of-scope module is excluded.
    std::string scope_reason(const Module& mod) const;
};

// Union of domain, class, distro, software and perfimpact over all modules.
Constraint combined_constraint(const ModuleRegistry& registry);

// Two-phase applicability: argument reconciliation marks modules not
// applicable, host-fact pruning removes every excluded module from the registry.
class PruningPipeline {
public:
    PruningPipeline(Selection selection, HostFacts facts);

    void reconcile_arguments(ModuleRegistry& registry, const Options& options, const Constraint& combined) const;
    // Removes pruned modules from `registry`; returns how many were removed.
    size_t apply_host_facts(ModuleRegistry& registry);

    const std::vector<ModulePtr>& pruned() const { return pruned_; }
    const SkipHistogram& histogram() const { return histogram_; }
    const Selection& selection() const { return selection_; }

    // Histogram bucket for a skip message; nullopt for untracked reasons.
    static std::optional<SkipReason> classify(const std::string& reason);

private:
    bool reconcile_module(Module& mod, const Options& options, const Constraint& combined) const;
    // Empty string keeps the module.
    std::string host_fact_reason(const Module& mod) const;

    Selection selection_;
    HostFacts facts_;
    std::vector<ModulePtr> pruned_;
    SkipHistogram histogram_;
};

}
