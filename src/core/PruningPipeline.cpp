#include "PruningPipeline.h"
#include "Logging.h"
#include "Utils.h"
#include <algorithm>

namespace hostdiag {

namespace {

bool intersects(const StringList& a, const std::vector<std::string>& b) {
    for(const auto& v : a)
        if(std::find(b.begin(), b.end(), v) != b.end()) return true;
    return false;
}

bool listed(const std::vector<std::string>& list, const std::string& v) {
    return std::find(list.begin(), list.end(), v) != list.end();
}

enum class ArgLookup { Found, Empty, Absent };

ArgLookup lookup(const Options::ArgMap& args, const std::string& key) {
    auto it = args.find(key);
    if(it == args.end()) return ArgLookup::Absent;
    return it->second.empty() ? ArgLookup::Empty : ArgLookup::Found;
}

} // namespace

const char* to_string(SkipReason r) {
    switch(r) {
        case SkipReason::NotAnInstance: return "NOT_AN_INSTANCE";
        case SkipReason::NotApplicableToDistro: return "NOT_APPLICABLE_TO_DISTRO";
        case SkipReason::PerformanceImpact: return "PERFORMANCE_IMPACT";
        case SkipReason::RequiresSudo: return "REQUIRES_SUDO";
        case SkipReason::NotSelected: return "NOT_SELECTED";
        case SkipReason::MissingSoftware: return "MISSING_SOFTWARE";
        case SkipReason::MissingArgument: return "MISSING_ARGUMENT";
    }
    return "";
}

void Selection::resolve(const ModuleRegistry& registry) {
    if(domains.empty()) domains = registry.domains();
    if(classes.empty()) classes = registry.classes();
}

bool Selection::in_scope(const Module& mod) const {
    return (modules.empty() || listed(modules, mod.name()))
        && intersects(mod.constraint().get("domain"), domains)
        && intersects(mod.constraint().get("class"), classes);
}

std::string Selection::scope_reason(const Module& mod) const {
    if(!modules.empty() && !listed(modules, mod.name())) return "Not specified to run.";
    if(!intersects(mod.constraint().get("domain"), domains)) return "Not in specified domain to run.";
    return "Not in specified class to run.";
}

Constraint combined_constraint(const ModuleRegistry& registry) {
    Constraint combined;
    for(const auto& mod : registry)
        combined.update(mod->constraint().with_keys({"domain", "class", "distro", "software", "perfimpact"}));
    return combined;
}

PruningPipeline::PruningPipeline(Selection selection, HostFacts facts)
    : selection_(std::move(selection)), facts_(std::move(facts)) {}

void PruningPipeline::reconcile_arguments(ModuleRegistry& registry, const Options& options, const Constraint& combined) const {
    for(const auto& mod : registry) {
        if(!mod->applicable()) continue;
        if(!reconcile_module(*mod, options, combined))
            Logger::instance().debug("module " + mod->label() + ": not applicable: " + mod->skip_reason());
    }
}

bool PruningPipeline::reconcile_module(Module& mod, const Options& options, const Constraint& combined) const {
    auto& log = Logger::instance();
    if(options.global(mod.name()) == "False") {
        mod.mark_not_applicable("explicitly excluded with '--no=" + mod.name() + "'.");
        return false;
    }

    static const Options::ArgMap no_args;
    auto per_mod = options.per_module_args.find(mod.name());
    const Options::ArgMap& mod_args = per_mod == options.per_module_args.end() ? no_args : per_mod->second;

    bool ok = true;
    std::string reason;
    Constraint checked = mod.constraint().without_keys({"software", "distro", "sudo", "requires_ec2"});
    for(const auto& key : checked.keys()) {
        if(key == "optional" || key == "parallelexclusive") continue;
        for(const auto& value : checked.get(key)) {
            if(combined.contains(ConstraintValue::mapping({{key, value}}))) continue;
            ArgLookup local = lookup(mod_args, value);
            if(local == ArgLookup::Found) continue;
            ArgLookup global = lookup(options.global_args, value);
            if(global == ArgLookup::Found) continue;
            log.trace("module " + mod.label() + ": " + key + ":" + value + " absent from options");
            if(local == ArgLookup::Empty || global == ArgLookup::Empty)
                reason = "missing value for required argument '" + value + "'.";
            else
                reason = "missing required argument '" + value + "'.";
            ok = false;
        }
    }
    if(!ok) mod.mark_not_applicable(reason);
    return ok;
}

std::string PruningPipeline::host_fact_reason(const Module& mod) const {
    const Constraint& c = mod.constraint();
    if(!selection_.in_scope(mod)) return selection_.scope_reason(mod);
    if(!mod.applicable()) return mod.skip_reason().empty() ? std::string("Not applicable.") : mod.skip_reason();
    if(c.first("requires_ec2") == "True" && !facts_.instance) return "Module requires system be an EC2 instance.";
    if(!listed(c.get("distro"), facts_.distro)) return "Not applicable to this distro.";
    if(c.first("perfimpact") == "True" && !facts_.perfimpact) return "Requires performance impact okay, but not given.";
    if(c.first("sudo") == "True" && !facts_.root) return "Requires sudo access, but not executing as root.";

    std::string reason;
    for(const auto& program : c.get("software"))
        if(!facts_.can_execute(program)) reason = "Requires missing/non-executable software '" + program + "'.";
    return reason;
}

size_t PruningPipeline::apply_host_facts(ModuleRegistry& registry) {
    auto& log = Logger::instance();
    std::vector<ModulePtr> prune;
    for(const auto& mod : registry) {
        std::string reason = host_fact_reason(*mod);
        if(reason.empty()) {
            log.info("module " + mod->label() + ": Passed prediagnostics validation.");
            continue;
        }
        if(mod->applicable()) mod->mark_not_applicable(reason);
        else mod->set_skip_reason(reason);
        log.info("module " + mod->label() + ": Skipping. Reason: " + reason);
        prune.push_back(mod);
    }
    for(const auto& mod : prune) {
        if(auto bucket = classify(mod->skip_reason())) ++histogram_[*bucket];
        pruned_.push_back(mod);
        registry.remove(*mod);
    }
    return prune.size();
}

std::optional<SkipReason> PruningPipeline::classify(const std::string& reason) {
    if(utils::starts_with(reason, "Requires performance impact okay, but not given.")) return SkipReason::PerformanceImpact;
    if(utils::starts_with(reason, "Requires sudo access, but not executing as root.")) return SkipReason::RequiresSudo;
    if(utils::starts_with(reason, "Requires missing/non-executable software")) return SkipReason::MissingSoftware;
    if(utils::starts_with(reason, "missing value for required argument")
       || utils::starts_with(reason, "missing required argument")) return SkipReason::MissingArgument;
    return std::nullopt;
}

}
