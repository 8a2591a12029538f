#include "BatchScheduler.h"
#include "Logging.h"
#include <set>

namespace hostdiag {

namespace {

bool disjoint(const std::set<std::string>& held, const StringList& wanted) {
    for(const auto& w : wanted) if(held.count(w)) return false;
    return true;
}

bool overlaps(const std::set<std::string>& held, const StringList& wanted) {
    return !disjoint(held, wanted);
}

} // namespace

std::vector<std::vector<size_t>> BatchScheduler::partition(const std::vector<ModulePtr>& modules) {
    std::vector<std::vector<size_t>> batches;
    std::vector<size_t> remaining;
    for(size_t i = 0; i < modules.size(); ++i) remaining.push_back(i);

    while(!remaining.empty()) {
        std::vector<size_t> batch, deferred;
        std::set<std::string> exclusives;
        std::set<std::string> classes;
        bool class_set = false;
        for(size_t idx : remaining) {
            const Constraint& c = modules[idx]->constraint();
            const StringList& mod_classes = c.get("class");
            const StringList& mod_exclusive = c.get("parallelexclusive");
            if(class_set && !overlaps(classes, mod_classes)) { deferred.push_back(idx); continue; }
            if(!disjoint(exclusives, mod_exclusive)) { deferred.push_back(idx); continue; }
            batch.push_back(idx);
            exclusives.insert(mod_exclusive.begin(), mod_exclusive.end());
            classes.insert(mod_classes.begin(), mod_classes.end());
            class_set = true;
        }
        // Every module admits itself into an empty batch, so progress is guaranteed.
        batches.push_back(std::move(batch));
        remaining.swap(deferred);
    }
    return batches;
}

std::vector<Batch> BatchScheduler::schedule(const std::vector<ModulePtr>& modules) {
    std::vector<Batch> out;
    for(const auto& indices : partition(modules)) {
        Batch b;
        for(size_t i : indices) b.push_back(modules[i]);
        out.push_back(std::move(b));
    }
    Logger::instance().debug("scheduled " + std::to_string(modules.size()) + " modules into "
                             + std::to_string(out.size()) + " batches");
    return out;
}

}
