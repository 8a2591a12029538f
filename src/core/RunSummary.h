#pragma once
#include "ModuleRegistry.h"
#include "PruningPipeline.h"
#include <map>
#include <string>
#include <vector>

namespace hostdiag {

struct VerdictCounts {
    size_t successes = 0;
    size_t failures = 0;
    size_t warnings = 0;
    size_t unknown = 0;
};

// Read-only projection of a finished run.
struct RunSummary {
    size_t total_run = 0;
    std::map<std::string, size_t> per_class;   // class -> modules run
    VerdictCounts diagnose;                     // over class "diagnose" only
    std::vector<ModulePtr> diagnose_results;    // sorted by verdict name
    SkipHistogram skips;

    static RunSummary build(const ModuleRegistry& executed, const SkipHistogram& skips);

    // Diagnostic results, run stats and the skip table as printed at the end of a run.
    std::string render() const;
};

}
