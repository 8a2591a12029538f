#pragma once
#include "HostFacts.h"
#include "Module.h"
#include "RunSummary.h"
#include <chrono>
#include <string>
#include <vector>

namespace hostdiag {

struct RunReport {
    std::string run_dir;
    std::chrono::system_clock::time_point started{};
    std::chrono::system_clock::time_point finished{};
    HostFacts facts;
    RunSummary summary;
    std::vector<ModulePtr> prediagnostic;
    std::vector<ModulePtr> executed;
    std::vector<ModulePtr> postdiagnostic;
    std::vector<ModulePtr> pruned;
};

// Machine-readable run report: meta, summary, per-module results, skipped modules.
class JSONWriter {
public:
    std::string write(const RunReport& report, bool pretty = false) const;
};

}
