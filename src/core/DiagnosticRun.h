#pragma once
#include "Config.h"
#include "HostFacts.h"
#include "ModuleRegistry.h"
#include "PruningPipeline.h"
#include "RunContext.h"
#include "RunSummary.h"
#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>

namespace hostdiag {

struct RunPaths {
    std::string workdir;     // parent of every run
    std::string rundir;      // workdir/<timestamp>
    std::string logdir;      // rundir/mod_out
    std::string gathereddir; // rundir/gathered_out
    std::string specdir;     // <timestamp>
    std::string callpath;    // module root holding pre.d, mod.d, post.d, bin/
};

// One "hostdiag run" invocation.
class DiagnosticRun {
public:
    DiagnosticRun(Config cfg, HostFacts facts, std::ostream& console);
    ~DiagnosticRun();

    // Every step below in order. Throws PrediagnosticFailure, RunDirectoryError,
    // RegistryError; returns the number of modules executed in the pool.
    size_t execute();

    void setup_directories();
    void load_modules();
    void run_prediagnostics();
    void prune();
    void save_config();
    size_t run_modules();
    void run_postdiagnostics();
    RunSummary summarize() const;
    void write_report(const RunSummary& summary) const;

    // Variables exported to modules (HOSTDIAG_*, PATH).
    Environment host_environment() const;

    const RunPaths& paths() const { return paths_; }
    const Config& config() const { return cfg_; }
    const HostFacts& facts() const { return facts_; }
    ModuleRegistry& prediagnostics() { return prediags_; }
    ModuleRegistry& modules() { return modules_; }
    ModuleRegistry& postdiagnostics() { return postdiags_; }
    const PruningPipeline* pruning() const { return pruning_.get(); }

private:
    void run_serial(ModuleRegistry& registry, bool fatal);

    Config cfg_;
    HostFacts facts_;
    std::ostream& console_;
    RunPaths paths_;
    ModuleRegistry prediags_, modules_, postdiags_;
    std::unique_ptr<PruningPipeline> pruning_;
    std::chrono::system_clock::time_point started_;
};

}
