#include "DiagnosticRun.h"
#include "BatchScheduler.h"
#include "Errors.h"
#include "JSONWriter.h"
#include "Logging.h"
#include "Utils.h"
#include "WorkerPool.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <ostream>

namespace fs = std::filesystem;

namespace hostdiag {

namespace {

const char* bool_word(bool b) { return b ? "True" : "False"; }

void make_dir(const fs::path& p) {
    std::error_code ec;
    fs::create_directories(p, ec);
    if(ec) throw RunDirectoryError("Failed to create directory '" + p.string() + "': " + ec.message());
}

} // namespace

DiagnosticRun::DiagnosticRun(Config cfg, HostFacts facts, std::ostream& console)
    : cfg_(std::move(cfg)), facts_(std::move(facts)), console_(console) {
    paths_.workdir = cfg_.workdir;
    paths_.callpath = cfg_.module_root;
}

DiagnosticRun::~DiagnosticRun() {
    if(!paths_.rundir.empty()) Logger::instance().close_file();
}

size_t DiagnosticRun::execute() {
    started_ = std::chrono::system_clock::now();
    setup_directories();
    load_modules();

    console_ << "\n-------------[Output  Logs]-------------\n\n"
             << "The output logs are located in:\n" << paths_.rundir << "\n";

    run_prediagnostics();
    prune();
    save_config();

    console_ << "\n--------------[Module Run]--------------\n\n";
    size_t executed = run_modules();
    run_postdiagnostics();

    RunSummary summary = summarize();
    std::string text = summary.render();
    console_ << text;
    Logger::instance().debug("run summary:" + text);
    write_report(summary);

    console_ << "\n----------------[NOTICE]----------------\n"
             << "Please note, this directory could contain sensitive data depending on modules run! "
             << "Please review its contents!\n";
    console_.flush();
    return executed;
}

void DiagnosticRun::setup_directories() {
    if(paths_.workdir.empty()) throw RunDirectoryError("Working directory is not set");
    paths_.specdir = utils::run_timestamp();
    fs::path rundir = fs::path(paths_.workdir) / paths_.specdir;
    paths_.rundir = rundir.string();
    paths_.logdir = (rundir / "mod_out").string();
    paths_.gathereddir = (rundir / "gathered_out").string();

    for(Placement p : {Placement::Prediagnostic, Placement::Run, Placement::Postdiagnostic})
        make_dir(fs::path(paths_.logdir) / to_string(p));
    make_dir(paths_.gathereddir);

    std::string main_log = (rundir / "Main.log").string();
    if(!Logger::instance().set_file(main_log, cfg_.debug ? LogLevel::Debug : LogLevel::Info))
        throw RunDirectoryError("Failed to open log file '" + main_log + "'");
    Logger::instance().info("run directory: " + paths_.rundir);
}

void DiagnosticRun::load_modules() {
    fs::path root = paths_.callpath.empty() ? fs::current_path() : fs::path(paths_.callpath);
    paths_.callpath = root.string();

    auto load_optional = [&](ModuleRegistry& registry, Placement p) {
        fs::path dir = root / placement_dir(p);
        std::error_code ec;
        if(!fs::is_directory(dir, ec)) {
            Logger::instance().debug(std::string("no ") + placement_dir(p) + " directory under " + root.string());
            return;
        }
        registry.load(dir.string());
    };
    load_optional(prediags_, Placement::Prediagnostic);
    modules_.load((root / placement_dir(Placement::Run)).string());
    load_optional(postdiags_, Placement::Postdiagnostic);
    Logger::instance().info("loaded " + std::to_string(prediags_.size()) + " prediagnostic, "
        + std::to_string(modules_.size()) + " run and " + std::to_string(postdiags_.size())
        + " postdiagnostic modules");
}

Environment DiagnosticRun::host_environment() const {
    Environment env;
    const char* path = std::getenv("PATH");
    env["PATH"] = path ? path : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    env["HOSTDIAG_WORKDIR"] = paths_.workdir;
    env["HOSTDIAG_RUNDIR"] = paths_.rundir;
    env["HOSTDIAG_LOGDIR"] = paths_.logdir;
    env["HOSTDIAG_GATHEREDDIR"] = paths_.gathereddir;
    env["HOSTDIAG_CALLPATH"] = paths_.callpath;
    env["HOSTDIAG_DISTRO"] = facts_.distro;
    env["HOSTDIAG_NET_DRIVER"] = facts_.net_driver;
    env["HOSTDIAG_VIRT_TYPE"] = facts_.virt_type;
    env["HOSTDIAG_SUDO"] = bool_word(facts_.root);
    env["HOSTDIAG_PERFIMPACT"] = bool_word(facts_.perfimpact);
    return env;
}

void DiagnosticRun::run_serial(ModuleRegistry& registry, bool fatal) {
    RunContext ctx(cfg_.options, host_environment(), console_, paths_.logdir, cfg_.module_timeout);
    for(const auto& mod : registry) {
        if(!mod->applicable()) {
            Logger::instance().info("module " + mod->label() + ": skipped, " + mod->skip_reason());
            continue;
        }
        Logger::instance().info("module " + mod->label() + ": running");
        try {
            std::string out = ctx.execute(*mod);
            ctx.write_module_log(*mod, out);
        } catch(const ModuleRunFailure& e) {
            ctx.write_module_log(*mod, e.output());
            if(fatal) throw PrediagnosticFailure(e.what());
            Logger::instance().warn(e.what());
            continue;
        } catch(const std::exception& e) {
            if(fatal) throw;
            Logger::instance().error("module " + mod->label() + ": " + e.what());
            continue;
        }
        Logger::instance().info("module " + mod->label() + ": " + to_string(mod->verdict()) + " " + mod->summary());
        if(fatal && mod->verdict() == Verdict::Failure)
            throw PrediagnosticFailure("Failed prediagnostic check: " + mod->summary());
    }
}

void DiagnosticRun::run_prediagnostics() {
    run_serial(prediags_, true);
}

void DiagnosticRun::prune() {
    Selection selection{cfg_.only_modules, cfg_.only_domains, cfg_.only_classes};
    selection.resolve(modules_);
    pruning_ = std::make_unique<PruningPipeline>(std::move(selection), facts_);
    pruning_->reconcile_arguments(modules_, cfg_.options, combined_constraint(modules_));
    size_t removed = pruning_->apply_host_facts(modules_);
    Logger::instance().info("pruned " + std::to_string(removed) + " modules, "
        + std::to_string(modules_.size()) + " remain");
}

void DiagnosticRun::save_config() {
    std::string path = (fs::path(paths_.rundir) / "RunConfig.ini").string();
    cfg_.options.write_config(path, modules_);
    Logger::instance().debug("run configuration written to " + path);
}

size_t DiagnosticRun::run_modules() {
    modules_.sort_by_first_class();
    std::vector<Batch> batches = BatchScheduler::schedule(modules_.modules());
    Logger::instance().debug("scheduled " + std::to_string(modules_.size()) + " modules in "
        + std::to_string(batches.size()) + " batches");

    RunContext ctx(cfg_.options, host_environment(), console_, paths_.logdir, cfg_.module_timeout);
    size_t executed = 0;
    {
        WorkerPool pool(ctx, static_cast<size_t>(cfg_.concurrency));
        executed = pool.run(batches);
    }
    if(ctx.announced()) console_ << "\n";
    return executed;
}

void DiagnosticRun::run_postdiagnostics() {
    run_serial(postdiags_, false);
}

RunSummary DiagnosticRun::summarize() const {
    return RunSummary::build(modules_, pruning_ ? pruning_->histogram() : SkipHistogram{});
}

void DiagnosticRun::write_report(const RunSummary& summary) const {
    if(cfg_.output_file.empty()) return;
    RunReport report;
    report.run_dir = paths_.rundir;
    report.started = started_;
    report.finished = std::chrono::system_clock::now();
    report.facts = facts_;
    report.summary = summary;
    report.prediagnostic = prediags_.modules();
    report.executed = modules_.modules();
    report.postdiagnostic = postdiags_.modules();
    if(pruning_) report.pruned = pruning_->pruned();

    std::ofstream out(cfg_.output_file);
    if(!out) throw RunError("Failed to write report '" + cfg_.output_file + "'");
    out << JSONWriter().write(report, true);
    Logger::instance().info("report written to " + cfg_.output_file);
}

}
