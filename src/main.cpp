#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/DiagnosticRun.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include "core/ModuleRegistry.h"
#include "core/PruningPipeline.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace hostdiag;

namespace {

const std::map<std::string, std::string>& subcommand_help() {
    static const std::map<std::string, std::string> text = {
        {"run", "run:\nRun every applicable diagnostic module and summarize the results.\n"
                "Output is written below --workdir in a directory named after the start time."},
        {"list", "list:\nList the modules that apply to the current selection.\n"
                 "Use --only-modules, --only-domains and --only-classes to narrow it."},
        {"help", "help:\nShow help for the named subcommands or modules.\n"
                 "hostdiag help [MODULEa ... MODULEx]\n"
                 "hostdiag help [--only-modules=MODULEa,MODULEx] [--only-domains=DOMAINa,DOMAINx]"},
        {"version", "version:\nPrint the program version and build information."}
    };
    return text;
}

// Directory of the running executable; modules ship beside it.
std::string executable_dir() {
    char pathbuf[4096];
    ssize_t n = readlink("/proc/self/exe", pathbuf, sizeof(pathbuf) - 1);
    if(n <= 0) return fs::current_path().string();
    pathbuf[n] = 0;
    return fs::path(pathbuf).parent_path().string();
}

void print_version() {
    std::cout << "hostdiag " << buildinfo::APP_VERSION << " (compiler=" << buildinfo::COMPILER_ID << " "
              << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

ModuleRegistry load_run_modules(const Config& cfg) {
    ModuleRegistry modules;
    modules.load((fs::path(cfg.module_root) / placement_dir(Placement::Run)).string());
    return modules;
}

int cmd_list(const Config& cfg) {
    ModuleRegistry modules = load_run_modules(cfg);
    Selection selection{cfg.only_modules, cfg.only_domains, cfg.only_classes};
    selection.resolve(modules);

    std::cout << "Here is a list of available modules that apply to the current host:\n\n";
    std::cout << "  " << std::left;
    for(auto [label, width] : std::vector<std::pair<std::string, size_t>>{{"Module Name", 20}, {"Class", 10}, {"Domain", 13}, {"Description", 77}}) {
        std::cout << label;
        for(size_t i = label.size(); i < width; ++i) std::cout << ' ';
    }
    std::cout << "\n";
    for(const auto& mod : modules)
        if(mod->applicable() && selection.in_scope(*mod)) std::cout << mod->list_line() << "\n";
    std::cout << "\n *Requires sudo/root to run\n"
              << "\n +Requires --perfimpact=true to run (Can potentially cause performance impact)\n"
              << "\nTo see module help, you can run:\n\n"
              << "hostdiag help [MODULEa ... MODULEx]\n";
    return 0;
}

int cmd_help(const Config& cfg) {
    if(cfg.help_targets.empty() && cfg.only_modules.empty() && cfg.only_domains.empty() && cfg.only_classes.empty()) {
        ArgumentParser::print_usage(std::cout);
        return 0;
    }
    ModuleRegistry modules = load_run_modules(cfg);

    std::vector<std::string> targets = cfg.help_targets;
    if(!cfg.only_modules.empty()) {
        targets = cfg.only_modules;
    } else if(!cfg.only_domains.empty()) {
        for(const auto& d : cfg.only_domains) {
            auto it = modules.domain_map().find(d);
            if(it != modules.domain_map().end()) for(const auto& m : it->second) targets.push_back(m->name());
        }
    } else if(!cfg.only_classes.empty()) {
        for(const auto& c : cfg.only_classes) {
            auto it = modules.class_map().find(c);
            if(it != modules.class_map().end()) for(const auto& m : it->second) targets.push_back(m->name());
        }
    }

    std::string output;
    for(const auto& t : targets) {
        std::string text;
        auto sub = subcommand_help().find(t);
        if(sub != subcommand_help().end()) text = sub->second;
        else if(auto mod = modules.find(t)) text = mod->help();
        if(text.empty()) continue;
        if(!output.empty()) output += "\n\n";
        output += text;
    }
    if(output.empty()) ArgumentParser::print_usage(std::cout);
    else std::cout << output << "\n";
    return 0;
}

int cmd_run(const Config& cfg) {
    HostFacts facts = HostFacts::detect(cfg);
    DiagnosticRun run(cfg, std::move(facts), std::cout);
    run.execute();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.error().empty() ? 0 : 2;
    if(cfg.debug) Logger::instance().set_level(LogLevel::Debug);

    ConfigValidator validator;
    if(!validator.load_external_files(cfg)) return 2;
    if(!validator.validate(cfg)) return 2;
    if(cfg.module_root.empty()) cfg.module_root = executable_dir();

    try {
        if(cfg.subcommand.empty()) { ArgumentParser::print_usage(std::cout); return 0; }
        if(cfg.subcommand == "version") { print_version(); return 0; }
        if(cfg.subcommand == "help") return cmd_help(cfg);
        if(cfg.subcommand == "list") return cmd_list(cfg);
        if(cfg.subcommand == "run") return cmd_run(cfg);
    } catch(const PrediagnosticFailure& e) {
        Logger::instance().error(e.what());
        std::cerr << e.what() << "\n";
        return 3;
    } catch(const std::exception& e) {
        Logger::instance().error(e.what());
        return 1;
    }
    return 2;
}
