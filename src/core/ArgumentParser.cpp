#include "ArgumentParser.h"
#include "BuildInfo.h"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace hostdiag {

ArgumentParser::ArgumentParser() {
    specs_ = {
        {"--config-file", ArgKind::String, [](Config& c, const std::string& v){ c.config_file = v; }},
        {"--module-dir", ArgKind::String, [](Config& c, const std::string& v){ c.module_root = v; }},
        {"--workdir", ArgKind::String, [](Config& c, const std::string& v){ c.workdir = v; }},
        {"--output", ArgKind::String, [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--debug", ArgKind::None, [](Config& c, const std::string&){ c.debug = true; }},
        {"--no", ArgKind::String, [](Config& c, const std::string& v){ if(!v.empty()) c.options.global_args[v] = "False"; }},
    };
}

const std::vector<std::string>& ArgumentParser::subcommands() {
    static const std::vector<std::string> subs = {"run", "list", "help", "version"};
    return subs;
}

void ArgumentParser::print_usage(std::ostream& os) {
    os << "usage: hostdiag <run|list|help|version> [options]\n\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> lines = {
        {"--only-modules=a,b", "Run only the named modules"},
        {"--only-domains=a,b", "Run only modules in these domains"},
        {"--only-classes=a,b", "Run only modules in these classes"},
        {"--concurrency=N", "Worker threads for module execution (default 10)"},
        {"--perfimpact=true", "Allow modules with a performance impact"},
        {"--not-an-instance", "Host is not a cloud instance"},
        {"--module-timeout=S", "Kill a module after S seconds (default: no limit)"},
        {"--no=MODULE", "Exclude MODULE from the run"},
        {"--config-file=FILE", "Load arguments from an INI file"},
        {"--module-dir=DIR", "Directory holding pre.d, mod.d, post.d"},
        {"--workdir=DIR", "Parent of the per-run output directory"},
        {"--output=FILE", "Write a JSON report to FILE"},
        {"--debug", "Verbose logging"},
        {"--ARG=VALUE", "Argument passed to modules"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    for(const auto& l : lines){ os << "  " << l.name; if(l.name.size() < 24) for(size_t i=l.name.size(); i<24; ++i) os << ' '; else os << ' '; os << l.help << "\n"; }
}

bool ArgumentParser::fail(const std::string& msg) {
    error_ = msg;
    std::cerr << msg << "\n";
    return false;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    error_.clear();
    for(int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if(arg == "--help" || arg == "-h") { print_usage(std::cout); return false; }
        if(arg == "--version") { std::cout << "hostdiag " << buildinfo::APP_VERSION << "\n"; return false; }

        if(arg.rfind("--", 0) == 0 && arg.size() > 2) {
            size_t eq = arg.find('=');
            std::string flag = eq == std::string::npos ? arg : arg.substr(0, eq);
            bool has_value = eq != std::string::npos;
            std::string value = has_value ? arg.substr(eq + 1) : std::string();

            auto spec = std::find_if(specs_.begin(), specs_.end(), [&](const FlagSpec& s){ return flag == s.name; });
            if(spec != specs_.end()) {
                if(spec->kind == ArgKind::String && !has_value) {
                    if(i + 1 >= argc) return fail("Missing value for " + flag);
                    value = argv[++i];
                }
                spec->apply(cfg, value);
                continue;
            }
            std::string key = normalize_arg_key(flag);
            if(key.empty()) return fail("Invalid Command line option '" + arg + "'.  Options should be in the format --abc or --abc=xyz");
            cfg.options.global_args[key] = has_value ? value : "True";
            continue;
        }

        if(cfg.subcommand.empty()) {
            const auto& subs = subcommands();
            if(std::find(subs.begin(), subs.end(), arg) == subs.end())
                return fail("Invalid Subcommand '" + arg + "'.  Valid subcommands are: run, list, help, version.");
            cfg.subcommand = arg;
            continue;
        }
        if(cfg.subcommand == "help") { cfg.help_targets.push_back(arg); continue; }
        if(arg.find('=') == std::string::npos && !arg.empty() && std::isalnum(static_cast<unsigned char>(arg[0]))) {
            cfg.options.global_args[arg] = "";
            continue;
        }
        return fail("Invalid Command line option '" + arg + "'.  Options should be in the format --abc or --abc=xyz");
    }
    return true;
}

}
