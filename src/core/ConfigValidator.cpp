#include "ConfigValidator.h"
#include "Errors.h"
#include "Logging.h"
#include "Utils.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace hostdiag {

bool ConfigValidator::validate(Config& cfg) {
    auto& args = cfg.options.global_args;
    if(!args.count("notaninstance")) args["notaninstance"] = "False";

    if(!parse_list(cfg.options.global("onlymodules"), "--only-modules", cfg.only_modules)) return false;
    if(!parse_list(cfg.options.global("onlydomains"), "--only-domains", cfg.only_domains)) return false;
    if(!parse_list(cfg.options.global("onlyclasses"), "--only-classes", cfg.only_classes)) return false;

    // Non-numeric concurrency falls back to the default, anything below 1 is raised to 1.
    cfg.concurrency = 10;
    std::string conc = utils::trim(cfg.options.global("concurrency"));
    unsigned n = 0;
    if(!conc.empty()) {
        if(parse_unsigned(conc, n)) cfg.concurrency = std::max(1, static_cast<int>(n));
        else Logger::instance().warn("Ignoring non-numeric --concurrency value '" + conc + "'");
    }

    cfg.perfimpact = is_truthy(cfg.options.global("perfimpact"));
    cfg.not_an_instance = is_truthy(cfg.options.global("notaninstance"));

    cfg.module_timeout = 0;
    std::string timeout = utils::trim(cfg.options.global("moduletimeout"));
    if(!timeout.empty() && !parse_unsigned(timeout, cfg.module_timeout)) {
        std::cerr << "Invalid --module-timeout value: " << timeout << "\n";
        return false;
    }

    if(!cfg.module_root.empty()) {
        std::error_code ec;
        if(!std::filesystem::is_directory(cfg.module_root, ec)) {
            std::cerr << "Module directory does not exist: " << cfg.module_root << "\n";
            return false;
        }
    }

    if(cfg.subcommand == "run" && cfg.workdir.empty()) {
        std::cerr << "--workdir must not be empty\n";
        return false;
    }
    return true;
}

bool ConfigValidator::load_external_files(Config& cfg) {
    if(cfg.config_file.empty()) return true;
    Options from_file;
    try {
        from_file.load_config(cfg.config_file);
    } catch(const OptionsError& e) {
        std::cerr << e.what() << "\n";
        return false;
    }
    cfg.options.merge_missing(from_file);
    return true;
}

bool ConfigValidator::parse_list(const std::string& value, const std::string& flag_name, std::vector<std::string>& out) {
    out.clear();
    for(const auto& raw : utils::split_csv(value)) {
        std::string item = utils::trim(raw);
        if(item.empty()) continue;
        if(std::any_of(item.begin(), item.end(), [](unsigned char c){ return std::isspace(c) || c < 32; })) {
            std::cerr << "Invalid " << flag_name << " entry: '" << item << "'\n";
            return false;
        }
        if(std::find(out.begin(), out.end(), item) == out.end()) out.push_back(item);
    }
    return true;
}

bool ConfigValidator::parse_unsigned(const std::string& value, unsigned& out) {
    if(value.empty() || value.size() > 9) return false;
    if(!std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c); })) return false;
    out = static_cast<unsigned>(std::stoul(value));
    return true;
}

}
