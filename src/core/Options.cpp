#include "Options.h"
#include "ModuleRegistry.h"
#include "Errors.h"
#include "Logging.h"
#include "Utils.h"
#include <fstream>
#include <sstream>
#include <vector>

namespace hostdiag {

std::string Options::global(const std::string& key, const std::string& fallback) const {
    auto it = global_args.find(key);
    return it == global_args.end() ? fallback : it->second;
}

void Options::load_config(const std::string& path) {
    auto& log = Logger::instance();
    std::ifstream in(path);
    if(!in) throw OptionsError("Invalid configuration file '" + path + "'");

    // Collect sections in file order first; empty ones are dropped afterwards.
    std::vector<std::pair<std::string, ArgMap>> sections;
    std::string line;
    size_t lineno = 0;
    while(std::getline(in, line)) {
        ++lineno;
        std::string t = utils::trim(line);
        if(t.empty() || t[0] == '#' || t[0] == ';') continue;
        if(t.front() == '[') {
            if(t.back() != ']' || t.size() < 3)
                throw OptionsError("Invalid configuration file '" + path + "': bad section header at line " + std::to_string(lineno));
            sections.emplace_back(utils::trim(t.substr(1, t.size() - 2)), ArgMap{});
            continue;
        }
        if(sections.empty())
            throw OptionsError("Invalid configuration file '" + path + "': option outside of a section at line " + std::to_string(lineno));
        size_t sep = t.find_first_of("=:");
        std::string key = utils::to_lower(utils::trim(sep == std::string::npos ? t : t.substr(0, sep)));
        std::string value = sep == std::string::npos ? "" : utils::trim(t.substr(sep + 1));
        if(key.empty()) continue;
        sections.back().second[key] = value;
    }
    if(sections.empty()) throw OptionsError("Invalid configuration file '" + path + "'");

    for(auto& [name, values] : sections) {
        if(values.empty()) continue;
        if(name == "Global") {
            for(auto& [k, v] : values) { log.debug("config [Global] " + k + " = " + v); global_args[k] = v; }
        } else {
            for(auto& [k, v] : values) { log.debug("config [" + name + "] " + k + " = " + v); per_module_args[name][k] = v; }
        }
    }
}

void Options::merge_missing(const Options& other) {
    for(const auto& [k, v] : other.global_args) global_args.emplace(k, v);
    for(const auto& [mod, args] : other.per_module_args) {
        auto& mine = per_module_args[mod];
        for(const auto& [k, v] : args) mine.emplace(k, v);
    }
}

void Options::write_config(const std::string& path, const ModuleRegistry& modules) const {
    std::ostringstream os;
    os << "[Global]\n";
    for(const auto& [k, v] : global_args) os << k << " = " << v << "\n";
    os << "\n";

    std::vector<std::string> written;
    for(const auto& mod : modules) {
        if(mod->name() == "Global") throw OptionsError("Module name 'Global' is reserved");
        os << "[" << mod->name() << "]\n";
        const auto& required = mod->constraint().get("required");
        const auto& optional = mod->constraint().get("optional");
        for(const auto& v : required) os << "# (required) " << v << " = value\n";
        for(const auto& v : optional) os << "# (optional) " << v << " = value\n";
        if(required.empty() && optional.empty()) os << "# none\n";
        auto it = per_module_args.find(mod->name());
        if(it != per_module_args.end())
            for(const auto& [k, v] : it->second) os << k << " = " << v << "\n";
        os << "\n";
        written.push_back(mod->name());
    }
    // per-module values for modules outside the registry keep their own section
    for(const auto& [name, args] : per_module_args) {
        if(name == "Global") continue;
        bool seen = false;
        for(const auto& w : written) if(w == name) { seen = true; break; }
        if(seen) continue;
        os << "[" << name << "]\n";
        for(const auto& [k, v] : args) os << k << " = " << v << "\n";
        os << "\n";
    }

    std::ofstream out(path, std::ios::trunc);
    if(!out) throw OptionsError("Failed to write configuration file '" + path + "'");
    out << os.str();
    if(!out) throw OptionsError("Failed to write configuration file '" + path + "'");
    Logger::instance().debug("wrote configuration file " + path);
}

std::string normalize_arg_key(const std::string& flag) {
    std::string key = flag;
    while(!key.empty() && key.front() == '-') key.erase(key.begin());
    std::string out;
    for(char c : key) if(c != '-' && c != '_') out.push_back(c);
    return out;
}

}
