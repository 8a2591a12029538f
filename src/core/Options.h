#pragma once
#include <string>
#include <map>

namespace hostdiag {

class ModuleRegistry;

// Arguments handed to modules through their environment.
struct Options {
    using ArgMap = std::map<std::string, std::string>;

    ArgMap global_args;                          // [Global] and --key=value flags
    std::map<std::string, ArgMap> per_module_args; // one section per module

    // Value of a global argument, or `fallback` when unset.
    std::string global(const std::string& key, const std::string& fallback = "") const;
    bool has_global(const std::string& key) const { return global_args.count(key) != 0; }

    // INI reader: "[Global]" fills global_args, any other section per_module_args.
    // Keys are lower-cased; sections without keys are ignored. Throws OptionsError
    // when the file cannot be read or has no sections.
    void load_config(const std::string& path);

    // Merges another set of options; keys already present here win.
    void merge_missing(const Options& other);

    // Writes [Global], then one section per module listing its required and
    // optional arguments as comments ("# none" when it has neither), then the
    // per-module values. Throws OptionsError on I/O failure or a module named Global.
    void write_config(const std::string& path, const ModuleRegistry& modules) const;
};

// Normalizes a dynamic flag name: "--foo-bar_baz" -> "foobarbaz".
std::string normalize_arg_key(const std::string& flag);

}
