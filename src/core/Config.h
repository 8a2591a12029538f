#pragma once
#include "Options.h"
#include <string>
#include <vector>

namespace hostdiag {

struct Config {
    std::string subcommand; // run | list | help | version; empty prints usage
    std::vector<std::string> help_targets; // module names after "help"
    std::string config_file;
    std::string module_root; // holds pre.d, mod.d, post.d and bin/; empty = next to the executable
    std::string workdir = "/var/tmp/hostdiag";
    std::string output_file; // JSON report, empty = none
    bool debug = false;

    // Derived from options.global_args by ConfigValidator::validate
    std::vector<std::string> only_modules; // empty = all
    std::vector<std::string> only_domains; // empty = every domain present
    std::vector<std::string> only_classes; // empty = every class present
    int concurrency = 10;
    bool perfimpact = false;
    bool not_an_instance = false;
    unsigned module_timeout = 0; // seconds, 0 = wait indefinitely

    Options options;
};

// "True"/"true"/"yes"/"1" style values.
bool is_truthy(const std::string& v);

}
