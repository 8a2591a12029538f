#pragma once
#include "Config.h"
#include <string>
#include <vector>

namespace hostdiag {

class ConfigValidator {
public:
    // Derives the typed selection/run fields from options.global_args and checks them.
    // Returns false (after printing to stderr) on invalid values.
    bool validate(Config& cfg);
    // Merges --config-file into cfg.options; command line values win.
    bool load_external_files(Config& cfg);

private:
    bool parse_list(const std::string& value, const std::string& flag_name, std::vector<std::string>& out);
    bool parse_unsigned(const std::string& value, unsigned& out);
};

}
