#pragma once
#include "Config.h"
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace hostdiag {

// Command line -> Config. Known flags fill typed fields; every other
// "--key[=value]" becomes a global module argument (key without '-'/'_',
// bare flags get "True"). Returns false on --help/--version (after printing)
// and on invalid input (after printing the error to stderr).
class ArgumentParser {
public:
    ArgumentParser();
    bool parse(int argc, char** argv, Config& cfg);
    const std::string& error() const { return error_; }
    static void print_usage(std::ostream& os);
    static const std::vector<std::string>& subcommands();

private:
    enum class ArgKind { None, String };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        std::function<void(Config&, const std::string&)> apply;
    };
    bool fail(const std::string& msg);
    std::vector<FlagSpec> specs_;
    std::string error_;
};

}
