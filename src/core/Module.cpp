#include "Module.h"
#include "Options.h"
#include "Errors.h"
#include "Logging.h"
#include "Utils.h"
#include <cctype>
#include <cstdlib>
#include <system_error>

namespace hostdiag {

const char* to_string(Placement p) {
    switch(p) {
        case Placement::Prediagnostic: return "prediagnostic";
        case Placement::Run: return "run";
        case Placement::Postdiagnostic: return "postdiagnostic";
    }
    return "";
}

const char* to_string(Language l) {
    switch(l) {
        case Language::Bash: return "bash";
        case Language::Python: return "python";
        case Language::Binary: return "binary";
    }
    return "";
}

const char* to_string(Verdict v) {
    switch(v) {
        case Verdict::None: return "";
        case Verdict::Success: return "SUCCESS";
        case Verdict::Warn: return "WARN";
        case Verdict::Failure: return "FAILURE";
        case Verdict::Unknown: return "UNKNOWN";
    }
    return "";
}

const char* placement_dir(Placement p) {
    switch(p) {
        case Placement::Prediagnostic: return "pre.d";
        case Placement::Run: return "mod.d";
        case Placement::Postdiagnostic: return "post.d";
    }
    return "";
}

namespace {

std::vector<std::string> detail_lines(const std::vector<std::string>& lines, size_t from) {
    std::vector<std::string> out;
    for(size_t i = from; i < lines.size(); ++i) {
        std::string l = utils::rtrim(lines[i]);
        if(!utils::starts_with(l, "--")) break;
        out.push_back(l);
    }
    return out;
}

// mkstemp prefix: anything outside [A-Za-z0-9._-] becomes '_'
std::string temp_prefix(const std::string& name) {
    std::string out = "hostdiag-";
    for(char ch : name)
        out.push_back(std::isalnum(static_cast<unsigned char>(ch)) || ch == '.' || ch == '_' || ch == '-' ? ch : '_');
    return out + "-";
}

// fixed-width field: truncate to precision, pad to width
std::string field(const std::string& s, size_t width, size_t precision, bool right = false) {
    std::string v = s.substr(0, precision);
    if(v.size() >= width) return v;
    std::string pad(width - v.size(), ' ');
    return right ? pad + v : v + pad;
}

void require(const std::string& value, const char* what, const std::string& who) {
    if(value.empty())
        throw ModuleParseError("Module('" + who + "'): must have a " + what + " value in the configuration file!");
}

} // namespace

ParsedOutput parse_module_output(const std::string& output) {
    ParsedOutput r;
    bool matched = false;
    bool warned = false;
    std::vector<std::string> lines;
    std::string body = utils::trim(output);
    size_t start = 0;
    while(true) {
        size_t nl = body.find('\n', start);
        lines.push_back(body.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
        if(nl == std::string::npos) break;
        start = nl + 1;
    }
    for(size_t i = 0; i < lines.size(); ++i) {
        std::string line = utils::rtrim(lines[i]);
        if(utils::starts_with(line, "[SUCCESS]") && !warned) {
            r.verdict = Verdict::Success; r.summary = line; r.details = detail_lines(lines, i + 1);
            matched = true;
        } else if(utils::starts_with(line, "[FAILURE]")) {
            r.verdict = Verdict::Failure; r.summary = line; r.details = detail_lines(lines, i + 1);
            matched = true;
            break;
        } else if(utils::starts_with(line, "[WARN]")) {
            r.verdict = Verdict::Warn; r.summary = line; r.details = detail_lines(lines, i + 1);
            warned = true;
            matched = true;
        }
    }
    if(!matched) {
        r.verdict = Verdict::Unknown;
        r.summary = "[UNKNOWN] log missing SUCCESS, FAILURE, or WARN message.";
        r.details.clear();
    }
    return r;
}

const std::vector<std::string>& Module::required_axes() {
    static const std::vector<std::string> axes = {"domain", "sudo", "required", "perfimpact", "software", "optional",
                                                  "class", "parallelexclusive", "distro", "requires_ec2"};
    return axes;
}

const std::vector<std::string>& Module::environment_allow_list() {
    static const std::vector<std::string> vars = {"HOSTDIAG_WORKDIR", "HOSTDIAG_RUNDIR", "HOSTDIAG_LOGDIR",
                                                  "HOSTDIAG_GATHEREDDIR", "HOSTDIAG_DISTRO", "HOSTDIAG_NET_DRIVER",
                                                  "HOSTDIAG_VIRT_TYPE", "HOSTDIAG_SUDO", "HOSTDIAG_PERFIMPACT",
                                                  "HOSTDIAG_CALLPATH"};
    return vars;
}

Module::Module(ModuleSpec spec) {
    if(spec.placement.empty())
        throw ModuleParseError("Module('" + spec.name + "'): must have a placement value in the configuration file!");
    if(spec.placement == "prediagnostic") placement_ = Placement::Prediagnostic;
    else if(spec.placement == "run") placement_ = Placement::Run;
    else if(spec.placement == "postdiagnostic") placement_ = Placement::Postdiagnostic;
    else throw ModuleUnknownPlacementError("Unknown Placement '" + spec.placement + "' defined for module '" + spec.name + "'.");

    if(spec.name.empty())
        throw ModuleParseError("Module('" + spec.path + "'): must have a name value in the configuration file!");
    require(spec.version, "version", spec.name);
    require(spec.title, "title", spec.name);
    require(spec.helptext, "helptext", spec.name);
    if(!spec.has_package)
        throw ModuleParseError("Module('" + spec.name + "'): must have a package value in the configuration file!");
    require(spec.language, "language", spec.name);
    if(spec.language == "bash") language_ = Language::Bash;
    else if(spec.language == "python") language_ = Language::Python;
    else if(spec.language == "binary") language_ = Language::Binary;
    else throw ModuleUnsupportedLanguageError("Unsupported language '" + spec.language + "' for module '" + spec.name + "'.");
    require(spec.content, "content", spec.name);

    name_ = std::move(spec.name);
    version_ = std::move(spec.version);
    title_ = std::move(spec.title);
    content_ = std::move(spec.content);
    path_ = std::move(spec.path);
    package_ = std::move(spec.package);
    constraint_ = Constraint(spec.constraint);

    std::string file = path_.empty() ? name_ : path_.substr(path_.find_last_of('/') + 1);
    for(const auto& axis : required_axes()) {
        if(!constraint_.has(axis)) {
            Logger::instance().error("Module parsing error: '" + file + "' missing required constraint '" + axis + "'.");
            throw ModuleConstraintKeyError("Module file " + file + " missing constraint key: " + axis);
        }
    }
    helptext_ = spec.helptext + "\nRequires sudo: " + constraint_.first("sudo");
}

std::string Module::label() const {
    return std::string(to_string(placement_)) + "/" + name_;
}

Environment Module::environment(const Options& options, const Environment& host_env) const {
    Environment env;
    auto path_it = host_env.find("PATH");
    if(path_it != host_env.end()) env["PATH"] = path_it->second;
    else if(const char* p = std::getenv("PATH")) env["PATH"] = p;
    for(const auto& var : environment_allow_list()) {
        auto it = host_env.find(var);
        if(it != host_env.end()) env[var] = it->second;
    }
    env["HOSTDIAG_MODULE_PATH"] = path_;
    for(const auto& [k, v] : options.global_args) env[k] = v;
    auto mod_it = options.per_module_args.find(name_);
    if(mod_it != options.per_module_args.end())
        for(const auto& [k, v] : mod_it->second) env[k] = v;
    return env;
}

std::vector<std::string> Module::command(const Environment& env, const std::string& script_path) const {
    switch(language_) {
        case Language::Binary: {
            auto it = env.find("HOSTDIAG_CALLPATH");
            std::string callpath = it == env.end() ? std::string() : it->second;
            return {callpath + "/bin/" + placement_dir(placement_) + "/" + name_};
        }
        case Language::Bash:
            return {"/bin/bash", script_path};
        case Language::Python:
            return {"/usr/bin/env", "python3", script_path};
    }
    throw ModuleUnsupportedLanguageError("Unsupported language for module '" + name_ + "'.");
}

std::string Module::run(const Options& options, const Environment& host_env, unsigned timeout_seconds) {
    auto& log = Logger::instance();
    Environment env = environment(options, host_env);

    std::unique_ptr<TempFile> script;
    if(language_ != Language::Binary) {
        try {
            script = std::make_unique<TempFile>(content_, temp_prefix(name_));
        } catch(const std::system_error& e) {
            throw ModuleRunFailure("Module execution failed: " + std::string(to_string(placement_)) + ":" + name_
                                   + ", " + e.what(), "", -1);
        }
    }
    std::vector<std::string> argv = command(env, script ? script->path() : std::string());
    log.info("module " + label() + ": command = " + utils::join(argv, " "));

    ProcessResult res = run_process(argv, env, timeout_seconds);
    output_ = res.output;
    if(!res.ok()) {
        std::string msg = "Module execution failed: " + std::string(to_string(placement_)) + ":" + name_;
        if(!res.error.empty()) msg += ", " + res.error;
        else if(res.timed_out) msg += ", timed out after " + std::to_string(timeout_seconds) + "s";
        else msg += ", returned " + std::to_string(res.exit_code);
        log.debug(msg);
        log.debug(output_);
        throw ModuleRunFailure(msg, output_, res.exit_code);
    }
    parse_output(output_);
    return output_;
}

bool Module::parse_output(const std::string& output) {
    ParsedOutput parsed = parse_module_output(output);
    verdict_ = parsed.verdict;
    summary_ = std::move(parsed.summary);
    details_ = std::move(parsed.details);
    return verdict_ != Verdict::Unknown;
}

std::string Module::list_line() const {
    return field(constraint_.first("sudo") == "True" ? "*" : "", 1, 1, true)
         + field(constraint_.first("perfimpact") == "True" ? "+" : "", 1, 1, true)
         + field(name_, 20, 18)
         + field(utils::join(constraint_.get("class"), ","), 10, 8)
         + field(utils::join(constraint_.get("domain"), ","), 13, 11)
         + field(title_, 77, 75);
}

std::string Module::help() const {
    return name_ + ":\n" + helptext_;
}

}
