#pragma once
#include "Constraint.h"
#include "Process.h"
#include <string>
#include <vector>
#include <memory>

namespace hostdiag {

struct Options;

enum class Placement { Prediagnostic, Run, Postdiagnostic };
enum class Language { Bash, Python, Binary };
// None: not (successfully) executed yet.
enum class Verdict { None, Success, Warn, Failure, Unknown };

const char* to_string(Placement p);
const char* to_string(Language l);
const char* to_string(Verdict v);
// Directory under the module root / CALLPATH/bin: pre.d, mod.d, post.d.
const char* placement_dir(Placement p);

// Raw metadata as read from a module document, before validation.
struct ModuleSpec {
    std::string name;
    std::string version;
    std::string title;
    std::string helptext;
    std::string placement;
    std::string language;
    std::string content;
    std::string path;                 // originating file, may be empty
    std::vector<std::string> package;
    bool has_package = false;         // package key present and non-empty
    ConstraintValue constraint;
};

// Result of scanning module output for a status line.
struct ParsedOutput {
    Verdict verdict = Verdict::Unknown;
    std::string summary;
    std::vector<std::string> details;
};

// Scans trimmed output lines: "[SUCCESS]" unless WARN already seen, "[WARN]",
// "[FAILURE]" (stops the scan). A match takes the following contiguous "--"
// lines as details. Nothing matched gives Unknown with a fixed summary.
ParsedOutput parse_module_output(const std::string& output);

class Module {
public:
    explicit Module(ModuleSpec spec);

    static const std::vector<std::string>& required_axes();
    static const std::vector<std::string>& environment_allow_list();

    const std::string& name() const { return name_; }
    const std::string& version() const { return version_; }
    const std::string& title() const { return title_; }
    const std::string& helptext() const { return helptext_; }
    const std::string& content() const { return content_; }
    const std::string& path() const { return path_; }
    const std::vector<std::string>& package() const { return package_; }
    Placement placement() const { return placement_; }
    Language language() const { return language_; }
    const Constraint& constraint() const { return constraint_; }

    // "<placement>/<name>" for log lines.
    std::string label() const;

    bool applicable() const { return applicable_; }
    const std::string& skip_reason() const { return skip_reason_; }
    void mark_not_applicable(const std::string& reason) { applicable_ = false; skip_reason_ = reason; }
    // Phase 2 may overwrite the reason without changing applicability.
    void set_skip_reason(const std::string& reason) { skip_reason_ = reason; }

    Verdict verdict() const { return verdict_; }
    const std::string& summary() const { return summary_; }
    const std::vector<std::string>& details() const { return details_; }
    const std::string& output() const { return output_; }

    const std::string& digest() const { return digest_; }
    void set_digest(std::string d) { digest_ = std::move(d); }

    // Environment the module process sees: PATH, allow-listed host variables,
    // HOSTDIAG_MODULE_PATH, global args, then this module's args.
    Environment environment(const Options& options, const Environment& host_env) const;
    // Command line; binaries live under <callpath>/bin/<placement dir>/<name>.
    std::vector<std::string> command(const Environment& env, const std::string& script_path) const;

    // Blocks until the module exits. Returns its output and records the verdict.
    // Throws ModuleRunFailure on non-zero exit, signal, spawn failure or timeout.
    std::string run(const Options& options, const Environment& host_env, unsigned timeout_seconds = 0);

    // Re-parses output into verdict/summary/details; true when a status line matched.
    bool parse_output(const std::string& output);

    std::string list_line() const;
    std::string help() const;

private:
    std::string name_, version_, title_, helptext_, content_, path_;
    std::vector<std::string> package_;
    Placement placement_ = Placement::Run;
    Language language_ = Language::Bash;
    Constraint constraint_;

    bool applicable_ = true;
    std::string skip_reason_;
    Verdict verdict_ = Verdict::None;
    std::string summary_;
    std::vector<std::string> details_;
    std::string output_;
    std::string digest_;
};

using ModulePtr = std::shared_ptr<Module>;

}
