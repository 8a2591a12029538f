#pragma once
#include "Logging.h"
#include "Module.h"
#include "Options.h"
#include "Process.h"
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

namespace hostdiag {

// Runs one module and returns its output; throws ModuleRunFailure on failure.
using ModuleExecutor = std::function<std::string(Module&)>;

// State shared by the control thread and the workers of one run.
class RunContext {
public:
    RunContext(const Options& options, Environment host_env, std::ostream& console,
               std::string logdir = "", unsigned module_timeout = 0);

    // Prints "Running Modules:\n<name>" for the first call, ", <name>" after that.
    void notify_module_running(const Module& mod);
    bool announced() const;

    // Appends text to <logdir>/<placement>/<name>.log; no-op without a logdir.
    void write_module_log(const Module& mod, const std::string& text);
    std::string module_log_path(const Module& mod) const;

    // Default executor runs the module process; tests substitute their own.
    std::string execute(Module& mod);
    void set_executor(ModuleExecutor exec) { executor_ = std::move(exec); }

    Logger& log() { return Logger::instance(); }
    const Options& options() const { return options_; }
    const Environment& host_env() const { return host_env_; }

private:
    const Options& options_;
    Environment host_env_;
    std::ostream& console_;
    std::string logdir_;
    unsigned module_timeout_;
    ModuleExecutor executor_;

    mutable std::mutex announce_mutex_;
    bool announced_ = false;
};

}
