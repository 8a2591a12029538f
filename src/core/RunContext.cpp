#include "RunContext.h"
#include "JsonUtil.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <ostream>

namespace fs = std::filesystem;

namespace hostdiag {

RunContext::RunContext(const Options& options, Environment host_env, std::ostream& console,
                       std::string logdir, unsigned module_timeout)
    : options_(options), host_env_(std::move(host_env)), console_(console),
      logdir_(std::move(logdir)), module_timeout_(module_timeout) {}

void RunContext::notify_module_running(const Module& mod) {
    std::lock_guard<std::mutex> lock(announce_mutex_);
    if(!announced_) {
        console_ << "Running Modules:\n" << mod.name();
        announced_ = true;
    } else {
        console_ << ", " << mod.name();
    }
    console_.flush();
    Logger::instance().debug("module " + mod.label() + ": started");
}

bool RunContext::announced() const {
    std::lock_guard<std::mutex> lock(announce_mutex_);
    return announced_;
}

std::string RunContext::module_log_path(const Module& mod) const {
    if(logdir_.empty()) return "";
    return (fs::path(logdir_) / to_string(mod.placement()) / (mod.name() + ".log")).string();
}

void RunContext::write_module_log(const Module& mod, const std::string& text) {
    std::string path = module_log_path(mod);
    if(path.empty()) return;
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    std::ofstream out(path, std::ios::app);
    if(!out) {
        Logger::instance().warn("module " + mod.label() + ": cannot write log " + path);
        return;
    }
    out << jsonutil::time_to_iso(std::chrono::system_clock::now()) << " " << mod.label() << "\n" << text;
    if(!text.empty() && text.back() != '\n') out << "\n";
}

std::string RunContext::execute(Module& mod) {
    if(executor_) return executor_(mod);
    return mod.run(options_, host_env_, module_timeout_);
}

}
