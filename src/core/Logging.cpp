#include "Logging.h"
#include "JsonUtil.h"
#include <iostream>
#include <chrono>

namespace hostdiag {

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

const char* Logger::prefix(LogLevel lvl) const {
    switch(lvl) {
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

bool Logger::set_file(const std::string& path, LogLevel file_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if(file_.is_open()) file_.close();
    file_.clear();
    file_.open(path, std::ios::app);
    file_level_ = file_level;
    return file_.is_open();
}

void Logger::close_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if(file_.is_open()) file_.close();
}

bool Logger::has_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    bool to_console = static_cast<int>(lvl) <= static_cast<int>(level_.load());
    std::lock_guard<std::mutex> lock(mutex_);
    if(to_console) std::cerr << prefix(lvl) << msg << "\n";
    if(file_.is_open() && static_cast<int>(lvl) <= static_cast<int>(file_level_)) {
        file_ << jsonutil::time_to_iso(std::chrono::system_clock::now()) << ' ' << prefix(lvl) << msg << "\n";
        file_.flush();
    }
}

}
