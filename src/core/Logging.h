#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <atomic>

namespace hostdiag {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

// Process-wide logger. Console sink (stderr) filters on level(); the optional
// file sink (the run's Main.log) has its own threshold.
class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }
    bool set_file(const std::string& path, LogLevel file_level = LogLevel::Info);
    void close_file();
    bool has_file() const;
    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& m){ log(LogLevel::Error, m); }
    void warn(const std::string& m){ log(LogLevel::Warn, m); }
    void info(const std::string& m){ log(LogLevel::Info, m); }
    void debug(const std::string& m){ log(LogLevel::Debug, m); }
    void trace(const std::string& m){ log(LogLevel::Trace, m); }
private:
    Logger() = default;
    const char* prefix(LogLevel lvl) const;
    std::atomic<LogLevel> level_{LogLevel::Info};
    LogLevel file_level_ = LogLevel::Info;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

}
