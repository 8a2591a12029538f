#pragma once
#include <string>
#include <vector>
#include <map>

namespace hostdiag {

using Environment = std::map<std::string, std::string>;

struct ProcessResult {
    int exit_code = -1;        // exit status, or -signal when killed
    bool timed_out = false;
    std::string output;        // stdout and stderr interleaved
    std::string error;         // spawn failure description, empty on success
    bool ok() const { return error.empty() && !timed_out && exit_code == 0; }
};

// Runs argv[0] (absolute path) with exactly `env` as its environment and blocks
// until it exits. stderr is merged into stdout. timeout_seconds == 0 waits
// indefinitely; on expiry the child's process group is killed.
ProcessResult run_process(const std::vector<std::string>& argv, const Environment& env, unsigned timeout_seconds = 0);

// Script file under the temp directory, unlinked on destruction.
class TempFile {
public:
    explicit TempFile(const std::string& content, const std::string& prefix = "hostdiag-");
    ~TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

}
