#pragma once
#include <string>
#include <functional>
#include <optional>

namespace hostdiag {

struct Config;

// Facts about the host consulted by pruning and exported to modules.
struct HostFacts {
    std::string distro = "unknown";
    bool root = false;
    bool instance = true;
    bool perfimpact = false;
    std::string net_driver = "Unknown";
    std::string virt_type = "unknown";
    // True when a software dependency can be executed; defaults to a PATH search.
    std::function<bool(const std::string&)> is_executable;

    bool can_execute(const std::string& program) const;

    static HostFacts detect(const Config& cfg);
};

// Distribution id (alami, rhel, suse, ubuntu) from the release files below `root`.
// Unrecognized content yields "unknown for <file>", no file at all "unknown".
std::string detect_distro(const std::string& root = "");
// Driver of the first (sorted) non-virtual interface under `sys_class_net`.
std::string detect_net_driver(const std::string& sys_class_net = "/sys/class/net");
std::string detect_virt_type(const std::string& root = "");
bool running_as_root();

// First executable match of `cmd` on `path_env` (colon separated); a command
// with a directory part is checked directly.
std::optional<std::string> which(const std::string& cmd, const std::string& path_env);

}
