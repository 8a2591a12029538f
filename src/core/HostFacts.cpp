#include "HostFacts.h"
#include "Config.h"
#include "Logging.h"
#include "Utils.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace hostdiag {

namespace {

bool is_file(const std::string& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

std::string first_line(const std::string& p) {
    auto lines = utils::read_lines(p);
    return lines.empty() ? std::string() : lines.front();
}

bool matches(const std::string& line, const char* pattern) {
    return std::regex_search(line, std::regex(pattern), std::regex_constants::match_continuous);
}

} // namespace

std::string detect_distro(const std::string& root) {
    const std::string system_release = root + "/etc/system-release";
    const std::string suse_release = root + "/etc/SuSE-release";
    const std::string lsb_release = root + "/etc/lsb-release";
    const std::string issue = root + "/etc/issue";
    const std::string os_release = root + "/etc/os-release";

    if(is_file(system_release)) {
        std::string s = first_line(system_release);
        if(matches(s, R"(Amazon Linux AMI release [0-9]{4}\.[0-9]{2})")) return "alami";
        if(matches(s, R"(Red Hat Enterprise Linux Server release [0-9]\.[0-9])")
           || matches(s, R"(CentOS Linux release ([0-9])\.([0-9])\.([0-9]{4}))")) return "rhel";
        return "unknown for /etc/system-release";
    }
    if(is_file(suse_release)) {
        if(matches(first_line(suse_release), R"(SUSE Linux Enterprise Server [0-9]{2})")) return "suse";
        return "unknown for /etc/SuSE-release";
    }
    if(is_file(lsb_release)) {
        for(const auto& line : utils::read_lines(lsb_release))
            if(matches(line, "DISTRIB_ID=Ubuntu")) return "ubuntu";
        return "unknown for /etc/lsb-release";
    }
    if(is_file(issue)) {
        std::string s = first_line(issue);
        if(matches(s, R"(Amazon Linux AMI release [0-9]{4}\.[0-9]{2})")) return "alami";
        if(matches(s, R"(Red Hat Enterprise Linux Server release \d\.\d+)")
           || matches(s, R"(CentOS release \d\.\d+)")) return "rhel";
        return "unknown for /etc/issue";
    }
    if(is_file(os_release)) {
        for(const auto& line : utils::read_lines(os_release)) {
            if(matches(line, R"(PRETTY_NAME="SUSE Linux Enterprise Server [0-9]{2})")) return "suse";
            if(matches(line, R"(PRETTY_NAME="Amazon Linux AMI [0-9]{4}\.[0-9]{2})")) return "alami";
        }
        return "unknown for /etc/os-release";
    }
    return "unknown";
}

std::string detect_net_driver(const std::string& sys_class_net) {
    std::error_code ec;
    fs::directory_iterator it(sys_class_net, ec);
    if(ec) return "Unknown";
    std::vector<std::string> devices;
    for(const auto& entry : it) {
        std::error_code lec;
        fs::path target = fs::read_symlink(entry.path(), lec);
        if(lec) continue;
        fs::path resolved = target.is_absolute() ? target : (entry.path().parent_path() / target).lexically_normal();
        if(resolved.string().find("virtual") != std::string::npos) continue;
        devices.push_back(entry.path().filename().string());
    }
    if(devices.empty()) return "Unknown";
    std::sort(devices.begin(), devices.end());
    std::error_code mec;
    fs::path module = fs::read_symlink(fs::path(sys_class_net) / devices.front() / "device" / "driver" / "module", mec);
    if(mec) return "Unknown";
    return module.filename().string();
}

std::string detect_virt_type(const std::string& root) {
    std::string hv = utils::trim(first_line(root + "/sys/hypervisor/type"));
    if(!hv.empty()) return hv;
    std::string vendor = utils::trim(first_line(root + "/sys/class/dmi/id/sys_vendor"));
    return vendor.empty() ? std::string("unknown") : vendor;
}

bool running_as_root() {
    return ::geteuid() == 0;
}

std::optional<std::string> which(const std::string& cmd, const std::string& path_env) {
    auto usable = [](const std::string& p){
        struct stat st{};
        return ::stat(p.c_str(), &st) == 0 && !S_ISDIR(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
    };
    if(cmd.empty()) return std::nullopt;
    if(cmd.find('/') != std::string::npos) {
        if(usable(cmd)) return cmd;
        return std::nullopt;
    }
    std::vector<std::string> seen;
    for(const auto& dir : utils::split_csv(path_env, ':')) {
        if(std::find(seen.begin(), seen.end(), dir) != seen.end()) continue;
        seen.push_back(dir);
        std::string candidate = dir + "/" + cmd;
        if(usable(candidate)) return candidate;
    }
    return std::nullopt;
}

bool HostFacts::can_execute(const std::string& program) const {
    if(is_executable) return is_executable(program);
    const char* path = std::getenv("PATH");
    return which(program, path ? path : "/usr/local/bin:/usr/bin:/bin").has_value();
}

HostFacts HostFacts::detect(const Config& cfg) {
    HostFacts f;
    f.distro = detect_distro();
    f.root = running_as_root();
    f.instance = !cfg.not_an_instance;
    f.perfimpact = cfg.perfimpact;
    f.net_driver = detect_net_driver();
    f.virt_type = f.instance ? detect_virt_type() : "non-virtualized";
    Logger::instance().debug("host facts: distro=" + f.distro + " root=" + (f.root ? "true" : "false")
        + " instance=" + (f.instance ? "true" : "false") + " net_driver=" + f.net_driver + " virt_type=" + f.virt_type);
    return f;
}

}
