#include "Process.h"
#include "Logging.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostdiag {

namespace {

void close_fd(int& fd) {
    if(fd >= 0) { ::close(fd); fd = -1; }
}

int decode_status(int status) {
    if(WIFEXITED(status)) return WEXITSTATUS(status);
    if(WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const Environment& env, unsigned timeout_seconds) {
    ProcessResult result;
    if(argv.empty()) { result.error = "empty command"; return result; }

    // Build exec vectors before fork; the child must not allocate.
    std::vector<std::string> args = argv;
    std::vector<char*> cargv;
    for(auto& a : args) cargv.push_back(a.data());
    cargv.push_back(nullptr);
    std::vector<std::string> envs;
    for(const auto& kv : env) envs.push_back(kv.first + "=" + kv.second);
    std::vector<char*> cenv;
    for(auto& e : envs) cenv.push_back(e.data());
    cenv.push_back(nullptr);

    // O_CLOEXEC keeps the write end out of children forked concurrently by other workers.
    int fds[2] = {-1, -1};
    if(::pipe2(fds, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = ::fork();
    if(pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close_fd(fds[0]); close_fd(fds[1]);
        return result;
    }

    if(pid == 0) {
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if(devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
        ::execve(cargv[0], cargv.data(), cenv.data());
        const char msg[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    close_fd(fds[1]);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    char buf[4096];
    while(true) {
        int wait_ms = -1;
        if(timeout_seconds > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
            if(left <= 0) {
                result.timed_out = true;
                ::kill(-pid, SIGKILL);
                break;
            }
            wait_ms = static_cast<int>(left);
        }
        struct pollfd pfd{fds[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, wait_ms);
        if(rc < 0) {
            if(errno == EINTR) continue;
            result.error = std::string("poll failed: ") + std::strerror(errno);
            ::kill(-pid, SIGKILL);
            break;
        }
        if(rc == 0) continue; // deadline re-checked at loop top
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if(n < 0) {
            if(errno == EINTR || errno == EAGAIN) continue;
            result.error = std::string("read failed: ") + std::strerror(errno);
            ::kill(-pid, SIGKILL);
            break;
        }
        if(n == 0) break;
        result.output.append(buf, static_cast<size_t>(n));
    }
    close_fd(fds[0]);

    int status = 0;
    while(::waitpid(pid, &status, 0) < 0) {
        if(errno != EINTR) {
            if(result.error.empty()) result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }
    result.exit_code = decode_status(status);
    if(result.timed_out) Logger::instance().debug("process " + argv[0] + " killed after " + std::to_string(timeout_seconds) + "s");
    return result;
}

TempFile::TempFile(const std::string& content, const std::string& prefix) {
    const char* tmp = std::getenv("TMPDIR");
    std::string tmpl = std::string(tmp && *tmp ? tmp : "/tmp") + "/" + prefix + "XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');
    int fd = ::mkstemp(name.data());
    if(fd < 0) throw std::system_error(errno, std::generic_category(), "mkstemp " + tmpl);
    path_ = name.data();
    size_t off = 0;
    while(off < content.size()) {
        ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if(n < 0) {
            if(errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(path_.c_str());
            throw std::system_error(err, std::generic_category(), "write " + path_);
        }
        off += static_cast<size_t>(n);
    }
    ::close(fd);
}

TempFile::~TempFile() {
    if(!path_.empty()) ::unlink(path_.c_str());
}

}
