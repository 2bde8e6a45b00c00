#include "wxdown/core/util/Process.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <thread>

namespace wxdown::core::util {
namespace {
std::vector<char*> make_argv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}
}

std::optional<CommandResult> run_command(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::nullopt;
    int fds[2];
    if (::pipe(fds) != 0) return std::nullopt;
    auto args = make_argv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]); ::close(fds[1]);
        return std::nullopt;
    }
    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::close(fds[0]); ::close(fds[1]);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) { ::dup2(devnull, STDERR_FILENO); ::close(devnull); }
        ::execvp(args[0], args.data());
        _exit(127);
    }
    ::close(fds[1]);
    CommandResult result;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) { result.output.append(buf, static_cast<size_t>(n)); continue; }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    ::close(fds[0]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return std::nullopt;
    }
    if (!WIFEXITED(status)) return std::nullopt;
    result.exitCode = WEXITSTATUS(status);
    if (result.exitCode == 127) {
        log_debug(fmt::format("command not runnable: {}", argv[0]));
        return std::nullopt;
    }
    return result;
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept : child(other.child) { other.child = -1; }
ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) { terminate(); child = other.child; other.child = -1; }
    return *this;
}
ChildProcess::~ChildProcess() { terminate(); }

bool ChildProcess::spawn(const std::vector<std::string>& argv) {
    if (child > 0 || argv.empty()) return false;
    auto args = make_argv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
        log_error(fmt::format("fork failed: {}", std::strerror(errno)));
        return false;
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::execvp(args[0], args.data());
        _exit(127);
    }
    child = pid;
    return true;
}

bool ChildProcess::reap(bool block, int* status) {
    if (child <= 0) return true;
    int st = 0;
    pid_t r;
    do { r = ::waitpid(child, &st, block ? 0 : WNOHANG); } while (r < 0 && errno == EINTR);
    if (r == child || (r < 0 && errno == ECHILD)) {
        if (status) *status = st;
        child = -1;
        return true;
    }
    return false;
}

bool ChildProcess::running() {
    if (child <= 0) return false;
    return !reap(false, nullptr);
}

bool ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (child <= 0) return true;
    if (!running()) return true;
    ::kill(child, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false, nullptr)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    log_warn(fmt::format("process {} ignored SIGTERM, sending SIGKILL", child));
    ::kill(child, SIGKILL);
    return reap(true, nullptr);
}

int ChildProcess::wait() {
    int status = 0;
    if (child <= 0) return -1;
    if (!reap(true, &status)) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}
}
