#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace wxdown::core::util {
struct CommandResult {
    int exitCode{-1};
    std::string output; // stdout only
};

// Runs argv[0] (looked up in PATH) to completion and captures stdout.
// nullopt when the process could not be started or did not exit normally.
std::optional<CommandResult> run_command(const std::vector<std::string>& argv);

// Owns one spawned child. Destruction terminates it.
class ChildProcess {
public:
    ChildProcess() = default;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ~ChildProcess();

    bool spawn(const std::vector<std::string>& argv);
    bool running();
    int pid() const { return child; }
    // SIGTERM, wait up to grace, then SIGKILL. True once the child is reaped.
    bool terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(3000));
    // Blocks until exit; returns the exit code (or -1 on abnormal exit).
    int wait();
private:
    int child{-1};
    bool reap(bool block, int* status);
};
}
