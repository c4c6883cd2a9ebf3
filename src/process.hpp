#pragma once

#include <chrono>
#include <string>
#include <vector>

enum class CommandStatus {
    COMPLETED,
    NOT_FOUND,
    SPAWN_FAILED,
    TIMED_OUT
};

struct CommandResult {
    CommandStatus status = CommandStatus::SPAWN_FAILED;
    int exit_code = -1;
    std::string output;
    std::string error;

    bool succeeded() const { return status == CommandStatus::COMPLETED && exit_code == 0; }
};

// Runs argv[0] (looked up on PATH) without a shell and captures its stdout.
// stdin and stderr are redirected to /dev/null. The child gets its own process
// group, which is killed as a whole once the timeout expires.
CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);
