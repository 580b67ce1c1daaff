#pragma once

#include "../cancellation.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace emu {

struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    std::string stdin_data;                       // Written to the child's stdin, then closed
    std::chrono::milliseconds timeout{30000};     // Zero means no timeout
};

struct CommandResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool success() const { return exit_code == 0; }
};

class ICommandExecutor {
public:
    virtual ~ICommandExecutor() = default;

    // Runs to completion, throws TaskCancelled when the token is cancelled
    virtual CommandResult run(const CommandSpec& spec, const CancellationToken& token) = 0;

    // Delivers stdout line by line until EOF or cancellation
    virtual void stream(const CommandSpec& spec,
                        const std::function<void(const std::string&)>& on_line,
                        const CancellationToken& token) = 0;

    // Starts a process that outlives the call (emulator windows)
    virtual void spawn_detached(const CommandSpec& spec) = 0;
};

} // namespace emu
