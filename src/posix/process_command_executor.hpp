#pragma once

#include "../interfaces/i_command_executor.hpp"
#include <sys/types.h>

namespace emu {

// fork/exec based executor. Output is collected with poll() in short slices so
// cancellation and timeouts are observed promptly; a cancelled or timed-out child
// is terminated (SIGTERM, then SIGKILL) and always reaped.
class ProcessCommandExecutor : public ICommandExecutor {
public:
    CommandResult run(const CommandSpec& spec, const CancellationToken& token) override;

    void stream(const CommandSpec& spec,
                const std::function<void(const std::string&)>& on_line,
                const CancellationToken& token) override;

    void spawn_detached(const CommandSpec& spec) override;

private:
    // Owns a running child and its pipe ends; kills and reaps on destruction
    class ChildProcess {
    public:
        ChildProcess() = default;
        ~ChildProcess();

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

        // Returns the exit status (128 + signal for signalled children)
        int wait();
        void terminate();
        void close_stdin();

        pid_t pid = -1;
        int stdin_fd = -1;
        int stdout_fd = -1;
        int stderr_fd = -1;
    };

    static void launch(const CommandSpec& spec, ChildProcess& child);
    static void write_stdin(ChildProcess& child, const std::string& data);
};

} // namespace emu
