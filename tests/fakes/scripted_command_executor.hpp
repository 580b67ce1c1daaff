#pragma once

#include "errors.hpp"
#include "interfaces/i_command_executor.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace emu::testing {

// Answers commands from a script keyed by the command line.
// A rule matches when its pattern occurs in "program arg1 arg2 ..."; the longest matching pattern wins.
class ScriptedCommandExecutor : public ICommandExecutor {
public:
    void on(const std::string& pattern, CommandResult result) {
        std::lock_guard lock(mutex_);
        results_.insert_or_assign(pattern, std::move(result));
    }

    void on_success(const std::string& pattern, const std::string& stdout_text = {}) {
        on(pattern, CommandResult{0, stdout_text, {}});
    }

    void on_failure(const std::string& pattern, const std::string& stderr_text, const int exit_code = 1) {
        on(pattern, CommandResult{exit_code, {}, stderr_text});
    }

    // Lines delivered by stream() for matching commands
    void on_stream(const std::string& pattern, std::vector<std::string> lines) {
        std::lock_guard lock(mutex_);
        streams_.insert_or_assign(pattern, std::move(lines));
    }

    // Commands matching the pattern fail as if the program did not exist
    void missing(const std::string& pattern) {
        std::lock_guard lock(mutex_);
        missing_.push_back(pattern);
    }

    [[nodiscard]] std::vector<std::string> commands() const {
        std::lock_guard lock(mutex_);
        return commands_;
    }

    [[nodiscard]] std::vector<CommandSpec> specs() const {
        std::lock_guard lock(mutex_);
        return specs_;
    }

    [[nodiscard]] std::vector<std::string> detached() const {
        std::lock_guard lock(mutex_);
        return detached_;
    }

    [[nodiscard]] bool ran(const std::string& pattern) const {
        std::lock_guard lock(mutex_);
        for (const auto& command : commands_) {
            if (command.find(pattern) != std::string::npos) return true;
        }
        return false;
    }

    static std::string command_line(const CommandSpec& spec) {
        std::string line = spec.program;
        for (const auto& arg : spec.args) {
            line += " " + arg;
        }
        return line;
    }

    CommandResult run(const CommandSpec& spec, const CancellationToken& token) override {
        token.throw_if_cancelled();
        const std::string line = command_line(spec);

        std::lock_guard lock(mutex_);
        commands_.push_back(line);
        specs_.push_back(spec);
        throw_if_missing(line);

        if (const auto* result = best_match(results_, line)) {
            return *result;
        }
        return CommandResult{127, {}, "unscripted command: " + line};
    }

    void stream(const CommandSpec& spec, const std::function<void(const std::string&)>& on_line,
                const CancellationToken& token) override {
        const std::string line = command_line(spec);
        std::vector<std::string> lines;
        {
            std::lock_guard lock(mutex_);
            commands_.push_back(line);
            specs_.push_back(spec);
            throw_if_missing(line);
            if (const auto* scripted = best_match(streams_, line)) {
                lines = *scripted;
            }
        }
        for (const auto& l : lines) {
            if (token.is_cancelled()) return;
            on_line(l);
        }
    }

    void spawn_detached(const CommandSpec& spec) override {
        const std::string line = command_line(spec);
        std::lock_guard lock(mutex_);
        detached_.push_back(line);
        throw_if_missing(line);
    }

private:
    template <typename T>
    static const T* best_match(const std::map<std::string, T>& rules, const std::string& line) {
        const T* best = nullptr;
        size_t best_length = 0;
        for (const auto& [pattern, value] : rules) {
            if (line.find(pattern) != std::string::npos && (!best || pattern.length() > best_length)) {
                best = &value;
                best_length = pattern.length();
            }
        }
        return best;
    }

    // Caller holds mutex_
    void throw_if_missing(const std::string& line) const {
        for (const auto& pattern : missing_) {
            if (line.find(pattern) != std::string::npos) {
                throw DeviceError(ErrorKind::ToolNotFound, "Command not found: " + line);
            }
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, CommandResult> results_;
    std::map<std::string, std::vector<std::string>> streams_;
    std::vector<std::string> missing_;
    std::vector<std::string> commands_;
    std::vector<CommandSpec> specs_;
    std::vector<std::string> detached_;
};

} // namespace emu::testing
