#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace emu {

enum class Command {
    Interactive,
    List,
    Start,
    Stop,
    Delete,
    Wipe,
    Create
};

struct CommandLine {
    std::string config_path;
    bool demo = false;
    bool verbose = false;
    bool show_help = false;

    Command command = Command::Interactive;
    std::string platform;
    std::string device;
    bool json = false;
    bool assume_yes = false;

    // create
    std::string name;
    std::string device_type;
    std::string version;
    int ram_mb = 0;
    int storage_mb = 0;
};

// Parses argv without the program name. Throws std::invalid_argument on usage errors.
[[nodiscard]] CommandLine parse_command_line(const std::vector<std::string>& args);

void print_usage(std::ostream& out, const std::string& program_name);

} // namespace emu
