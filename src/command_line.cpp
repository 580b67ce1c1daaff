#include "command_line.hpp"
#include <charconv>
#include <ostream>
#include <stdexcept>

namespace emu {

namespace {

Command parse_command(const std::string& word) {
    if (word == "list") return Command::List;
    if (word == "start") return Command::Start;
    if (word == "stop") return Command::Stop;
    if (word == "delete") return Command::Delete;
    if (word == "wipe") return Command::Wipe;
    if (word == "create") return Command::Create;
    throw std::invalid_argument("Unknown command '" + word + "'");
}

bool takes_device(Command command) {
    return command == Command::Start || command == Command::Stop ||
           command == Command::Delete || command == Command::Wipe;
}

bool takes_confirmation(Command command) {
    return command == Command::Delete || command == Command::Wipe;
}

int parse_megabytes(const std::string& option, const std::string& value) {
    int result = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size() || result < 0) {
        throw std::invalid_argument(option + " expects a number of megabytes, got '" + value + "'");
    }
    return result;
}

void require(const std::string& value, const std::string& option) {
    if (value.empty()) {
        throw std::invalid_argument("create requires " + option);
    }
}

} // namespace

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine result;
    bool have_command = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires an argument");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
        } else if (arg == "--config") {
            result.config_path = value();
        } else if (arg == "--demo") {
            result.demo = true;
        } else if (arg == "--verbose" || arg == "-v") {
            result.verbose = true;
        } else if (arg == "--platform" && have_command) {
            result.platform = value();
        } else if (arg == "--json" && result.command == Command::List) {
            result.json = true;
        } else if ((arg == "--yes" || arg == "-y") && takes_confirmation(result.command)) {
            result.assume_yes = true;
        } else if (arg == "--name" && result.command == Command::Create) {
            result.name = value();
        } else if (arg == "--device-type" && result.command == Command::Create) {
            result.device_type = value();
        } else if (arg == "--version" && result.command == Command::Create) {
            result.version = value();
        } else if (arg == "--ram" && result.command == Command::Create) {
            result.ram_mb = parse_megabytes(arg, value());
        } else if (arg == "--storage" && result.command == Command::Create) {
            result.storage_mb = parse_megabytes(arg, value());
        } else if (arg.starts_with("-")) {
            throw std::invalid_argument("Unknown option '" + arg + "'");
        } else if (!have_command) {
            result.command = parse_command(arg);
            have_command = true;
        } else if (takes_device(result.command) && result.device.empty()) {
            result.device = arg;
        } else {
            throw std::invalid_argument("Unexpected argument '" + arg + "'");
        }
    }

    if (result.show_help) {
        return result;
    }

    if (takes_device(result.command) && result.device.empty()) {
        throw std::invalid_argument("A device identifier or name is required");
    }

    if (result.command == Command::Create) {
        if (result.platform != "android" && result.platform != "ios") {
            throw std::invalid_argument("create requires --platform android or ios");
        }
        require(result.name, "--name");
        require(result.device_type, "--device-type");
        require(result.version, "--version");
    }

    return result;
}

void print_usage(std::ostream& out, const std::string& program_name) {
    out << "Usage: " << program_name << " [OPTIONS] [COMMAND]\n\n"
        << "Terminal manager for Android emulators and iOS simulators.\n"
        << "Without a command the interactive interface starts.\n\n"
        << "Options:\n"
        << "  --config FILE     Configuration file (default: ~/.config/emu/config.json)\n"
        << "  --demo            Use in-memory demo devices instead of the real tools\n"
        << "  -v, --verbose     Debug logging\n"
        << "  -h, --help        Show this help message\n"
        << "\nCommands:\n"
        << "  list [--platform android|ios|all] [--json]\n"
        << "  start <device> [--platform android|ios]\n"
        << "  stop <device> [--platform android|ios]\n"
        << "  delete <device> [--platform android|ios] [-y|--yes]\n"
        << "  wipe <device> [--platform android|ios] [-y|--yes]\n"
        << "  create --platform android|ios --name NAME --device-type ID --version ID\n"
        << "         [--ram MB] [--storage MB]\n"
        << "\nDevices are matched by identifier or display name.\n";
}

} // namespace emu
