#include "app_controller.hpp"
#include "command_line.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "headless.hpp"
#include "logging.hpp"
#include "platform_factory.hpp"
#include "shared_state.hpp"
#include "task_coordinator.hpp"
#include "tui/tui_app.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

int run_headless(const emu::CommandLine& options, emu::headless::Backends backends) {
    const auto platform = emu::headless::parse_platform(options.platform);

    switch (options.command) {
        case emu::Command::List:
            return emu::headless::list_devices(backends, platform, options.json, std::cout);
        case emu::Command::Start:
            return emu::headless::start_device(backends, options.device, platform, std::cout);
        case emu::Command::Stop:
            return emu::headless::stop_device(backends, options.device, platform, std::cout);
        case emu::Command::Delete:
            return emu::headless::delete_device(backends, options.device, platform, options.assume_yes,
                                                std::cin, std::cout);
        case emu::Command::Wipe:
            return emu::headless::wipe_device(backends, options.device, platform, options.assume_yes,
                                              std::cin, std::cout);
        case emu::Command::Create: {
            if (!platform) {
                throw emu::DeviceError(emu::ErrorKind::InvalidConfiguration,
                                       "--platform must be android or ios");
            }
            emu::DeviceConfig config;
            config.platform = *platform;
            config.name = options.name;
            config.device_type = options.device_type;
            config.version = options.version;
            config.ram_mb = options.ram_mb;
            config.storage_mb = options.storage_mb;
            return emu::headless::create_device(backends, config, std::cout);
        }
        case emu::Command::Interactive:
            break;
    }
    return 0;
}

int run_interactive(const emu::AppConfig& config, emu::IDeviceManager& android, emu::IDeviceManager& ios) {
    // Declaration order matters: tasks reference the state and the managers
    emu::SharedState state(config.state_limits());
    emu::TaskCoordinator tasks;
    emu::AppController controller(state, tasks, android, ios, config);

    emu::TuiApp tui;
    tui.init();

    emu::EventLoop loop(state, tasks, controller, tui, tui, config);
    controller.start();
    loop.run();

    tui.shutdown();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Writes to a dead pipe (logcat, simctl) must fail with EPIPE instead of killing us
    signal(SIGPIPE, SIG_IGN);

    emu::CommandLine options;
    try {
        options = emu::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        emu::print_usage(std::cerr, argv[0]);
        return 2;
    }

    if (options.show_help) {
        emu::print_usage(std::cout, argv[0]);
        return 0;
    }

    const bool headless = options.command != emu::Command::Interactive;

    if (!options.config_path.empty() && !std::filesystem::exists(options.config_path)) {
        std::cerr << "Error: configuration file not found: " << options.config_path << std::endl;
        return 2;
    }

    emu::AppConfig config;
    try {
        const std::string path = options.config_path.empty() ? emu::ConfigLoader::default_path()
                                                             : options.config_path;
        config = emu::ConfigLoader(path).load();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    emu::logging::LoggingConfig logging_config;
    logging_config.sink = headless ? emu::logging::Sink::Stderr : emu::logging::Sink::File;
    logging_config.level = options.verbose ? "debug" : config.log_level;
    logging_config.file_path = config.log_file;
    emu::logging::init(logging_config);

    try {
        // Executor outlives the managers that reference it
        auto executor = emu::make_command_executor();
        std::unique_ptr<emu::IDeviceManager> android;
        std::unique_ptr<emu::IDeviceManager> ios;
        if (options.demo) {
            android = emu::make_stub_manager(emu::Platform::Android);
            ios = emu::make_stub_manager(emu::Platform::Ios);
        } else {
            android = emu::make_android_manager(*executor, config);
            ios = emu::make_ios_manager(*executor, config);
        }

        if (headless) {
            return run_headless(options, emu::headless::Backends{*android, *ios});
        }
        return run_interactive(config, *android, *ios);
    } catch (const std::exception& e) {
        // The terminal was restored when TuiApp went out of scope
        if (!headless) {
            spdlog::error("[Main] {}", e.what());
        }
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
