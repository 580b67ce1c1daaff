#include "ios_device_manager.hpp"
#include "../errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

namespace emu {

namespace {

constexpr const char* kXcrun = "xcrun";

std::string failure_message(const CommandResult& result) {
    std::string text = result.stderr_text.empty() ? result.stdout_text : result.stderr_text;
    if (const auto nl = text.find('\n'); nl != std::string::npos) {
        text.resize(nl);
    }
    if (text.empty()) {
        text = "simctl exited with code " + std::to_string(result.exit_code);
    }
    return text;
}

bool mentions(const CommandResult& result, const char* phrase) {
    return result.stderr_text.find(phrase) != std::string::npos ||
           result.stdout_text.find(phrase) != std::string::npos;
}

} // namespace

IosDeviceManager::IosDeviceManager(ICommandExecutor& executor, const std::chrono::milliseconds command_timeout)
    : executor_(executor)
    , command_timeout_(command_timeout) {}

CommandResult IosDeviceManager::simctl(std::vector<std::string> args, const CancellationToken& token) {
    CommandSpec spec;
    spec.program = kXcrun;
    spec.args.reserve(args.size() + 1);
    spec.args.emplace_back("simctl");
    std::ranges::move(args, std::back_inserter(spec.args));
    spec.timeout = command_timeout_;
    return executor_.run(spec, token);
}

std::string IosDeviceManager::simctl_checked(std::vector<std::string> args, const CancellationToken& token) {
    const CommandResult result = simctl(std::move(args), token);
    if (!result.success()) {
        throw DeviceError(ErrorKind::CommandFailed, failure_message(result));
    }
    return result.stdout_text;
}

bool IosDeviceManager::is_available(const CancellationToken& token) {
    try {
        return simctl({"help"}, token).success();
    } catch (const DeviceError& e) {
        spdlog::info("[iOS] simctl unavailable: {}", e.what());
        return false;
    }
}

std::vector<ios::SimDevice> IosDeviceManager::list_sims(const CancellationToken& token) {
    return ios::parse_device_list(simctl_checked({"list", "devices", "--json"}, token));
}

ios::SimDevice IosDeviceManager::find_sim(const std::string& udid, const CancellationToken& token) {
    for (auto& sim : list_sims(token)) {
        if (sim.udid == udid) {
            return sim;
        }
    }
    throw DeviceError(ErrorKind::DeviceNotFound, "Simulator " + udid + " not found");
}

std::vector<Device> IosDeviceManager::list_devices(const CancellationToken& token) {
    std::vector<Device> devices;
    for (const auto& sim : list_sims(token)) {
        if (!sim.is_available) continue;
        devices.push_back(ios::to_device(sim));
    }

    // Newest runtime first, then by name
    std::ranges::stable_sort(devices, [](const Device& a, const Device& b) {
        const auto& ra = std::get<IosAttributes>(a.attributes).runtime;
        const auto& rb = std::get<IosAttributes>(b.attributes).runtime;
        if (ra != rb) return ra > rb;
        return a.name < b.name;
    });

    spdlog::debug("[iOS] Listed {} simulator(s)", devices.size());
    return devices;
}

void IosDeviceManager::start_device(const std::string& identifier, const CancellationToken& token) {
    const CommandResult result = simctl({"boot", identifier}, token);
    if (!result.success()) {
        if (mentions(result, "current state: Booted")) {
            spdlog::info("[iOS] {} is already booted", identifier);
        } else if (mentions(result, "Invalid device")) {
            throw DeviceError(ErrorKind::DeviceNotFound, failure_message(result));
        } else {
            throw DeviceError(ErrorKind::CommandFailed, failure_message(result));
        }
    }

    // Bring the Simulator window up; the device is booted either way
    CommandSpec open;
    open.program = "open";
    open.args = {"-a", "Simulator"};
    try {
        executor_.spawn_detached(open);
    } catch (const DeviceError& e) {
        spdlog::warn("[iOS] Could not open Simulator.app: {}", e.what());
    }

    spdlog::info("[iOS] Booted {}", identifier);
}

void IosDeviceManager::stop_device(const std::string& identifier, const CancellationToken& token) {
    const CommandResult result = simctl({"shutdown", identifier}, token);
    if (!result.success()) {
        if (mentions(result, "current state: Shutdown")) {
            spdlog::info("[iOS] {} is already shut down", identifier);
            return;
        }
        if (mentions(result, "Invalid device")) {
            throw DeviceError(ErrorKind::DeviceNotFound, failure_message(result));
        }
        throw DeviceError(ErrorKind::CommandFailed, failure_message(result));
    }
    spdlog::info("[iOS] Shut down {}", identifier);
}

void IosDeviceManager::create_device(const DeviceConfig& config, const CancellationToken& token) {
    if (config.device_type.empty() || config.version.empty()) {
        throw DeviceError(ErrorKind::InvalidConfiguration, "Device type and runtime are required");
    }

    const auto existing = list_sims(token);
    if (std::ranges::any_of(existing, [&](const auto& s) {
            return s.name == config.name && s.runtime_id == config.version;
        })) {
        throw DeviceError(ErrorKind::NameCollision, "Device '" + config.name + "' already exists");
    }

    simctl_checked({"create", config.name, config.device_type, config.version}, token);
    spdlog::info("[iOS] Created {} ({}, {})", config.name, config.device_type, config.version);
}

void IosDeviceManager::delete_device(const std::string& identifier, const CancellationToken& token) {
    const auto sim = find_sim(identifier, token);
    if (ios::parse_state(sim.state) == DeviceStatus::Running) {
        stop_device(identifier, token);
    }
    simctl_checked({"delete", identifier}, token);
    spdlog::info("[iOS] Deleted {}", identifier);
}

void IosDeviceManager::wipe_device(const std::string& identifier, const CancellationToken& token) {
    const auto sim = find_sim(identifier, token);
    if (ios::parse_state(sim.state) == DeviceStatus::Running) {
        stop_device(identifier, token);
    }
    simctl_checked({"erase", identifier}, token);
    spdlog::info("[iOS] Erased {}", identifier);
}

DeviceDetails IosDeviceManager::get_device_details(const std::string& identifier, const CancellationToken& token) {
    const auto sim = find_sim(identifier, token);

    DeviceDetails details;
    details.platform = Platform::Ios;
    details.identifier = sim.udid;
    details.name = sim.name;
    details.status = sim.state.empty() ? to_string(DeviceStatus::Unknown) : sim.state;
    details.version = ios::runtime_display_name(sim.runtime_id);
    details.device_type = ios::device_type_display_name(sim.device_type_id);
    details.path = sim.data_path;

    details.extra.emplace_back("UDID", sim.udid);
    details.extra.emplace_back("Runtime ID", sim.runtime_id);
    details.extra.emplace_back("Device type ID", sim.device_type_id);
    if (!sim.log_path.empty()) {
        details.extra.emplace_back("Log path", sim.log_path);
    }
    return details;
}

void IosDeviceManager::stream_logs(const std::string& identifier,
                                   const std::function<void(LogEntry)>& on_entry,
                                   const CancellationToken& token) {
    const auto sim = find_sim(identifier, token);
    if (ios::parse_state(sim.state) != DeviceStatus::Running) {
        return;
    }

    CommandSpec spec;
    spec.program = kXcrun;
    spec.args = {"simctl", "spawn", identifier, "log", "stream", "--style", "compact"};
    spec.timeout = std::chrono::milliseconds(0);

    const DeviceTag source{Platform::Ios, identifier};
    executor_.stream(spec, [&](const std::string& line) {
        if (auto parsed = ios::parse_compact_log_line(line)) {
            on_entry(LogEntry{std::chrono::system_clock::now(), parsed->first, source, std::move(parsed->second)});
        }
    }, token);
}

std::vector<DeviceTypeOption> IosDeviceManager::list_device_types(const CancellationToken& token) {
    return ios::parse_device_types(simctl_checked({"list", "devicetypes", "--json"}, token));
}

std::vector<VersionOption> IosDeviceManager::list_versions(const CancellationToken& token) {
    return ios::parse_runtimes(simctl_checked({"list", "runtimes", "--json"}, token));
}

} // namespace emu
