#include "android_device_manager.hpp"
#include "../errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace emu {

namespace {

constexpr auto kStopPollInterval = std::chrono::milliseconds(500);
constexpr int kStopPollAttempts = 30;

// Files holding user data inside an AVD directory
const char* const kUserDataFiles[] = {
    "userdata-qemu.img",
    "userdata-qemu.img.qcow2",
    "cache.img",
    "cache.img.qcow2",
};

std::string first_line(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        const auto begin = line.find_first_not_of(" \t\r");
        if (begin != std::string::npos) {
            const auto end = line.find_last_not_of(" \t\r");
            return line.substr(begin, end - begin + 1);
        }
    }
    return {};
}

// Prefers the tool's own "Error:" line over the rest of its output
std::string failure_message(const CommandResult& result) {
    for (const std::string* text : {&result.stderr_text, &result.stdout_text}) {
        std::istringstream stream(*text);
        std::string line;
        while (std::getline(stream, line)) {
            if (const auto pos = line.find("Error:"); pos != std::string::npos) {
                return line.substr(pos);
            }
        }
    }
    std::string message = first_line(result.stderr_text);
    if (message.empty()) message = first_line(result.stdout_text);
    if (message.empty()) message = "exit code " + std::to_string(result.exit_code);
    return message;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return {};
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Rewrites the given keys of an ini file, appending the ones that are missing
void update_config_file(const fs::path& path, std::map<std::string, std::string> updates) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        const auto eq = line.find('=');
        if (eq != std::string::npos) {
            std::string key = line.substr(0, eq);
            key.erase(key.find_last_not_of(" \t") + 1);
            if (const auto it = updates.find(key); it != updates.end()) {
                line = key + "=" + it->second;
                updates.erase(it);
            }
        }
        lines.push_back(line);
    }
    in.close();

    for (const auto& [key, value] : updates) {
        lines.push_back(key + "=" + value);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw DeviceError(ErrorKind::CommandFailed, "Cannot write " + path.string());
    }
    for (const auto& l : lines) {
        out << l << '\n';
    }
}

std::string display_name(const std::string& avd_name) {
    std::string name = avd_name;
    std::ranges::replace(name, '_', ' ');
    return name;
}

} // namespace

AndroidDeviceManager::AndroidDeviceManager(ICommandExecutor& executor, std::string sdk_root,
                                           const std::chrono::milliseconds command_timeout)
    : executor_(executor)
    , sdk_root_override_(std::move(sdk_root))
    , command_timeout_(command_timeout) {}

std::optional<AndroidDeviceManager::Tools> AndroidDeviceManager::locate_tools() const {
    std::string root = sdk_root_override_;
    if (root.empty()) {
        if (const char* home = std::getenv("ANDROID_HOME"); home && *home) {
            root = home;
        } else if (const char* sdk = std::getenv("ANDROID_SDK_ROOT"); sdk && *sdk) {
            root = sdk;
        }
    }
    if (root.empty()) {
        spdlog::info("[Android] ANDROID_HOME is not set");
        return std::nullopt;
    }

    std::error_code ec;
    Tools tools;
    tools.sdk_root = root;

    std::vector<fs::path> avdmanager_candidates = {tools.sdk_root / "cmdline-tools" / "latest" / "bin" / "avdmanager"};
    for (const auto& entry : fs::directory_iterator(tools.sdk_root / "cmdline-tools", ec)) {
        avdmanager_candidates.push_back(entry.path() / "bin" / "avdmanager");
    }
    avdmanager_candidates.push_back(tools.sdk_root / "tools" / "bin" / "avdmanager");

    for (const auto& candidate : avdmanager_candidates) {
        if (fs::is_regular_file(candidate, ec)) {
            tools.avdmanager = candidate;
            break;
        }
    }

    tools.emulator = tools.sdk_root / "emulator" / "emulator";
    tools.adb = tools.sdk_root / "platform-tools" / "adb";

    if (tools.avdmanager.empty() || !fs::is_regular_file(tools.emulator, ec) ||
        !fs::is_regular_file(tools.adb, ec)) {
        spdlog::warn("[Android] SDK at {} is missing avdmanager, emulator or adb", root);
        return std::nullopt;
    }

    spdlog::info("[Android] Using SDK at {}", root);
    return tools;
}

const AndroidDeviceManager::Tools& AndroidDeviceManager::tools() {
    std::lock_guard lock(tools_mutex_);
    if (!tools_) {
        tools_ = locate_tools();
    }
    if (!tools_) {
        throw DeviceError(ErrorKind::ToolNotFound, "Android SDK tools not found. Set ANDROID_HOME.");
    }
    return *tools_;
}

bool AndroidDeviceManager::is_available([[maybe_unused]] const CancellationToken& token) {
    std::lock_guard lock(tools_mutex_);
    if (!tools_) {
        tools_ = locate_tools();
    }
    return tools_.has_value();
}

CommandResult AndroidDeviceManager::run_tool(const fs::path& tool, std::vector<std::string> args,
                                             const CancellationToken& token, const std::string& stdin_data) {
    CommandSpec spec;
    spec.program = tool.string();
    spec.args = std::move(args);
    spec.stdin_data = stdin_data;
    spec.timeout = command_timeout_;
    return executor_.run(spec, token);
}

std::string AndroidDeviceManager::run_checked(const fs::path& tool, std::vector<std::string> args,
                                              const CancellationToken& token, const std::string& stdin_data) {
    const CommandResult result = run_tool(tool, std::move(args), token, stdin_data);
    if (!result.success()) {
        throw DeviceError(ErrorKind::CommandFailed, failure_message(result));
    }
    return result.stdout_text;
}

std::map<std::string, std::string> AndroidDeviceManager::running_emulators(const CancellationToken& token) {
    const auto& t = tools();

    const CommandResult devices = run_tool(t.adb, {"devices"}, token);
    if (!devices.success()) {
        spdlog::warn("[Android] adb devices failed: {}", failure_message(devices));
        return {};
    }

    std::map<std::string, std::string> running;
    for (const auto& serial : android::parse_adb_emulator_serials(devices.stdout_text)) {
        const CommandResult name = run_tool(t.adb, {"-s", serial, "emu", "avd", "name"}, token);
        if (!name.success()) continue;

        const std::string avd_name = first_line(name.stdout_text);
        if (!avd_name.empty() && avd_name != "OK") {
            running[avd_name] = serial;
        }
    }
    return running;
}

std::vector<android::AvdEntry> AndroidDeviceManager::list_avds(const CancellationToken& token) {
    return android::parse_avd_list(run_checked(tools().avdmanager, {"list", "avd"}, token));
}

android::AvdEntry AndroidDeviceManager::find_avd(const std::string& name, const CancellationToken& token) {
    for (auto& entry : list_avds(token)) {
        if (entry.name == name) {
            return entry;
        }
    }
    throw DeviceError(ErrorKind::DeviceNotFound, "Device '" + name + "' not found");
}

std::map<std::string, std::string> AndroidDeviceManager::read_config(const std::string& avd_path) {
    if (avd_path.empty()) return {};
    return android::parse_ini(read_file(fs::path(avd_path) / "config.ini"));
}

Device AndroidDeviceManager::to_device(const android::AvdEntry& entry,
                                       const std::map<std::string, std::string>& running) {
    const auto config = read_config(entry.path);

    AndroidAttributes attrs;
    attrs.api_level = android::parse_api_level(entry.target, config);
    attrs.android_version = android::android_version_name(attrs.api_level);
    attrs.device_profile = entry.device;
    attrs.abi = entry.abi;
    attrs.target = entry.target;
    attrs.path = entry.path;
    if (const auto it = config.find("hw.ramSize"); it != config.end()) {
        attrs.ram_mb = android::parse_size_mb(it->second);
    }
    if (const auto it = config.find("disk.dataPartition.size"); it != config.end()) {
        attrs.storage_mb = android::parse_size_mb(it->second);
    }

    Device device;
    device.platform = Platform::Android;
    device.identifier = entry.name;
    device.name = display_name(entry.name);
    if (const auto it = running.find(entry.name); it != running.end()) {
        attrs.serial = it->second;
        device.status = DeviceStatus::Running;
    } else {
        device.status = DeviceStatus::Stopped;
    }
    device.attributes = std::move(attrs);
    return device;
}

std::vector<Device> AndroidDeviceManager::list_devices(const CancellationToken& token) {
    const auto avds = list_avds(token);
    const auto running = running_emulators(token);

    std::vector<Device> devices;
    devices.reserve(avds.size());
    for (const auto& entry : avds) {
        devices.push_back(to_device(entry, running));
    }

    spdlog::debug("[Android] Listed {} AVD(s), {} running", devices.size(), running.size());
    return devices;
}

void AndroidDeviceManager::start_device(const std::string& identifier, const CancellationToken& token) {
    const auto entry = find_avd(identifier, token);
    if (running_emulators(token).contains(entry.name)) {
        spdlog::info("[Android] {} is already running", entry.name);
        return;
    }

    CommandSpec spec;
    spec.program = tools().emulator.string();
    spec.args = {"-avd", entry.name, "-no-boot-anim"};
    executor_.spawn_detached(spec);

    spdlog::info("[Android] Launched emulator for {}", entry.name);
}

void AndroidDeviceManager::stop_device(const std::string& identifier, const CancellationToken& token) {
    const auto running = running_emulators(token);
    const auto it = running.find(identifier);
    if (it == running.end()) {
        spdlog::info("[Android] {} is not running", identifier);
        return;
    }

    run_checked(tools().adb, {"-s", it->second, "emu", "kill"}, token);
    spdlog::info("[Android] Stopped {} ({})", identifier, it->second);
}

void AndroidDeviceManager::ensure_stopped(const std::string& name, const CancellationToken& token) {
    if (!running_emulators(token).contains(name)) return;

    stop_device(name, token);
    for (int attempt = 0; attempt < kStopPollAttempts; ++attempt) {
        if (!token.sleep_for(kStopPollInterval)) {
            throw TaskCancelled();
        }
        if (!running_emulators(token).contains(name)) return;
    }
    throw DeviceError(ErrorKind::CommandFailed, "Emulator '" + name + "' did not shut down");
}

void AndroidDeviceManager::create_device(const DeviceConfig& config, const CancellationToken& token) {
    const auto existing = list_avds(token);
    if (std::ranges::any_of(existing, [&](const auto& e) { return e.name == config.name; })) {
        throw DeviceError(ErrorKind::NameCollision, "Device '" + config.name + "' already exists");
    }
    if (config.version.empty()) {
        throw DeviceError(ErrorKind::InvalidConfiguration, "No system image selected");
    }

    std::vector<std::string> args = {"create", "avd", "-n", config.name, "-k", config.version};
    if (!config.device_type.empty()) {
        args.emplace_back("--device");
        args.push_back(config.device_type);
    }

    // avdmanager asks whether to create a custom hardware profile
    run_checked(tools().avdmanager, std::move(args), token, "no\n");

    const auto entry = find_avd(config.name, token);
    std::map<std::string, std::string> updates;
    if (config.ram_mb > 0) {
        updates["hw.ramSize"] = std::to_string(config.ram_mb);
    }
    if (config.storage_mb > 0) {
        updates["disk.dataPartition.size"] = std::to_string(config.storage_mb) + "M";
    }
    if (!updates.empty() && !entry.path.empty()) {
        update_config_file(fs::path(entry.path) / "config.ini", std::move(updates));
    }

    spdlog::info("[Android] Created {} ({})", config.name, config.version);
}

void AndroidDeviceManager::delete_device(const std::string& identifier, const CancellationToken& token) {
    const auto entry = find_avd(identifier, token);
    ensure_stopped(entry.name, token);
    run_checked(tools().avdmanager, {"delete", "avd", "-n", entry.name}, token);
    spdlog::info("[Android] Deleted {}", entry.name);
}

void AndroidDeviceManager::wipe_device(const std::string& identifier, const CancellationToken& token) {
    const auto entry = find_avd(identifier, token);
    if (entry.path.empty()) {
        throw DeviceError(ErrorKind::DeviceNotFound, "AVD directory for '" + identifier + "' not found");
    }
    ensure_stopped(entry.name, token);

    const fs::path dir(entry.path);
    std::error_code ec;
    for (const char* file : kUserDataFiles) {
        fs::remove(dir / file, ec);
        if (ec) {
            throw DeviceError(ErrorKind::CommandFailed, "Cannot remove " + (dir / file).string() + ": " + ec.message());
        }
    }
    fs::remove_all(dir / "snapshots", ec);
    if (ec) {
        throw DeviceError(ErrorKind::CommandFailed, "Cannot remove snapshots: " + ec.message());
    }

    spdlog::info("[Android] Wiped user data of {}", entry.name);
}

DeviceDetails AndroidDeviceManager::get_device_details(const std::string& identifier,
                                                       const CancellationToken& token) {
    const auto entry = find_avd(identifier, token);
    const auto running = running_emulators(token);
    const auto config = read_config(entry.path);
    const Device device = to_device(entry, running);
    const auto& attrs = std::get<AndroidAttributes>(device.attributes);

    auto config_value = [&config](const char* key) {
        const auto it = config.find(key);
        return it != config.end() ? it->second : std::string{};
    };

    DeviceDetails details;
    details.platform = Platform::Android;
    details.identifier = entry.name;
    details.name = device.name;
    details.status = to_string(device.status);
    details.version = "API " + std::to_string(attrs.api_level);
    if (!attrs.android_version.empty()) {
        details.version += " (Android " + attrs.android_version + ")";
    }
    details.device_type = entry.device;
    if (attrs.ram_mb > 0) details.ram = std::to_string(attrs.ram_mb) + " MB";
    if (attrs.storage_mb > 0) details.storage = std::to_string(attrs.storage_mb) + " MB";

    const std::string width = config_value("hw.lcd.width");
    const std::string height = config_value("hw.lcd.height");
    if (!width.empty() && !height.empty()) {
        details.resolution = width + "x" + height;
    }
    if (const std::string density = config_value("hw.lcd.density"); !density.empty()) {
        details.density = density + " dpi";
    }
    details.path = entry.path;
    details.system_image = config_value("image.sysdir.1");

    details.extra.emplace_back("ABI", entry.abi);
    details.extra.emplace_back("Target", entry.target);
    if (!attrs.serial.empty()) {
        details.extra.emplace_back("Serial", attrs.serial);
    }
    return details;
}

void AndroidDeviceManager::stream_logs(const std::string& identifier,
                                       const std::function<void(LogEntry)>& on_entry,
                                       const CancellationToken& token) {
    const auto running = running_emulators(token);
    const auto it = running.find(identifier);
    if (it == running.end()) {
        return;  // A stopped emulator has no log stream
    }

    CommandSpec spec;
    spec.program = tools().adb.string();
    spec.args = {"-s", it->second, "logcat", "-v", "time"};
    spec.timeout = std::chrono::milliseconds(0);

    const DeviceTag source{Platform::Android, identifier};
    executor_.stream(spec, [&](const std::string& line) {
        if (auto parsed = android::parse_logcat_line(line)) {
            on_entry(LogEntry{std::chrono::system_clock::now(), parsed->first, source, std::move(parsed->second)});
        }
    }, token);
}

std::vector<DeviceTypeOption> AndroidDeviceManager::list_device_types(const CancellationToken& token) {
    return android::parse_device_profiles(run_checked(tools().avdmanager, {"list", "device"}, token));
}

std::vector<VersionOption> AndroidDeviceManager::list_versions([[maybe_unused]] const CancellationToken& token) {
    struct Image {
        int api_level;
        VersionOption option;
    };
    std::vector<Image> images;

    std::error_code ec;
    const fs::path root = tools().sdk_root / "system-images";
    for (const auto& platform_dir : fs::directory_iterator(root, ec)) {
        const std::string platform_name = platform_dir.path().filename().string();
        if (platform_name.rfind("android-", 0) != 0) continue;

        const int api_level = android::parse_api_level("API level " + platform_name.substr(8), {});

        std::error_code tag_ec;
        for (const auto& tag_dir : fs::directory_iterator(platform_dir.path(), tag_ec)) {
            std::error_code abi_ec;
            for (const auto& abi_dir : fs::directory_iterator(tag_dir.path(), abi_ec)) {
                if (!abi_dir.is_directory(abi_ec)) continue;

                const std::string tag = tag_dir.path().filename().string();
                const std::string abi = abi_dir.path().filename().string();

                VersionOption option;
                option.id = "system-images;" + platform_name + ";" + tag + ";" + abi;
                option.display_name = "API " + std::to_string(api_level);
                if (const auto name = android::android_version_name(api_level); !name.empty()) {
                    option.display_name += " (Android " + name + ")";
                }
                option.display_name += " " + tag + " " + abi;
                images.push_back({api_level, std::move(option)});
            }
        }
    }

    std::ranges::sort(images, [](const Image& a, const Image& b) {
        if (a.api_level != b.api_level) return a.api_level > b.api_level;
        return a.option.id < b.option.id;
    });

    std::vector<VersionOption> versions;
    versions.reserve(images.size());
    for (auto& image : images) {
        versions.push_back(std::move(image.option));
    }
    return versions;
}

} // namespace emu
