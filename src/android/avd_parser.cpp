#include "avd_parser.hpp"
#include "../form_validation.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>

namespace emu::android {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Value after "Key:" on a trimmed line
std::string value_after(const std::string& line, const std::string& key) {
    return trim(line.substr(key.length()));
}

int to_int(const std::string& s) {
    int value = 0;
    std::from_chars(s.data(), s.data() + s.size(), value);
    return value;
}

} // namespace

std::vector<AvdEntry> parse_avd_list(const std::string& output) {
    std::vector<AvdEntry> entries;
    std::optional<AvdEntry> current;

    auto flush = [&] {
        if (current && !current->name.empty()) {
            entries.push_back(std::move(*current));
        }
        current.reset();
    };

    std::istringstream stream(output);
    std::string raw;
    while (std::getline(stream, raw)) {
        const std::string line = trim(raw);

        if (line.empty() || starts_with(line, "---")) {
            flush();
            continue;
        }

        if (starts_with(line, "Name:")) {
            flush();
            current = AvdEntry{};
            current->name = value_after(line, "Name:");
            continue;
        }
        if (!current) continue;

        if (starts_with(line, "Device:")) {
            // "pixel_7 (Google)"
            std::string device = value_after(line, "Device:");
            current->device = device.substr(0, device.find(' '));
        } else if (starts_with(line, "Path:")) {
            current->path = value_after(line, "Path:");
        } else if (starts_with(line, "Target:")) {
            current->target = value_after(line, "Target:");
        } else if (starts_with(line, "Based on:")) {
            std::string based_on = value_after(line, "Based on:");
            if (const auto abi_pos = based_on.find("Tag/ABI:"); abi_pos != std::string::npos) {
                current->abi = trim(based_on.substr(abi_pos + 8));
                based_on = trim(based_on.substr(0, abi_pos));
            }
            current->target += current->target.empty() ? based_on : " " + based_on;
        } else if (starts_with(line, "Tag/ABI:")) {
            current->abi = value_after(line, "Tag/ABI:");
        } else if (starts_with(line, "ABI:")) {
            current->abi = value_after(line, "ABI:");
        }
    }
    flush();

    return entries;
}

std::map<std::string, std::string> parse_ini(const std::string& text) {
    std::map<std::string, std::string> values;
    std::istringstream stream(text);
    std::string raw;
    while (std::getline(stream, raw)) {
        const std::string line = trim(raw);
        if (line.empty() || line.front() == '#') continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        values[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return values;
}

int parse_api_level(const std::string& target, const std::map<std::string, std::string>& config) {
    static const std::regex api_level_re(R"(API level (\d+))");
    static const std::regex android_version_re(R"(Android (\d+)(?:\.(\d+))?)");
    static const std::regex sysdir_re(R"(android-(\d+))");

    std::smatch match;
    if (std::regex_search(target, match, api_level_re)) {
        return to_int(match[1].str());
    }

    if (std::regex_search(target, match, android_version_re)) {
        const int major = to_int(match[1].str());
        const int minor = match[2].matched ? to_int(match[2].str()) : 0;
        switch (major) {
            case 16: return 36;
            case 15: return 35;
            case 14: return 34;
            case 13: return 33;
            case 12: return 31;
            case 11: return 30;
            case 10: return 29;
            case 9: return 28;
            case 8: return minor >= 1 ? 27 : 26;
            case 7: return minor >= 1 ? 25 : 24;
            case 6: return 23;
            case 5: return minor >= 1 ? 22 : 21;
            default: break;
        }
    }

    if (const auto it = config.find("image.sysdir.1"); it != config.end()) {
        if (std::regex_search(it->second, match, sysdir_re)) {
            return to_int(match[1].str());
        }
    }
    return 0;
}

std::string android_version_name(const int api_level) {
    switch (api_level) {
        case 36: return "16";
        case 35: return "15";
        case 34: return "14";
        case 33: return "13";
        case 32: return "12L";
        case 31: return "12";
        case 30: return "11";
        case 29: return "10";
        case 28: return "9";
        case 27: return "8.1";
        case 26: return "8.0";
        case 25: return "7.1";
        case 24: return "7.0";
        case 23: return "6.0";
        case 22: return "5.1";
        case 21: return "5.0";
        default: return {};
    }
}

std::vector<std::string> parse_adb_emulator_serials(const std::string& output) {
    std::vector<std::string> serials;
    std::istringstream stream(output);
    std::string raw;
    while (std::getline(stream, raw)) {
        std::istringstream fields(raw);
        std::string serial;
        std::string state;
        fields >> serial >> state;
        if (starts_with(serial, "emulator-") && state == "device") {
            serials.push_back(serial);
        }
    }
    return serials;
}

std::vector<DeviceTypeOption> parse_device_profiles(const std::string& output) {
    static const std::regex id_re(R"re(id:\s*\d+\s+or\s+"([^"]+)")re");

    std::vector<DeviceTypeOption> profiles;
    std::istringstream stream(output);
    std::string raw;
    while (std::getline(stream, raw)) {
        const std::string line = trim(raw);

        std::smatch match;
        if (std::regex_search(line, match, id_re)) {
            DeviceTypeOption option;
            option.id = match[1].str();
            option.display_name = option.id;
            profiles.push_back(std::move(option));
        } else if (starts_with(line, "Name:") && !profiles.empty()) {
            profiles.back().display_name = value_after(line, "Name:");
        }
    }

    for (auto& profile : profiles) {
        profile.category = infer_device_category(profile.id, profile.display_name);
    }
    return profiles;
}

int parse_size_mb(const std::string& value) {
    const std::string text = trim(value);
    if (text.empty()) return 0;

    long long number = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (ec != std::errc() || number < 0) return 0;

    std::string suffix(ptr, text.data() + text.size());
    std::ranges::transform(suffix, suffix.begin(), [](const unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    if (suffix.empty()) {
        // Plain numbers above 1 MiB are byte counts
        return number > 1024 * 1024 ? static_cast<int>(number / (1024 * 1024)) : static_cast<int>(number);
    }
    if (suffix == "M" || suffix == "MB") return static_cast<int>(number);
    if (suffix == "G" || suffix == "GB") return static_cast<int>(number * 1024);
    if (suffix == "K" || suffix == "KB") return static_cast<int>(number / 1024);
    return 0;
}

std::optional<std::pair<LogLevel, std::string>> parse_logcat_line(const std::string& line) {
    // Skip "--------- beginning of main" and blank lines
    if (line.empty() || starts_with(line, "---------")) {
        return std::nullopt;
    }

    // Priority letter follows the second space-separated field (date, time)
    const auto first_space = line.find(' ');
    const auto second_space = first_space == std::string::npos ? first_space : line.find(' ', first_space + 1);
    if (second_space == std::string::npos || second_space + 2 >= line.size() || line[second_space + 2] != '/') {
        return std::make_pair(LogLevel::Info, line);
    }

    LogLevel level = LogLevel::Info;
    switch (line[second_space + 1]) {
        case 'V':
        case 'D':
            level = LogLevel::Debug;
            break;
        case 'I':
            level = LogLevel::Info;
            break;
        case 'W':
            level = LogLevel::Warn;
            break;
        case 'E':
        case 'F':
        case 'A':
            level = LogLevel::Error;
            break;
        default:
            return std::make_pair(LogLevel::Info, line);
    }
    return std::make_pair(level, line.substr(second_space + 3));
}

} // namespace emu::android
