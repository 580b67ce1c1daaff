#include "form_validation.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace emu {

namespace {

bool is_name_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

std::optional<std::string> validate_device_name(const std::string& name, const Platform platform) {
    if (name.empty()) {
        return "Device name cannot be empty";
    }
    if (name.length() > kMaxDeviceNameLength) {
        return "Device name must be " + std::to_string(kMaxDeviceNameLength) + " characters or less";
    }
    if (!std::ranges::all_of(name, is_name_char)) {
        return "Device name can only contain letters, numbers, dots, dashes, and underscores";
    }
    if (platform == Platform::Android && (name.front() == '.' || name.front() == '-')) {
        return "Device name cannot start with a dot or dash";
    }
    return std::nullopt;
}

std::optional<std::string> validate_numeric_range(const std::string& value, const int min, const int max,
                                                  const std::string& unit) {
    int parsed = 0;
    const auto* begin = value.data();
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (value.empty() || ec != std::errc() || ptr != end) {
        return "Please enter a valid number";
    }
    if (parsed < min) {
        return "Value must be at least " + std::to_string(min) + " " + unit;
    }
    if (parsed > max) {
        return "Value must be at most " + std::to_string(max) + " " + unit;
    }
    return std::nullopt;
}

std::optional<std::string> validate_required_selection(const bool has_selection, const std::string& field_name) {
    if (!has_selection) {
        return "Please select a " + field_name;
    }
    return std::nullopt;
}

std::string infer_device_category(const std::string& id, const std::string& display_name) {
    std::string combined = id + " " + display_name;
    std::ranges::transform(combined, combined.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (contains(combined, "wear") || contains(combined, "watch") ||
        contains(combined, "round") || contains(combined, "square")) {
        return "wear";
    }
    if (contains(combined, "automotive") || contains(combined, " car") || contains(combined, "_car")) {
        return "automotive";
    }
    if (contains(combined, "tv") || contains(combined, "1080p") ||
        contains(combined, "4k") || contains(combined, "720p")) {
        return "tv";
    }
    if (contains(combined, "desktop")) {
        return "desktop";
    }
    if (contains(combined, "tablet") || contains(combined, "ipad") || contains(combined, "pixel_c") ||
        contains(combined, "nexus_9") || contains(combined, "nexus 9") || contains(combined, "pad")) {
        return "tablet";
    }
    return "phone";
}

} // namespace emu
