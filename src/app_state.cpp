#include "app_state.hpp"
#include <algorithm>
#include <iterator>

namespace emu {

size_t wrap_index(const long long index, const size_t length) {
    if (length == 0) return 0;
    const auto len = static_cast<long long>(length);
    long long result = index % len;
    if (result < 0) {
        result += len;
    }
    return static_cast<size_t>(result);
}

const char* to_string(const OperationKind kind) {
    switch (kind) {
        case OperationKind::Start: return "Starting";
        case OperationKind::Stop: return "Stopping";
        case OperationKind::Create: return "Creating";
        case OperationKind::Delete: return "Deleting";
        case OperationKind::Wipe: return "Wiping";
    }
    return "?";
}

const char* to_string(const LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "?";
}

AppState::AppState(const StateLimits limits)
    : limits_(limits) {}

AppState::FamilyState& AppState::family(const Platform platform) {
    return platform == Platform::Android ? android_ : ios_;
}

const AppState::FamilyState& AppState::family(const Platform platform) const {
    return platform == Platform::Android ? android_ : ios_;
}

const std::vector<Device>& AppState::devices(const Platform platform) const {
    return family(platform).devices;
}

size_t AppState::selected_index(const Platform platform) const {
    return family(platform).selected;
}

const Device* AppState::selected_device() const {
    const auto& fam = family(focus_);
    if (fam.devices.empty()) return nullptr;
    return &fam.devices[std::min(fam.selected, fam.devices.size() - 1)];
}

std::optional<DeviceTag> AppState::selected_tag() const {
    if (const Device* device = selected_device()) {
        return device->tag();
    }
    return std::nullopt;
}

const Device* AppState::find_device(const DeviceTag& tag) const {
    const auto& list = family(tag.platform).devices;
    const auto it = std::ranges::find(list, tag.identifier, &Device::identifier);
    return it != list.end() ? &*it : nullptr;
}

Device* AppState::find_device_mutable(const DeviceTag& tag) {
    auto& list = family(tag.platform).devices;
    const auto it = std::ranges::find(list, tag.identifier, &Device::identifier);
    return it != list.end() ? &*it : nullptr;
}

bool AppState::select_next() {
    return move_by(1);
}

bool AppState::select_previous() {
    return move_by(-1);
}

bool AppState::move_by(const int steps) {
    auto& fam = family(focus_);
    if (fam.devices.empty()) return false;

    const auto before = selected_tag();
    fam.selected = wrap_index(static_cast<long long>(fam.selected) + steps, fam.devices.size());

    reconcile_cache();
    return selected_tag() != before;
}

bool AppState::select_first() {
    return select_index(focus_, 0);
}

bool AppState::select_last() {
    const auto& fam = family(focus_);
    if (fam.devices.empty()) return false;
    return select_index(focus_, fam.devices.size() - 1);
}

bool AppState::select_index(const Platform platform, const size_t index) {
    auto& fam = family(platform);
    if (fam.devices.empty()) return false;

    const auto before = selected_tag();
    fam.selected = std::min(index, fam.devices.size() - 1);

    reconcile_cache();
    return selected_tag() != before;
}

void AppState::switch_focus() {
    set_focus(focus_ == Platform::Android ? Platform::Ios : Platform::Android);
}

void AppState::set_focus(const Platform platform) {
    focus_ = platform;
    reconcile_cache();
}

void AppState::update_device_list(const Platform platform, std::vector<Device> devices,
                                  const Clock::time_point now) {
    auto& fam = family(platform);

    std::optional<std::string> previous_id;
    if (fam.selected < fam.devices.size()) {
        previous_id = fam.devices[fam.selected].identifier;
    }
    const size_t previous_index = fam.selected;

    // A pending start/stop keeps its transitional status until the backend reports the target state
    for (auto& device : devices) {
        const auto it = pending_operations_.find(device.tag());
        if (it == pending_operations_.end()) continue;

        if (it->second.kind == OperationKind::Start && device.status != DeviceStatus::Running) {
            device.status = DeviceStatus::Starting;
        } else if (it->second.kind == OperationKind::Stop && device.status != DeviceStatus::Stopped) {
            device.status = DeviceStatus::Stopping;
        }
    }

    fam.devices = std::move(devices);
    fam.loading = false;
    last_refresh_ = now;

    if (fam.devices.empty()) {
        fam.selected = 0;
    } else {
        const auto it = previous_id
            ? std::ranges::find(fam.devices, *previous_id, &Device::identifier)
            : fam.devices.end();
        if (it != fam.devices.end()) {
            fam.selected = static_cast<size_t>(std::distance(fam.devices.begin(), it));
        } else {
            fam.selected = std::min(previous_index, fam.devices.size() - 1);
        }
    }

    reconcile_cache();
}

void AppState::set_device_status(const DeviceTag& tag, const DeviceStatus status) {
    if (Device* device = find_device_mutable(tag)) {
        device->status = status;
        if (status != DeviceStatus::Error) {
            device->status_message.clear();
        }
    }
}

void AppState::mark_device_error(const DeviceTag& tag, const std::string& message) {
    if (Device* device = find_device_mutable(tag)) {
        device->status = DeviceStatus::Error;
        device->status_message = message;
    }
}

void AppState::set_loading(const Platform platform, const bool loading) {
    family(platform).loading = loading;
}

bool AppState::is_loading(const Platform platform) const {
    return family(platform).loading;
}

void AppState::set_backend_available(const Platform platform, const bool available) {
    family(platform).available = available;
}

bool AppState::is_backend_available(const Platform platform) const {
    return family(platform).available;
}

bool AppState::set_cached_detail(const DeviceTag& tag, DeviceDetails details,
                                 const Clock::time_point now) {
    if (selected_tag() != tag) {
        return false;
    }
    cached_detail_ = CachedDetail{tag, std::move(details), now};
    return true;
}

const DeviceDetails* AppState::cached_detail(const Clock::time_point now) const {
    if (!cached_detail_ || selected_tag() != cached_detail_->tag) {
        return nullptr;
    }
    if (now - cached_detail_->fetched_at > limits_.detail_cache_ttl) {
        return nullptr;
    }
    return &cached_detail_->details;
}

void AppState::invalidate_cached_detail() {
    cached_detail_.reset();
}

void AppState::reconcile_cache() {
    if (cached_detail_ && selected_tag() != cached_detail_->tag) {
        cached_detail_.reset();
    }
}

void AppState::set_operation_pending(const DeviceTag& tag, const OperationKind kind,
                                     const std::string& device_name,
                                     const Clock::time_point now) {
    pending_operations_[tag] = PendingOperation{tag, kind, device_name, now};
}

bool AppState::try_begin_operation(const DeviceTag& tag, const OperationKind kind,
                                   const std::string& device_name,
                                   const Clock::time_point now) {
    if (pending_operations_.contains(tag)) {
        return false;
    }
    set_operation_pending(tag, kind, device_name, now);
    return true;
}

void AppState::clear_operation_pending(const DeviceTag& tag) {
    pending_operations_.erase(tag);
}

bool AppState::is_operation_pending(const DeviceTag& tag) const {
    return pending_operations_.contains(tag);
}

const PendingOperation* AppState::latest_pending_operation() const {
    const PendingOperation* latest = nullptr;
    for (const auto& [tag, op] : pending_operations_) {
        if (!latest || op.started_at >= latest->started_at) {
            latest = &op;
        }
    }
    return latest;
}

void AppState::begin_log_stream(const std::optional<DeviceTag>& device) {
    if (log_panel_.stream_device != device) {
        log_panel_.entries.clear();
        log_panel_.scroll_from_bottom = 0;
        log_panel_.auto_scroll = true;
    }
    log_panel_.stream_device = device;
}

bool AppState::passes_filter(const LogEntry& entry) const {
    return !log_panel_.filter || entry.level == *log_panel_.filter;
}

size_t AppState::filtered_count() const {
    if (!log_panel_.filter) return log_panel_.entries.size();
    return static_cast<size_t>(std::ranges::count_if(log_panel_.entries, [this](const LogEntry& e) {
        return passes_filter(e);
    }));
}

bool AppState::push_log(LogEntry entry) {
    if (!log_panel_.stream_device || entry.source != *log_panel_.stream_device) {
        return false;
    }

    const bool visible = passes_filter(entry);
    log_panel_.entries.push_back(std::move(entry));
    while (log_panel_.entries.size() > limits_.max_log_entries) {
        log_panel_.entries.pop_front();
    }

    // Keep a scrolled-back view anchored on the same lines
    if (!log_panel_.auto_scroll) {
        if (visible) {
            log_panel_.scroll_from_bottom++;
        }
        const size_t count = filtered_count();
        log_panel_.scroll_from_bottom = std::min(log_panel_.scroll_from_bottom,
                                                 count > 0 ? count - 1 : 0);
    }
    return true;
}

void AppState::clear_logs() {
    log_panel_.entries.clear();
    log_panel_.scroll_from_bottom = 0;
    log_panel_.auto_scroll = true;
}

void AppState::cycle_log_filter() {
    auto& filter = log_panel_.filter;
    if (!filter) {
        filter = LogLevel::Error;
    } else {
        switch (*filter) {
            case LogLevel::Error: filter = LogLevel::Warn; break;
            case LogLevel::Warn: filter = LogLevel::Info; break;
            case LogLevel::Info: filter = LogLevel::Debug; break;
            case LogLevel::Debug: filter.reset(); break;
        }
    }
    scroll_logs_to_bottom();
}

void AppState::scroll_logs_up(const size_t lines) {
    const size_t count = filtered_count();
    const size_t max_offset = count > 0 ? count - 1 : 0;
    log_panel_.scroll_from_bottom = std::min(max_offset, log_panel_.scroll_from_bottom + lines);
    log_panel_.auto_scroll = log_panel_.scroll_from_bottom == 0;
}

void AppState::scroll_logs_down(const size_t lines) {
    log_panel_.scroll_from_bottom = lines >= log_panel_.scroll_from_bottom
        ? 0
        : log_panel_.scroll_from_bottom - lines;
    log_panel_.auto_scroll = log_panel_.scroll_from_bottom == 0;
}

void AppState::scroll_logs_to_top() {
    const size_t count = filtered_count();
    log_panel_.scroll_from_bottom = count > 0 ? count - 1 : 0;
    log_panel_.auto_scroll = log_panel_.scroll_from_bottom == 0;
}

void AppState::scroll_logs_to_bottom() {
    log_panel_.scroll_from_bottom = 0;
    log_panel_.auto_scroll = true;
}

std::vector<const LogEntry*> AppState::filtered_logs() const {
    std::vector<const LogEntry*> result;
    result.reserve(log_panel_.entries.size());
    for (const auto& entry : log_panel_.entries) {
        if (passes_filter(entry)) {
            result.push_back(&entry);
        }
    }
    return result;
}

void AppState::push_notification(const NotificationLevel level, std::string message,
                                 const std::optional<std::chrono::milliseconds> ttl,
                                 const Clock::time_point now) {
    notifications_.push_back(Notification{
        level, std::move(message), now, now + ttl.value_or(limits_.notification_ttl)});
    while (notifications_.size() > limits_.max_notifications) {
        notifications_.pop_front();
    }
}

void AppState::prune_expired_notifications(const Clock::time_point now) {
    std::erase_if(notifications_, [now](const Notification& n) {
        return n.expires_at <= now;
    });
}

std::vector<Notification> AppState::visible_notifications(const Clock::time_point now) const {
    std::vector<Notification> visible;
    std::ranges::copy_if(notifications_, std::back_inserter(visible), [now](const Notification& n) {
        return n.expires_at > now;
    });
    return visible;
}

void AppState::dismiss_all_notifications() {
    notifications_.clear();
}

} // namespace emu
