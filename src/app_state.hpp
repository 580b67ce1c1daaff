#pragma once

#include "device.hpp"
#include "viewmodels/confirm_dialog_view_model.hpp"
#include "viewmodels/create_form_view_model.hpp"
#include "viewmodels/log_panel_view_model.hpp"
#include "viewmodels/notification_view_model.hpp"
#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace emu {

// Interaction modes of the navigation state machine
enum class Mode {
    Browsing,
    CreateForm,
    ConfirmPending,
    FullscreenLog,
    Help
};

enum class OperationKind {
    Start,
    Stop,
    Create,
    Delete,
    Wipe
};

struct PendingOperation {
    DeviceTag device;
    OperationKind kind = OperationKind::Start;
    std::string device_name;
    std::chrono::steady_clock::time_point started_at;
};

struct CachedDetail {
    DeviceTag tag;
    DeviceDetails details;
    std::chrono::steady_clock::time_point fetched_at;
};

struct StateLimits {
    size_t max_log_entries = 1000;
    size_t max_notifications = 10;
    std::chrono::milliseconds detail_cache_ttl{30000};
    std::chrono::milliseconds notification_ttl{5000};
};

// Single source of truth for everything the renderer shows.
// Not synchronized on its own; always accessed through SharedState.
// Every operation is total: out-of-range indices are clamped and operations
// on empty lists are no-ops.
class AppState {
public:
    using Clock = std::chrono::steady_clock;

    explicit AppState(StateLimits limits = {});

    // Device lists and selection
    [[nodiscard]] const std::vector<Device>& devices(Platform platform) const;
    [[nodiscard]] size_t selected_index(Platform platform) const;
    [[nodiscard]] Platform focus() const { return focus_; }
    [[nodiscard]] const Device* selected_device() const;
    [[nodiscard]] std::optional<DeviceTag> selected_tag() const;
    [[nodiscard]] const Device* find_device(const DeviceTag& tag) const;

    // Each returns true when the selected device changed
    bool select_next();
    bool select_previous();
    bool move_by(int steps);
    bool select_first();
    bool select_last();
    bool select_index(Platform platform, size_t index);

    void switch_focus();
    void set_focus(Platform platform);

    void update_device_list(Platform platform, std::vector<Device> devices,
                            Clock::time_point now = Clock::now());
    void set_device_status(const DeviceTag& tag, DeviceStatus status);
    void mark_device_error(const DeviceTag& tag, const std::string& message);

    void set_loading(Platform platform, bool loading);
    [[nodiscard]] bool is_loading(Platform platform) const;
    void set_backend_available(Platform platform, bool available);
    [[nodiscard]] bool is_backend_available(Platform platform) const;
    [[nodiscard]] std::optional<Clock::time_point> last_refresh() const { return last_refresh_; }

    // Detail cache
    // Stores the result only when the tag matches the current selection
    bool set_cached_detail(const DeviceTag& tag, DeviceDetails details,
                           Clock::time_point now = Clock::now());
    // Returns null on a miss (no entry, tag mismatch, or stale entry)
    [[nodiscard]] const DeviceDetails* cached_detail(Clock::time_point now = Clock::now()) const;
    [[nodiscard]] const std::optional<CachedDetail>& cache_entry() const { return cached_detail_; }
    void invalidate_cached_detail();

    // Pending operations
    void set_operation_pending(const DeviceTag& tag, OperationKind kind,
                               const std::string& device_name,
                               Clock::time_point now = Clock::now());
    // Check-and-set: false when an operation is already in flight for the device
    bool try_begin_operation(const DeviceTag& tag, OperationKind kind,
                             const std::string& device_name,
                             Clock::time_point now = Clock::now());
    void clear_operation_pending(const DeviceTag& tag);
    [[nodiscard]] bool is_operation_pending(const DeviceTag& tag) const;
    [[nodiscard]] bool has_pending_operations() const { return !pending_operations_.empty(); }
    [[nodiscard]] const PendingOperation* latest_pending_operation() const;

    // Device logs
    void begin_log_stream(const std::optional<DeviceTag>& device);
    bool push_log(LogEntry entry);
    void clear_logs();
    void cycle_log_filter();
    void scroll_logs_up(size_t lines);
    void scroll_logs_down(size_t lines);
    void scroll_logs_to_top();
    void scroll_logs_to_bottom();
    [[nodiscard]] std::vector<const LogEntry*> filtered_logs() const;
    [[nodiscard]] const LogPanelViewModel& log_panel() const { return log_panel_; }

    // Notifications
    void push_notification(NotificationLevel level, std::string message,
                           std::optional<std::chrono::milliseconds> ttl = std::nullopt,
                           Clock::time_point now = Clock::now());
    void prune_expired_notifications(Clock::time_point now = Clock::now());
    void dismiss_all_notifications();
    [[nodiscard]] const std::deque<Notification>& notifications() const { return notifications_; }
    // Unexpired notifications, oldest first; expired ones linger in storage until the next prune
    [[nodiscard]] std::vector<Notification> visible_notifications(Clock::time_point now = Clock::now()) const;

    // Modal state
    [[nodiscard]] Mode mode() const { return mode_; }
    void set_mode(Mode mode) { mode_ = mode; }
    [[nodiscard]] CreateFormViewModel& create_form() { return create_form_; }
    [[nodiscard]] const CreateFormViewModel& create_form() const { return create_form_; }
    [[nodiscard]] ConfirmDialogViewModel& confirm_dialog() { return confirm_dialog_; }
    [[nodiscard]] const ConfirmDialogViewModel& confirm_dialog() const { return confirm_dialog_; }

    [[nodiscard]] const StateLimits& limits() const { return limits_; }

private:
    struct FamilyState {
        std::vector<Device> devices;
        size_t selected = 0;
        bool loading = false;
        bool available = true;
    };

    [[nodiscard]] FamilyState& family(Platform platform);
    [[nodiscard]] const FamilyState& family(Platform platform) const;
    [[nodiscard]] Device* find_device_mutable(const DeviceTag& tag);
    [[nodiscard]] bool passes_filter(const LogEntry& entry) const;
    [[nodiscard]] size_t filtered_count() const;

    // Drops the cached detail if it no longer matches the selection
    void reconcile_cache();

    StateLimits limits_;

    FamilyState android_;
    FamilyState ios_;
    Platform focus_ = Platform::Android;
    std::optional<Clock::time_point> last_refresh_;

    std::optional<CachedDetail> cached_detail_;

    std::map<DeviceTag, PendingOperation> pending_operations_;

    LogPanelViewModel log_panel_;
    std::deque<Notification> notifications_;

    Mode mode_ = Mode::Browsing;
    CreateFormViewModel create_form_;
    ConfirmDialogViewModel confirm_dialog_;
};

// Euclidean modulo used by every circular navigation
[[nodiscard]] size_t wrap_index(long long index, size_t length);

const char* to_string(OperationKind kind);

} // namespace emu
