#include "app_controller.hpp"
#include "create_device_form.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace emu {

namespace {

TaskSlot refresh_slot(const Platform platform) {
    return platform == Platform::Android ? TaskSlot::AndroidRefresh : TaskSlot::IosRefresh;
}

// Clears a device's pending-operation flag when the operation task unwinds
class PendingOperationGuard {
public:
    PendingOperationGuard(SharedState& state, DeviceTag tag)
        : state_(state), tag_(std::move(tag)) {}

    ~PendingOperationGuard() {
        state_.write([this](AppState& s) { s.clear_operation_pending(tag_); });
    }

    PendingOperationGuard(const PendingOperationGuard&) = delete;
    PendingOperationGuard& operator=(const PendingOperationGuard&) = delete;

private:
    SharedState& state_;
    DeviceTag tag_;
};

} // namespace

AppController::AppController(SharedState& state, TaskCoordinator& tasks,
                             IDeviceManager& android, IDeviceManager& ios,
                             const AppConfig& config)
    : state_(state)
    , tasks_(tasks)
    , android_(android)
    , ios_(ios)
    , config_(config) {}

AppController::~AppController() {
    // Task bodies capture this; none may outlive the controller
    tasks_.cancel_all();
}

IDeviceManager& AppController::manager(const Platform platform) {
    return platform == Platform::Android ? android_ : ios_;
}

void AppController::start() {
    tasks_.set_error_handler([this](const std::string& task, const std::string& message) {
        spdlog::debug("[Controller] Reporting failure of {}", task);
        state_.write([&](AppState& s) {
            s.push_notification(NotificationLevel::Error, message);
        });
    });

    last_focus_ = state_.read([](const AppState& s) { return s.focus(); });
    last_auto_refresh_ = Clock::now();
    refresh_all();
}

void AppController::dispatch(const Action& action) {
    switch (action.type) {
        case ActionType::Quit:
            quit_requested_ = true;
            break;
        case ActionType::Refresh:
            refresh_all();
            break;
        case ActionType::SelectionChanged:
            on_focus_settled();
            on_selection_changed();
            break;
        case ActionType::ToggleDevice:
            if (action.device) toggle_device(*action.device);
            break;
        case ActionType::OpenCreateForm:
            load_form_options();
            break;
        case ActionType::SubmitCreate:
            if (action.config) submit_create(*action.config);
            break;
        case ActionType::DeleteDevice:
            if (action.device) delete_device(*action.device);
            break;
        case ActionType::WipeDevice:
            if (action.device) wipe_device(*action.device);
            break;
    }
}

void AppController::tick(const Clock::time_point now) {
    const bool pending = state_.read([](const AppState& s) { return s.has_pending_operations(); });
    const auto interval = pending ? config_.pending_refresh_interval : config_.auto_refresh_interval;
    if (now - last_auto_refresh_ < interval) return;
    last_auto_refresh_ = now;

    for (const Platform platform : {Platform::Android, Platform::Ios}) {
        const bool available = state_.read([platform](const AppState& s) {
            return s.is_backend_available(platform);
        });
        // Unavailable families are retried on manual refresh only
        if (available && !tasks_.is_active(refresh_slot(platform))) {
            refresh(platform);
        }
    }
}

void AppController::refresh_all() {
    refresh(Platform::Android);
    refresh(Platform::Ios);
}

void AppController::refresh(const Platform platform) {
    state_.write([platform](AppState& s) { s.set_loading(platform, true); });
    tasks_.spawn(refresh_slot(platform), [this, platform](const CancellationToken& token) {
        run_refresh(platform, token);
    });
}

void AppController::run_refresh(const Platform platform, const CancellationToken& token) {
    IDeviceManager& backend = manager(platform);

    std::vector<Device> devices;
    try {
        if (!backend.is_available(token)) {
            token.throw_if_cancelled();
            spdlog::info("[Controller] {} tools are not available", to_string(platform));
            state_.write([platform](AppState& s) {
                s.set_backend_available(platform, false);
                s.set_loading(platform, false);
            });
            return;
        }
        devices = backend.list_devices(token);
    } catch (const std::exception&) {
        // A superseded refresh leaves the flag to its replacement
        if (!token.is_cancelled()) {
            state_.write([platform](AppState& s) { s.set_loading(platform, false); });
        }
        throw;
    }

    if (token.is_cancelled()) return;

    struct Outcome {
        bool focused = false;
        bool selection_changed = false;
        std::optional<DeviceTag> selected;
        bool has_detail = false;
    };

    const Outcome outcome = state_.write([&](AppState& s) {
        Outcome o;
        const auto before = s.selected_tag();
        s.set_backend_available(platform, true);
        s.update_device_list(platform, std::move(devices));
        o.focused = s.focus() == platform;
        o.selected = s.selected_tag();
        o.selection_changed = o.selected != before;
        o.has_detail = s.cached_detail() != nullptr;
        return o;
    });

    if (!outcome.focused) return;
    if (outcome.selection_changed) {
        on_selection_changed();
    } else if (outcome.selected && !outcome.has_detail && !tasks_.is_active(TaskSlot::DeviceDetails)) {
        schedule_details(*outcome.selected);
    }
}

void AppController::on_focus_settled() {
    const Platform focus = state_.read([](const AppState& s) { return s.focus(); });
    if (focus == last_focus_) return;
    last_focus_ = focus;

    // Panel switch: refresh the newly focused list once navigation settles
    tasks_.spawn_after(TaskSlot::NavigationRefresh, config_.navigation_debounce,
                       [this, focus](const CancellationToken&) {
        if (!tasks_.is_active(refresh_slot(focus))) {
            refresh(focus);
        }
    });
}

void AppController::on_selection_changed() {
    struct Selection {
        std::optional<DeviceTag> tag;
        bool cached = false;
    };

    const Selection selection = state_.write([](AppState& s) {
        Selection sel;
        sel.tag = s.selected_tag();
        sel.cached = s.cached_detail() != nullptr;
        s.begin_log_stream(sel.tag);
        return sel;
    });

    if (!selection.tag) {
        tasks_.cancel(TaskSlot::DeviceDetails);
        tasks_.cancel(TaskSlot::LogStream);
        return;
    }

    if (selection.cached) {
        tasks_.cancel(TaskSlot::DeviceDetails);
    } else {
        schedule_details(*selection.tag);
    }

    const DeviceTag tag = *selection.tag;
    tasks_.spawn_after(TaskSlot::LogStream, config_.log_debounce, [this, tag](const CancellationToken& token) {
        stream_logs(tag, token);
    });
}

void AppController::schedule_details(const DeviceTag& tag) {
    tasks_.spawn_after(TaskSlot::DeviceDetails, config_.detail_debounce, [this, tag](const CancellationToken& token) {
        fetch_details(tag, token);
    });
}

void AppController::fetch_details(const DeviceTag& tag, const CancellationToken& token) {
    DeviceDetails details = manager(tag.platform).get_device_details(tag.identifier, token);
    if (token.is_cancelled()) return;

    const bool stored = state_.write([&](AppState& s) {
        return s.set_cached_detail(tag, std::move(details));
    });
    if (!stored) {
        spdlog::trace("[Controller] Dropped details for {}: selection moved on", tag.identifier);
    }
}

void AppController::stream_logs(const DeviceTag& tag, const CancellationToken& token) {
    manager(tag.platform).stream_logs(tag.identifier, [this, &token](LogEntry entry) {
        if (token.is_cancelled()) return;
        state_.write([&](AppState& s) { s.push_log(std::move(entry)); });
    }, token);
}

void AppController::run_operation(const DeviceTag& tag, const OperationKind kind, OperationFn operation,
                                  std::string success_message) {
    std::string device_name;
    const bool began = state_.write([&](AppState& s) {
        const Device* device = s.find_device(tag);
        device_name = device ? device->name : tag.identifier;

        if (!s.try_begin_operation(tag, kind, device_name)) {
            s.push_notification(NotificationLevel::Warning, "Operation already in progress for " + device_name);
            return false;
        }
        if (kind == OperationKind::Start) {
            s.set_device_status(tag, DeviceStatus::Starting);
        } else if (kind == OperationKind::Stop) {
            s.set_device_status(tag, DeviceStatus::Stopping);
        }
        return true;
    });
    if (!began) return;

    spdlog::info("[Controller] {} {}", to_string(kind), device_name);

    const std::string task_name = std::string(to_string(kind)) + " " + device_name;
    tasks_.spawn_detached(task_name, [this, tag, kind, device_name, operation = std::move(operation),
                                      success_message = std::move(success_message)](const CancellationToken& token) {
        {
            PendingOperationGuard guard(state_, tag);
            try {
                operation(manager(tag.platform), token);
            } catch (const DeviceError& e) {
                if (token.is_cancelled()) return;
                const std::string message = e.user_message();
                spdlog::error("[Controller] {} {} failed: {}", to_string(kind), device_name, message);
                state_.write([&](AppState& s) {
                    if (kind != OperationKind::Create) {
                        s.mark_device_error(tag, message);
                    }
                    s.push_notification(NotificationLevel::Error, message);
                });
                return;
            }

            state_.write([&](AppState& s) {
                s.push_notification(NotificationLevel::Success, success_message);
                if (s.selected_tag() == tag) {
                    s.invalidate_cached_detail();
                }
            });
        }

        refresh(tag.platform);

        const bool selected = state_.read([&](const AppState& s) { return s.selected_tag() == tag; });
        if (selected) {
            on_selection_changed();
        }
    });
}

void AppController::toggle_device(const DeviceTag& tag) {
    const auto device = state_.read([&](const AppState& s) -> std::optional<Device> {
        const Device* d = s.find_device(tag);
        return d ? std::optional<Device>(*d) : std::nullopt;
    });
    if (!device) return;

    if (device->status == DeviceStatus::Running || device->status == DeviceStatus::Starting) {
        run_operation(tag, OperationKind::Stop, [tag](IDeviceManager& m, const CancellationToken& token) {
            m.stop_device(tag.identifier, token);
        }, "Stopped " + device->name);
    } else {
        run_operation(tag, OperationKind::Start, [tag](IDeviceManager& m, const CancellationToken& token) {
            m.start_device(tag.identifier, token);
        }, "Started " + device->name);
    }
}

void AppController::delete_device(const DeviceTag& tag) {
    const std::string name = state_.read([&](const AppState& s) {
        const Device* device = s.find_device(tag);
        return device ? device->name : tag.identifier;
    });
    run_operation(tag, OperationKind::Delete, [tag](IDeviceManager& m, const CancellationToken& token) {
        m.delete_device(tag.identifier, token);
    }, "Deleted " + name);
}

void AppController::wipe_device(const DeviceTag& tag) {
    const std::string name = state_.read([&](const AppState& s) {
        const Device* device = s.find_device(tag);
        return device ? device->name : tag.identifier;
    });
    run_operation(tag, OperationKind::Wipe, [tag](IDeviceManager& m, const CancellationToken& token) {
        m.wipe_device(tag.identifier, token);
    }, "Wiped " + name);
}

void AppController::submit_create(const DeviceConfig& config) {
    const DeviceTag tag{config.platform, config.name};

    const bool began = state_.write([&](AppState& s) {
        if (!s.try_begin_operation(tag, OperationKind::Create, config.name)) {
            auto& form = s.create_form();
            form.is_submitting = false;
            form.error_message = "Operation already in progress for " + config.name;
            return false;
        }
        return true;
    });
    if (!began) return;

    spdlog::info("[Controller] Creating {} device {}", to_string(config.platform), config.name);

    tasks_.spawn_detached("Creating " + config.name, [this, tag, config](const CancellationToken& token) {
        {
            PendingOperationGuard guard(state_, tag);
            try {
                manager(config.platform).create_device(config, token);
            } catch (const DeviceError& e) {
                if (token.is_cancelled()) return;
                const std::string message = e.user_message();
                spdlog::error("[Controller] Creating {} failed: {}", config.name, message);
                // The form stays open with the backend's message
                state_.write([&](AppState& s) {
                    auto& form = s.create_form();
                    if (s.mode() == Mode::CreateForm && form.platform == config.platform) {
                        form.is_submitting = false;
                        form.error_message = message;
                    }
                    s.push_notification(NotificationLevel::Error, message);
                });
                return;
            }

            state_.write([&](AppState& s) {
                if (s.mode() == Mode::CreateForm && s.create_form().is_submitting) {
                    s.create_form() = CreateFormViewModel{};
                    s.set_mode(Mode::Browsing);
                }
                s.push_notification(NotificationLevel::Success, "Created " + config.name);
            });
        }

        refresh(config.platform);
    });
}

void AppController::load_form_options() {
    const Platform platform = state_.read([](const AppState& s) { return s.create_form().platform; });

    tasks_.spawn(TaskSlot::FormOptions, [this, platform](const CancellationToken& token) {
        IDeviceManager& backend = manager(platform);

        std::vector<DeviceTypeOption> device_types;
        std::vector<VersionOption> versions;
        try {
            device_types = backend.list_device_types(token);
            versions = backend.list_versions(token);
        } catch (const DeviceError& e) {
            if (token.is_cancelled()) return;
            const std::string message = e.user_message();
            spdlog::warn("[Controller] Could not load creation options: {}", message);
            state_.write([&](AppState& s) {
                auto& form = s.create_form();
                if (s.mode() == Mode::CreateForm && form.platform == platform) {
                    form.options_loading = false;
                    form.error_message = message;
                }
            });
            return;
        }

        if (token.is_cancelled()) return;

        state_.write([&](AppState& s) {
            auto& form = s.create_form();
            // The form may have been closed or reopened for the other family meanwhile
            if (s.mode() == Mode::CreateForm && form.platform == platform && form.options_loading) {
                apply_form_options(form, std::move(device_types), versions);
            }
        });
    });
}

} // namespace emu
