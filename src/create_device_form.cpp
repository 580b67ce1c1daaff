#include "create_device_form.hpp"
#include "app_state.hpp"
#include "form_validation.hpp"
#include <algorithm>
#include <cctype>

namespace emu {

namespace {

constexpr size_t kMaxTextLength = 64;
constexpr size_t kMaxNumberLength = 6;

const std::vector<std::string> kAndroidCategories = {
    "all", "phone", "tablet", "wear", "tv", "automotive", "desktop"
};

FormField text_field(const FormFieldId id, const std::string& label, const FormFieldKind kind,
                     const std::string& value = {}) {
    FormField field;
    field.id = id;
    field.kind = kind;
    field.label = label;
    field.value = value;
    return field;
}

FormField choice_field(const FormFieldId id, const std::string& label) {
    FormField field;
    field.id = id;
    field.kind = FormFieldKind::Choice;
    field.label = label;
    return field;
}

std::string selected_category(const CreateFormViewModel& form) {
    const FormField* category = find_field(form, FormFieldId::Category);
    if (!category || !category->has_choice()) return "all";
    return category->choice_ids[category->selected];
}

// Rebuilds the device type choices for the current category, keeping the selection when possible
void refilter_device_types(CreateFormViewModel& form) {
    FormField* types = find_field(form, FormFieldId::DeviceType);
    if (!types) return;

    const std::string previous = types->has_choice() ? types->choice_ids[types->selected] : std::string{};
    const std::string category = selected_category(form);

    types->choice_ids.clear();
    types->choice_labels.clear();
    for (const auto& option : form.all_device_types) {
        if (category == "all" || option.category == category) {
            types->choice_ids.push_back(option.id);
            types->choice_labels.push_back(option.display_name);
        }
    }

    const auto it = std::ranges::find(types->choice_ids, previous);
    types->selected = it != types->choice_ids.end()
        ? static_cast<size_t>(std::distance(types->choice_ids.begin(), it))
        : 0;
}

} // namespace

CreateFormViewModel make_create_form(const Platform platform) {
    CreateFormViewModel form;
    form.is_visible = true;
    form.platform = platform;
    form.options_loading = true;

    form.fields.push_back(text_field(FormFieldId::Name, "Name", FormFieldKind::Text));

    if (platform == Platform::Android) {
        FormField category = choice_field(FormFieldId::Category, "Category");
        for (const auto& name : kAndroidCategories) {
            category.choice_ids.push_back(name);
            category.choice_labels.push_back(name);
        }
        form.fields.push_back(std::move(category));
        form.fields.push_back(choice_field(FormFieldId::DeviceType, "Device"));
        form.fields.push_back(choice_field(FormFieldId::Version, "System image"));
        form.fields.push_back(text_field(FormFieldId::Ram, "RAM (MB)", FormFieldKind::Number,
                                         std::to_string(kDefaultRamMb)));
        form.fields.push_back(text_field(FormFieldId::Storage, "Storage (MB)", FormFieldKind::Number,
                                         std::to_string(kDefaultStorageMb)));
    } else {
        form.fields.push_back(choice_field(FormFieldId::DeviceType, "Device type"));
        form.fields.push_back(choice_field(FormFieldId::Version, "Runtime"));
    }
    return form;
}

FormField* find_field(CreateFormViewModel& form, const FormFieldId id) {
    const auto it = std::ranges::find(form.fields, id, &FormField::id);
    return it != form.fields.end() ? &*it : nullptr;
}

const FormField* find_field(const CreateFormViewModel& form, const FormFieldId id) {
    const auto it = std::ranges::find(form.fields, id, &FormField::id);
    return it != form.fields.end() ? &*it : nullptr;
}

void apply_form_options(CreateFormViewModel& form, std::vector<DeviceTypeOption> device_types,
                        const std::vector<VersionOption>& versions) {
    form.all_device_types = std::move(device_types);
    refilter_device_types(form);

    if (FormField* version = find_field(form, FormFieldId::Version)) {
        version->choice_ids.clear();
        version->choice_labels.clear();
        for (const auto& option : versions) {
            version->choice_ids.push_back(option.id);
            version->choice_labels.push_back(option.display_name);
        }
        version->selected = 0;
    }
    form.options_loading = false;
}

void form_next_field(CreateFormViewModel& form) {
    if (form.fields.empty()) return;
    form.active_field = wrap_index(static_cast<long long>(form.active_field) + 1, form.fields.size());
}

void form_previous_field(CreateFormViewModel& form) {
    if (form.fields.empty()) return;
    form.active_field = wrap_index(static_cast<long long>(form.active_field) - 1, form.fields.size());
}

void form_cycle_choice(CreateFormViewModel& form, const int delta) {
    if (form.active_field >= form.fields.size()) return;

    FormField& field = form.fields[form.active_field];
    if (field.kind != FormFieldKind::Choice || field.choice_ids.empty()) return;

    field.selected = wrap_index(static_cast<long long>(field.selected) + delta, field.choice_ids.size());
    field.error.clear();

    if (field.id == FormFieldId::Category) {
        refilter_device_types(form);
    }
}

void form_insert_char(CreateFormViewModel& form, const char c) {
    if (form.active_field >= form.fields.size()) return;

    FormField& field = form.fields[form.active_field];
    switch (field.kind) {
        case FormFieldKind::Text:
            if (std::isprint(static_cast<unsigned char>(c)) && field.value.length() < kMaxTextLength) {
                field.value += c;
                field.error.clear();
            }
            break;
        case FormFieldKind::Number:
            if (std::isdigit(static_cast<unsigned char>(c)) && field.value.length() < kMaxNumberLength) {
                field.value += c;
                field.error.clear();
            }
            break;
        case FormFieldKind::Choice:
            break;
    }
}

void form_backspace(CreateFormViewModel& form) {
    if (form.active_field >= form.fields.size()) return;

    FormField& field = form.fields[form.active_field];
    if (field.kind != FormFieldKind::Choice && !field.value.empty()) {
        field.value.pop_back();
        field.error.clear();
    }
}

bool validate_form(CreateFormViewModel& form) {
    form.error_message.clear();

    for (auto& field : form.fields) {
        std::optional<std::string> error;
        switch (field.id) {
            case FormFieldId::Name:
                error = validate_device_name(field.value, form.platform);
                break;
            case FormFieldId::DeviceType:
                error = validate_required_selection(field.has_choice(), "device type");
                break;
            case FormFieldId::Version:
                error = validate_required_selection(
                    field.has_choice(), form.platform == Platform::Android ? "system image" : "runtime");
                break;
            case FormFieldId::Ram:
                error = validate_numeric_range(field.value, kMinRamMb, kMaxRamMb, "MB");
                break;
            case FormFieldId::Storage:
                error = validate_numeric_range(field.value, kMinStorageMb, kMaxStorageMb, "MB");
                break;
            case FormFieldId::Category:
                break;
        }

        field.error = error.value_or("");
        if (error && form.error_message.empty()) {
            form.error_message = field.label + ": " + *error;
        }
    }
    return form.error_message.empty();
}

DeviceConfig form_to_config(const CreateFormViewModel& form) {
    DeviceConfig config;
    config.platform = form.platform;

    for (const auto& field : form.fields) {
        switch (field.id) {
            case FormFieldId::Name:
                config.name = field.value;
                break;
            case FormFieldId::DeviceType:
                if (field.has_choice()) config.device_type = field.choice_ids[field.selected];
                break;
            case FormFieldId::Version:
                if (field.has_choice()) config.version = field.choice_ids[field.selected];
                break;
            case FormFieldId::Ram:
                config.ram_mb = field.value.empty() ? 0 : std::stoi(field.value);
                break;
            case FormFieldId::Storage:
                config.storage_mb = field.value.empty() ? 0 : std::stoi(field.value);
                break;
            case FormFieldId::Category:
                break;
        }
    }
    return config;
}

} // namespace emu
