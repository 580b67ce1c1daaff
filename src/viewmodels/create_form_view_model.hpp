#pragma once

#include "../device.hpp"
#include <string>
#include <vector>

namespace emu {

enum class FormFieldId {
    Name,
    Category,
    DeviceType,
    Version,
    Ram,
    Storage
};

enum class FormFieldKind {
    Text,
    Number,
    Choice
};

struct FormField {
    FormFieldId id = FormFieldId::Name;
    FormFieldKind kind = FormFieldKind::Text;
    std::string label;

    // Text and number fields
    std::string value;

    // Choice fields (ids and labels are parallel)
    std::vector<std::string> choice_ids;
    std::vector<std::string> choice_labels;
    size_t selected = 0;

    std::string error;

    [[nodiscard]] bool has_choice() const { return selected < choice_ids.size(); }
};

struct CreateFormViewModel {
    bool is_visible = false;
    Platform platform = Platform::Android;

    std::vector<FormField> fields;
    size_t active_field = 0;

    // Unfiltered device types, the DeviceType field shows the current category's subset
    std::vector<DeviceTypeOption> all_device_types;

    bool options_loading = false;
    bool is_submitting = false;
    std::string error_message;
};

} // namespace emu
