#pragma once

#include "viewmodels/create_form_view_model.hpp"
#include <vector>

namespace emu {

// Fresh form for the platform; choice fields stay empty until options arrive
[[nodiscard]] CreateFormViewModel make_create_form(Platform platform);

void apply_form_options(CreateFormViewModel& form,
                        std::vector<DeviceTypeOption> device_types,
                        const std::vector<VersionOption>& versions);

[[nodiscard]] FormField* find_field(CreateFormViewModel& form, FormFieldId id);
[[nodiscard]] const FormField* find_field(const CreateFormViewModel& form, FormFieldId id);

// Field navigation is circular
void form_next_field(CreateFormViewModel& form);
void form_previous_field(CreateFormViewModel& form);

// Cycles the active choice field (circular); changing the category refilters device types
void form_cycle_choice(CreateFormViewModel& form, int delta);

void form_insert_char(CreateFormViewModel& form, char c);
void form_backspace(CreateFormViewModel& form);

// Validates every field, storing per-field errors. Returns true when the form may be submitted.
bool validate_form(CreateFormViewModel& form);

[[nodiscard]] DeviceConfig form_to_config(const CreateFormViewModel& form);

} // namespace emu
