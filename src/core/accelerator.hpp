#ifndef CORE_ACCELERATOR_HPP
#define CORE_ACCELERATOR_HPP

#include "core/models.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

// Accelerator text is the GTK bracket syntax, e.g. "<Control><Shift>t".
namespace keybind {
inline constexpr const char* DISABLED_ACCELERATOR = "disabled";

std::optional<Modifier> modifier_from_token(const std::string& token);

// Never throws; returns nullopt for "", "disabled" and unresolvable tokens.
std::optional<KeyBinding> parse_accelerator(const std::string& accelerator);

// Wraps gtk_accelerator_name, so modifier order is fixed regardless of input.
std::string format_accelerator(const KeyBinding& binding);

// gtk_accelerator_get_label text; not accepted by parse_accelerator.
std::string humanize_binding(const KeyBinding& binding);

std::optional<std::string> normalize_accelerator(const std::string& accelerator);
std::set<std::string> normalize_accelerators(const std::vector<std::string>& accelerators);

std::vector<KeyBinding> parse_accelerators(const std::vector<std::string>& accelerators);
}

#endif
