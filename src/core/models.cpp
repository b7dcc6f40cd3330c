#include "core/models.hpp"

#include "core/accelerator.hpp"

#include <gdk/gdk.h>

#include <algorithm>
#include <set>
#include <utility>

KeyBinding::KeyBinding(unsigned int keyval, Modifier modifiers)
    : m_keyval(gdk_keyval_to_lower(keyval)), m_modifiers(modifiers) {}

std::string KeyBinding::to_accelerator() const {
    return keybind::format_accelerator(*this);
}

std::string KeyBinding::to_label() const {
    return keybind::humanize_binding(*this);
}

std::string KeyBinding::key_name() const {
    const char* name = gdk_keyval_name(m_keyval);
    return name ? name : "";
}

std::string Shortcut::accelerator() const {
    if (bindings.empty()) {
        return "";
    }
    return bindings.front().to_accelerator();
}

std::vector<std::string> Shortcut::accelerators() const {
    std::vector<std::string> result;
    result.reserve(bindings.size());
    for (const auto& binding : bindings) {
        result.push_back(binding.to_accelerator());
    }
    return result;
}

std::string Shortcut::label() const {
    if (bindings.empty()) {
        return "Disabled";
    }
    return bindings.front().to_label();
}

std::string Shortcut::storage_key() const {
    return location.schema + "." + location.key;
}

bool Shortcut::is_modified() const {
    std::set<KeyBinding> current(bindings.begin(), bindings.end());
    std::set<KeyBinding> defaults(default_bindings.begin(), default_bindings.end());
    return current != defaults;
}

void Shortcut::set_binding(const std::optional<KeyBinding>& binding) {
    bindings.clear();
    if (binding) {
        bindings.push_back(*binding);
    }
}

void Shortcut::set_bindings(std::vector<KeyBinding> new_bindings) {
    if (!allow_multiple && new_bindings.size() > 1) {
        new_bindings.erase(new_bindings.begin() + 1, new_bindings.end());
    }
    bindings = std::move(new_bindings);
}

void Shortcut::add_binding(const KeyBinding& binding) {
    if (!allow_multiple) {
        bindings.assign(1, binding);
        return;
    }
    if (std::find(bindings.begin(), bindings.end(), binding) == bindings.end()) {
        bindings.push_back(binding);
    }
}

void Shortcut::remove_binding(const KeyBinding& binding) {
    auto it = std::find(bindings.begin(), bindings.end(), binding);
    if (it != bindings.end()) {
        bindings.erase(it);
    }
}

void Shortcut::reset() {
    bindings = default_bindings;
}

bool Shortcut::conflicts_with(const Shortcut& other) const {
    if (id == other.id) {
        return false;
    }
    for (const auto& binding : bindings) {
        if (std::find(other.bindings.begin(), other.bindings.end(), binding) != other.bindings.end()) {
            return true;
        }
    }
    return false;
}
