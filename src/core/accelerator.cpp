#include "core/accelerator.hpp"

#include <gtk/gtk.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {
std::string lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

struct ModifierMask {
    Modifier modifier;
    GdkModifierType mask;
};

constexpr std::array<ModifierMask, 6> kModifierMasks = {{
    {Modifier::Shift, GDK_SHIFT_MASK},
    {Modifier::Ctrl, GDK_CONTROL_MASK},
    {Modifier::Alt, GDK_ALT_MASK},
    {Modifier::Super, GDK_SUPER_MASK},
    {Modifier::Hyper, GDK_HYPER_MASK},
    {Modifier::Meta, GDK_META_MASK},
}};

GdkModifierType to_gdk_modifiers(Modifier modifiers) {
    guint mask = 0;
    for (const auto& entry : kModifierMasks) {
        if (has_modifier(modifiers, entry.modifier)) {
            mask |= entry.mask;
        }
    }
    return static_cast<GdkModifierType>(mask);
}

Modifier from_gdk_modifiers(GdkModifierType mask) {
    Modifier modifiers = Modifier::None;
    for (const auto& entry : kModifierMasks) {
        if (mask & entry.mask) {
            modifiers |= entry.modifier;
        }
    }
    return modifiers;
}

std::string take_gtk_string(char* text) {
    if (!text) {
        return "";
    }
    std::string result(text);
    g_free(text);
    return result;
}
}

std::optional<Modifier> keybind::modifier_from_token(const std::string& token) {
    const std::string lowered = lower_copy(token);
    if (lowered == "shift" || lowered == "shft") {
        return Modifier::Shift;
    }
    if (lowered == "control" || lowered == "ctrl" || lowered == "ctl" || lowered == "primary") {
        return Modifier::Ctrl;
    }
    if (lowered == "alt" || lowered == "mod1") {
        return Modifier::Alt;
    }
    if (lowered == "super" || lowered == "mod4") {
        return Modifier::Super;
    }
    if (lowered == "hyper") {
        return Modifier::Hyper;
    }
    if (lowered == "meta") {
        return Modifier::Meta;
    }
    return std::nullopt;
}

std::optional<KeyBinding> keybind::parse_accelerator(const std::string& accelerator) {
    if (accelerator.empty() || accelerator == DISABLED_ACCELERATOR) {
        return std::nullopt;
    }

    // gtk_accelerator_parse skips bracket tokens it does not know, so they
    // are checked here first. <Mod4> is only understood on this side.
    Modifier token_modifiers = Modifier::None;
    size_t pos = 0;
    while (pos < accelerator.size() && accelerator[pos] == '<') {
        size_t end = accelerator.find('>', pos);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        auto modifier = modifier_from_token(accelerator.substr(pos + 1, end - pos - 1));
        if (!modifier) {
            return std::nullopt;
        }
        token_modifiers |= *modifier;
        pos = end + 1;
    }
    if (pos == accelerator.size()) {
        return std::nullopt;
    }

    guint keyval = 0;
    GdkModifierType mask = static_cast<GdkModifierType>(0);
    if (!gtk_accelerator_parse(accelerator.c_str(), &keyval, &mask) || keyval == 0) {
        return std::nullopt;
    }

    return KeyBinding(keyval, from_gdk_modifiers(mask) | token_modifiers);
}

std::string keybind::format_accelerator(const KeyBinding& binding) {
    if (!gdk_keyval_name(binding.keyval())) {
        return "";
    }
    return take_gtk_string(gtk_accelerator_name(binding.keyval(), to_gdk_modifiers(binding.modifiers())));
}

std::string keybind::humanize_binding(const KeyBinding& binding) {
    return take_gtk_string(gtk_accelerator_get_label(binding.keyval(), to_gdk_modifiers(binding.modifiers())));
}

std::optional<std::string> keybind::normalize_accelerator(const std::string& accelerator) {
    auto binding = parse_accelerator(accelerator);
    if (!binding) {
        return std::nullopt;
    }
    return format_accelerator(*binding);
}

std::set<std::string> keybind::normalize_accelerators(const std::vector<std::string>& accelerators) {
    std::set<std::string> normalized;
    for (const auto& accelerator : accelerators) {
        auto canonical = normalize_accelerator(accelerator);
        if (canonical) {
            normalized.insert(std::move(*canonical));
        }
    }
    return normalized;
}

std::vector<KeyBinding> keybind::parse_accelerators(const std::vector<std::string>& accelerators) {
    std::vector<KeyBinding> bindings;
    for (const auto& accelerator : accelerators) {
        auto binding = parse_accelerator(accelerator);
        if (binding) {
            bindings.push_back(*binding);
        }
    }
    return bindings;
}
