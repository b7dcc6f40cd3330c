#ifndef CORE_MODELS_HPP
#define CORE_MODELS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Modifier : std::uint32_t {
    None = 0,
    Shift = 1u << 0,
    Ctrl = 1u << 1,
    Alt = 1u << 2,
    Super = 1u << 3,
    Hyper = 1u << 4,
    Meta = 1u << 5,
};

constexpr Modifier operator|(Modifier lhs, Modifier rhs) {
    return static_cast<Modifier>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

constexpr Modifier operator&(Modifier lhs, Modifier rhs) {
    return static_cast<Modifier>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

inline Modifier& operator|=(Modifier& lhs, Modifier rhs) {
    lhs = lhs | rhs;
    return lhs;
}

constexpr bool has_modifier(Modifier set, Modifier flag) {
    return (set & flag) == flag && flag != Modifier::None;
}

// Immutable key + modifier pair. The key is a gdk keyval, folded to lowercase
// so that "<Super>A" and "<Super>a" denote the same binding.
class KeyBinding {
public:
    explicit KeyBinding(unsigned int keyval, Modifier modifiers = Modifier::None);

    unsigned int keyval() const { return m_keyval; }
    Modifier modifiers() const { return m_modifiers; }

    std::string to_accelerator() const;
    std::string to_label() const;
    std::string key_name() const;

    bool operator==(const KeyBinding& other) const {
        return m_keyval == other.m_keyval && m_modifiers == other.m_modifiers;
    }
    bool operator!=(const KeyBinding& other) const { return !(*this == other); }
    bool operator<(const KeyBinding& other) const {
        if (m_keyval != other.m_keyval) {
            return m_keyval < other.m_keyval;
        }
        return static_cast<std::uint32_t>(m_modifiers) < static_cast<std::uint32_t>(other.m_modifiers);
    }

private:
    unsigned int m_keyval;
    Modifier m_modifiers;
};

struct ShortcutCategory {
    std::string id;
    std::string name;
    std::string icon = "preferences-system-symbolic";
    std::string description;
};

// Opaque to everything but the owning backend: schema/key for GSettings,
// section/key for kglobalshortcutsrc, ("custom", path) for launchers.
struct ShortcutLocation {
    std::string schema;
    std::string key;
};

struct Shortcut {
    std::string id;
    std::string name;
    std::string description;
    std::string category;
    std::string group = "Other";
    ShortcutLocation location;

    std::vector<KeyBinding> bindings;
    std::vector<KeyBinding> default_bindings;

    bool allow_multiple = false;
    bool system = false;

    std::string accelerator() const;
    std::vector<std::string> accelerators() const;
    std::string label() const;
    std::string storage_key() const;
    bool is_custom() const { return location.schema == "custom"; }

    bool is_modified() const;
    void set_binding(const std::optional<KeyBinding>& binding);
    void set_bindings(std::vector<KeyBinding> new_bindings);
    void add_binding(const KeyBinding& binding);
    void remove_binding(const KeyBinding& binding);
    void reset();
    bool conflicts_with(const Shortcut& other) const;
};

struct CustomKeybinding {
    std::string path;
    std::string name;
    std::string command;
    std::string binding;
};

#endif
