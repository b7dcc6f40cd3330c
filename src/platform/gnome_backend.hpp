#ifndef PLATFORM_GNOME_BACKEND_HPP
#define PLATFORM_GNOME_BACKEND_HPP

#include "platform/settings_store.hpp"
#include "platform/shortcut_backend.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gnome {
inline constexpr const char* CUSTOM_SCHEMA = "org.gnome.settings-daemon.plugins.media-keys";
inline constexpr const char* CUSTOM_LIST_KEY = "custom-keybindings";
inline constexpr const char* CUSTOM_BINDING_SCHEMA = "org.gnome.settings-daemon.plugins.media-keys.custom-keybinding";
inline constexpr const char* CUSTOM_PATH_PREFIX = "/org/gnome/settings-daemon/plugins/media-keys/custom-keybindings";

struct ShortcutSchema {
    std::string schema;
    std::string category;
};

const std::vector<ShortcutSchema>& shortcut_schemas();
const std::vector<ShortcutCategory>& categories();

// Ordered heuristic: name exclusions, then value type, then the shape of the
// default value. Keep the rule order as is; presets depend on what it accepts.
bool is_shortcut_key(const std::string& key, const SettingKeyInfo& info);

// "custom" when neither the lookup table nor a prefix rule matches.
std::string key_category(const std::string& key);
std::string shortcut_group(const std::string& key);
std::string humanize_key_name(const std::string& key);

std::vector<KeyBinding> parse_binding_value(const SettingValue& value);
}

class GnomeBackend : public ShortcutBackend {
public:
    explicit GnomeBackend(std::shared_ptr<SettingsStore> store);

    std::string name() const override { return "gnome"; }
    std::vector<ShortcutCategory> get_categories() const override;

    ShortcutMap load_all_shortcuts() override;
    bool save_shortcut(const Shortcut& shortcut) override;
    bool reset_shortcut(Shortcut& shortcut) override;

    std::vector<CustomKeybinding> get_custom_keybindings() override;
    std::optional<std::string> add_custom_keybinding(const std::string& name, const std::string& command,
                                                     const std::string& binding) override;
    bool update_custom_keybinding(const std::string& path,
                                  const std::optional<std::string>& name,
                                  const std::optional<std::string>& command,
                                  const std::optional<std::string>& binding) override;
    bool delete_custom_keybinding(const std::string& path) override;

    std::optional<std::string> detect_terminal() const override;
    std::optional<std::string> detect_file_manager() const override;
    std::optional<std::string> detect_browser() const override;
    std::optional<std::string> detect_music_player() const override;

private:
    std::vector<std::string> custom_paths() const;
    ShortcutMap load_custom_shortcuts();

    std::shared_ptr<SettingsStore> m_store;
};

#endif
