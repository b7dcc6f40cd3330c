#ifndef PLATFORM_KDE_BACKEND_HPP
#define PLATFORM_KDE_BACKEND_HPP

#include "config_io.hpp"
#include "platform/shortcut_backend.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kde {
inline constexpr const char* CUSTOM_SECTION = "khotkeys";
inline constexpr const char* NO_SHORTCUT = "none";

// One kglobalshortcutsrc value: "current,default,description". Only the first
// two commas separate fields.
struct ShortcutValue {
    std::string current;
    std::string default_value;
    std::string description;
};

ShortcutValue parse_shortcut_value(const std::string& value);
std::string format_shortcut_value(const ShortcutValue& value);

// "Meta+Return" -> binding. Only the first of several packed shortcuts is
// considered. nullopt for "none", "" and anything unresolvable.
std::optional<KeyBinding> parse_shortcut(const std::string& shortcut);
std::optional<std::string> to_canonical_accelerator(const std::string& shortcut);

// "<Super>Return" -> "Meta+Return"; "none" when the accelerator is empty or
// does not parse.
std::string format_shortcut(const KeyBinding& binding);
// Meta folds into Super and Hyper is dropped; KDE spells neither.
KeyBinding storable_binding(const KeyBinding& binding);
std::string from_canonical_accelerator(const std::string& accelerator);

const std::vector<ShortcutCategory>& categories();
std::string component_category(const std::string& component);
std::string humanize_key(const std::string& key);

std::string default_config_path();

// Asks KWin to re-read its shortcut configuration. Failure is logged only.
void notify_reload();
}

class KdeBackend : public ShortcutBackend {
public:
    explicit KdeBackend(std::string config_path = kde::default_config_path(),
                        std::function<void()> reload = kde::notify_reload);

    std::string name() const override { return "kde"; }
    const std::string& config_path() const { return m_config_path; }

    std::vector<ShortcutCategory> get_categories() const override;

    ShortcutMap load_all_shortcuts() override;
    bool save_shortcut(const Shortcut& shortcut) override;
    bool reset_shortcut(Shortcut& shortcut) override;
    KeyBinding storable_binding(const KeyBinding& binding) const override { return kde::storable_binding(binding); }

    std::vector<CustomKeybinding> get_custom_keybindings() override;
    std::optional<std::string> add_custom_keybinding(const std::string& name, const std::string& command,
                                                     const std::string& binding) override;
    bool update_custom_keybinding(const std::string& path,
                                  const std::optional<std::string>& name,
                                  const std::optional<std::string>& command,
                                  const std::optional<std::string>& binding) override;
    bool delete_custom_keybinding(const std::string& path) override;

    // Plasma applications are preferred where one exists.
    std::optional<std::string> detect_terminal() const override;
    std::optional<std::string> detect_file_manager() const override;
    std::optional<std::string> detect_browser() const override;
    std::optional<std::string> detect_music_player() const override;

private:
    IniDocument load_document() const;
    void store_document(const IniDocument& document);

    std::string m_config_path;
    std::function<void()> m_reload;
};

#endif
