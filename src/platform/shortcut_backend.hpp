#ifndef PLATFORM_SHORTCUT_BACKEND_HPP
#define PLATFORM_SHORTCUT_BACKEND_HPP

#include "core/models.hpp"
#include "platform/app_detection.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using ShortcutMap = std::map<std::string, Shortcut>;

// Read/write access to one desktop environment's shortcut store.
//
// Not-found conditions are reported as false/nullopt, never thrown.
// Implementations may throw StorageError when the native store itself
// cannot be persisted.
class ShortcutBackend {
public:
    virtual ~ShortcutBackend() = default;

    virtual std::string name() const = 0;

    virtual std::vector<ShortcutCategory> get_categories() const = 0;

    // Full scan, custom launchers included under the "custom" category.
    virtual ShortcutMap load_all_shortcuts() = 0;

    // Writes shortcut.bindings to its native location. An empty binding list
    // is written as the disabled sentinel.
    virtual bool save_shortcut(const Shortcut& shortcut) = 0;

    // Restores the native default and updates shortcut.bindings to match.
    virtual bool reset_shortcut(Shortcut& shortcut) = 0;

    // The binding as the native store will hold it. Stores that cannot spell
    // every modifier fold or drop the ones they lack.
    virtual KeyBinding storable_binding(const KeyBinding& binding) const { return binding; }

    virtual std::vector<Shortcut> find_conflicts(const KeyBinding& binding, const std::string& exclude_id = "");

    virtual std::vector<CustomKeybinding> get_custom_keybindings() = 0;

    // Returns the new entry's path, or nullopt on failure.
    virtual std::optional<std::string> add_custom_keybinding(const std::string& name, const std::string& command,
                                                             const std::string& binding) = 0;

    virtual bool update_custom_keybinding(const std::string& path,
                                          const std::optional<std::string>& name,
                                          const std::optional<std::string>& command,
                                          const std::optional<std::string>& binding) = 0;

    virtual bool delete_custom_keybinding(const std::string& path) = 0;

    std::optional<CustomKeybinding> find_custom_keybinding(const std::string& name);

    // app_type: terminal, file_manager, browser, cheat_sheet or music.
    std::optional<CustomKeybinding> find_custom_keybinding_by_type(const std::string& app_type);

    // Launch commands for the preferred installed applications.
    virtual std::optional<std::string> detect_terminal() const = 0;
    virtual std::optional<std::string> detect_file_manager() const = 0;
    virtual std::optional<std::string> detect_browser() const = 0;
    virtual std::optional<std::string> detect_music_player() const = 0;

    // Points the terminal, file manager, browser and music launchers at the
    // detected applications, updating a launcher of the same kind in place
    // when one exists. Returns (app type, outcome) in that order.
    std::vector<std::pair<std::string, std::string>> setup_default_custom_shortcuts();

    void set_system_environment(std::shared_ptr<apps::SystemEnvironment> env) { m_environment = std::move(env); }

protected:
    const apps::SystemEnvironment& system_environment() const { return *m_environment; }

private:
    std::optional<std::string> detect_app(const std::string& app_type) const;

    std::shared_ptr<apps::SystemEnvironment> m_environment = std::make_shared<apps::HostEnvironment>();
};

namespace keybind {
inline constexpr const char* CUSTOM_LOCATION = "custom";
inline constexpr const char* CUSTOM_ID_PREFIX = "custom:";

// Lowest N >= 0 such that "<prefix>N" is not among the existing names.
int lowest_unused_suffix(const std::vector<std::string>& existing, const std::string& prefix);
}

#endif
