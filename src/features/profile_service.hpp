#ifndef FEATURES_PROFILE_SERVICE_HPP
#define FEATURES_PROFILE_SERVICE_HPP

#include "core/keyboard.hpp"
#include "core/profile.hpp"
#include "platform/shortcut_backend.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// shortcut id -> (current accelerators, other side's accelerators)
using AcceleratorDiff = std::map<std::string, std::pair<std::vector<std::string>, std::vector<std::string>>>;

namespace features {
std::string default_profiles_dir();
std::string default_presets_dir();

// Profile names are file stems inside one directory: no separators, not
// empty, not "." or "..".
bool is_valid_profile_name(const std::string& name);
}

// Loads, stores and applies profiles against one backend. Calls must be
// serialized by the caller; every save is its own step and a partial apply is
// reported through the returned map only.
class ProfileService {
public:
    ProfileService(ShortcutBackend& backend, std::string profiles_dir = features::default_profiles_dir(),
                   std::string presets_dir = features::default_presets_dir());

    const std::string& profiles_dir() const { return m_profiles_dir; }
    const std::string& presets_dir() const { return m_presets_dir; }

    void set_mac_keyboard_configurator(MacKeyboardConfigurator* configurator) { m_configurator = configurator; }

    // User profiles first, then presets. Unreadable files are skipped.
    std::vector<Profile> list_profiles() const;
    std::optional<Profile> get_profile(const std::string& name) const;

    std::string profile_path(const std::string& name) const;
    std::string save_profile(Profile& profile) const;
    bool delete_profile(const std::string& name) const;
    Profile import_profile(const std::string& path) const;
    void export_profile(Profile& profile, const std::string& path) const;

    Profile create_from_current(const std::string& name, const std::string& description = "");

    // clean_slate defaults to the profile's preset flag.
    std::map<std::string, Shortcut> apply_profile(const Profile& profile,
                                                  std::optional<bool> clean_slate = std::nullopt);
    AcceleratorDiff get_profile_diff(const Profile& profile);

    int reset_orphaned_shortcuts(const Profile& old_profile, const Profile& new_profile);
    std::map<std::string, Shortcut> switch_profile(const Profile& old_profile, const Profile& new_profile,
                                                   std::optional<bool> clean_slate = std::nullopt);

    AcceleratorDiff get_user_modifications(const Profile& base_preset);
    AcceleratorDiff get_user_modifications(const std::string& base_preset_name);

    std::optional<Profile> create_modifications_profile(const Profile& base_preset, const std::string& name = "",
                                                        const std::string& description = "");
    std::optional<Profile> create_modifications_profile(const std::string& base_preset_name,
                                                        const std::string& name = "",
                                                        const std::string& description = "");

    // Saves the deviations as a new user profile, resets the ones the preset
    // does not mention and re-applies the preset. Returns the saved path (if
    // anything was exported) and the number of exported shortcuts.
    std::pair<std::optional<std::string>, int> export_and_clear_modifications(const Profile& base_preset);
    std::pair<std::optional<std::string>, int> export_and_clear_modifications(const std::string& base_preset_name);

    const std::optional<Profile>& active_profile() const { return m_active_profile; }

private:
    static std::map<std::string, std::string> shortcut_ids_by_storage_key(const ShortcutMap& shortcuts);
    // Profile accelerators as the backend would store them, so bindings it
    // cannot spell still compare equal after a save.
    std::vector<KeyBinding> storable_bindings(const std::vector<std::string>& accelerators) const;
    std::set<std::string> storable_accelerators(const std::vector<std::string>& accelerators) const;
    AcceleratorDiff modifications(const Profile& base_preset, const ShortcutMap& shortcuts) const;
    Profile build_modifications_profile(const Profile& base_preset, const ShortcutMap& shortcuts,
                                        const AcceleratorDiff& diff, const std::string& name,
                                        const std::string& description) const;
    void apply_mac_keyboard(const Profile& profile);

    ShortcutBackend& m_backend;
    std::string m_profiles_dir;
    std::string m_presets_dir;
    MacKeyboardConfigurator* m_configurator = nullptr;
    std::optional<Profile> m_active_profile;
};

#endif
