#include "features/settings_controller.hpp"

#include "core/accelerator.hpp"
#include "core/conflict_detector.hpp"

#include <map>
#include <utility>

namespace {
std::string join_accelerators(const std::vector<std::string>& accelerators) {
    if (accelerators.empty()) {
        return "(disabled)";
    }
    std::string text;
    for (const auto& accelerator : accelerators) {
        if (!text.empty()) {
            text += ", ";
        }
        text += accelerator;
    }
    return text;
}
}

SettingsController::SettingsController(ShortcutBackend& backend, ProfileService& profiles, std::ostream& out)
    : m_backend(backend), m_profiles(profiles), m_out(out) {}

void SettingsController::print_usage(std::ostream& out) {
    out << "Usage: keybind-settings [OPTION...] COMMAND [ARGS]\n"
           "\n"
           "Commands:\n"
           "  list                              Show every shortcut grouped by category\n"
           "  categories                        Show shortcut categories\n"
           "  profiles                          Show user profiles and presets\n"
           "  show NAME                         Show the shortcuts of a profile\n"
           "  diff NAME                         Compare a profile with the live shortcuts\n"
           "  apply NAME                        Apply a profile\n"
           "  switch OLD NEW                    Reset what OLD set and NEW does not, then apply NEW\n"
           "  save-current NAME [DESCRIPTION]   Save the live shortcuts as a profile\n"
           "  conflicts [ACCEL [EXCLUDE-ID]]    Show shortcuts sharing a binding\n"
           "  mods PRESET                       Show changes made on top of a preset\n"
           "  export-mods PRESET                Save those changes as a profile and restore the preset\n"
           "  reset ID                          Restore a shortcut's default\n"
           "  custom-list                       Show custom launchers\n"
           "  custom-add NAME COMMAND ACCEL     Add a custom launcher\n"
           "  custom-delete PATH                Remove a custom launcher\n"
           "  setup-launchers                   Bind launchers to the detected default applications\n";
}

int SettingsController::run(const std::vector<std::string>& args, std::optional<bool> clean_slate) {
    if (args.empty()) {
        print_usage(std::cerr);
        return 2;
    }

    const std::string& command = args[0];
    const size_t argc = args.size() - 1;
    bool ok = false;

    if (command == "list" && argc == 0) {
        ok = list_shortcuts();
    } else if (command == "categories" && argc == 0) {
        ok = list_categories();
    } else if (command == "profiles" && argc == 0) {
        ok = list_profiles();
    } else if (command == "show" && argc == 1) {
        ok = show_profile(args[1]);
    } else if (command == "diff" && argc == 1) {
        ok = diff_profile(args[1]);
    } else if (command == "apply" && argc == 1) {
        ok = apply_profile(args[1], clean_slate);
    } else if (command == "switch" && argc == 2) {
        ok = switch_profile(args[1], args[2], clean_slate);
    } else if (command == "save-current" && (argc == 1 || argc == 2)) {
        ok = save_current(args[1], argc == 2 ? args[2] : "");
    } else if (command == "conflicts" && argc == 0) {
        ok = show_all_conflicts();
    } else if (command == "conflicts" && (argc == 1 || argc == 2)) {
        ok = show_conflicts(args[1], argc == 2 ? args[2] : "");
    } else if (command == "mods" && argc == 1) {
        ok = show_modifications(args[1]);
    } else if (command == "export-mods" && argc == 1) {
        ok = export_modifications(args[1]);
    } else if (command == "reset" && argc == 1) {
        ok = reset_shortcut(args[1]);
    } else if (command == "custom-list" && argc == 0) {
        ok = list_custom();
    } else if (command == "custom-add" && argc == 3) {
        ok = add_custom(args[1], args[2], args[3]);
    } else if (command == "custom-delete" && argc == 1) {
        ok = delete_custom(args[1]);
    } else if (command == "setup-launchers" && argc == 0) {
        ok = setup_launchers();
    } else {
        print_usage(std::cerr);
        return 2;
    }

    return ok ? 0 : 1;
}

bool SettingsController::list_shortcuts() const {
    const ShortcutMap shortcuts = m_backend.load_all_shortcuts();

    for (const auto& category : m_backend.get_categories()) {
        std::map<std::string, std::vector<const Shortcut*>> groups;
        for (const auto& entry : shortcuts) {
            if (entry.second.category == category.id) {
                groups[entry.second.group].push_back(&entry.second);
            }
        }
        if (groups.empty()) {
            continue;
        }

        m_out << category.name << '\n';
        for (const auto& [group, members] : groups) {
            m_out << "  " << group << '\n';
            for (const Shortcut* shortcut : members) {
                m_out << "    " << shortcut->name << "\t" << shortcut->label()
                      << (shortcut->is_modified() ? "\t(modified)" : "") << "\t" << shortcut->id << '\n';
            }
        }
    }
    return true;
}

bool SettingsController::list_categories() const {
    for (const auto& category : m_backend.get_categories()) {
        m_out << category.id << "\t" << category.name << "\t" << category.description << '\n';
    }
    return true;
}

bool SettingsController::list_profiles() const {
    const auto& active = m_profiles.active_profile();
    for (const auto& profile : m_profiles.list_profiles()) {
        m_out << profile.name;
        if (profile.is_preset()) {
            m_out << " [preset]";
        }
        if (active && active->name == profile.name) {
            m_out << " [active]";
        }
        if (!profile.description.empty()) {
            m_out << "\t" << profile.description;
        }
        m_out << '\n';
    }
    return true;
}

bool SettingsController::show_profile(const std::string& name) const {
    auto profile = m_profiles.get_profile(name);
    if (!profile) {
        std::cerr << "No such profile: " << name << std::endl;
        return false;
    }

    m_out << profile->name << " (version " << profile->version << ")\n";
    if (!profile->description.empty()) {
        m_out << profile->description << '\n';
    }
    if (!profile->author.empty()) {
        m_out << "Author: " << profile->author << '\n';
    }
    for (const auto& [storage_key, accelerators] : profile->shortcuts) {
        m_out << "  " << storage_key << " = " << join_accelerators(accelerators) << '\n';
    }
    const auto xkb = profile->xkb_options.to_xkb_options();
    if (!xkb.empty()) {
        m_out << "XKB options: " << join_accelerators(xkb) << '\n';
    }
    if (profile->mac_keyboard) {
        m_out << "Apple keyboard:";
        for (const auto& [option, value] : profile->mac_keyboard->to_modprobe_options()) {
            m_out << " " << option << "=" << value;
        }
        m_out << '\n';
    }
    return true;
}

void SettingsController::print_diff(const AcceleratorDiff& diff, const char* other_label) const {
    for (const auto& [id, accelerators] : diff) {
        m_out << id << "\n    current: " << join_accelerators(accelerators.first) << "\n    " << other_label
              << ": " << join_accelerators(accelerators.second) << '\n';
    }
}

bool SettingsController::diff_profile(const std::string& name) const {
    auto profile = m_profiles.get_profile(name);
    if (!profile) {
        std::cerr << "No such profile: " << name << std::endl;
        return false;
    }

    const auto diff = m_profiles.get_profile_diff(*profile);
    if (diff.empty()) {
        m_out << "Live shortcuts match " << name << '\n';
        return true;
    }
    print_diff(diff, "profile");
    return true;
}

void SettingsController::print_changes(const std::map<std::string, Shortcut>& changed) const {
    for (const auto& entry : changed) {
        m_out << entry.first << " -> " << entry.second.label() << '\n';
    }
    m_out << "Changed " << changed.size() << " shortcut(s)\n";
}

bool SettingsController::apply_profile(const std::string& name, std::optional<bool> clean_slate) const {
    auto profile = m_profiles.get_profile(name);
    if (!profile) {
        std::cerr << "No such profile: " << name << std::endl;
        return false;
    }

    print_changes(m_profiles.apply_profile(*profile, clean_slate));
    return true;
}

bool SettingsController::switch_profile(const std::string& old_name, const std::string& new_name,
                                        std::optional<bool> clean_slate) const {
    auto old_profile = m_profiles.get_profile(old_name);
    auto new_profile = m_profiles.get_profile(new_name);
    if (!old_profile || !new_profile) {
        std::cerr << "No such profile: " << (old_profile ? new_name : old_name) << std::endl;
        return false;
    }

    print_changes(m_profiles.switch_profile(*old_profile, *new_profile, clean_slate));
    return true;
}

bool SettingsController::save_current(const std::string& name, const std::string& description) const {
    if (!features::is_valid_profile_name(name)) {
        std::cerr << "Invalid profile name: " << name << std::endl;
        return false;
    }
    Profile profile = m_profiles.create_from_current(name, description);
    const std::string path = m_profiles.save_profile(profile);
    m_out << "Saved " << profile.shortcuts.size() << " shortcut(s) to " << path << '\n';
    return true;
}

bool SettingsController::show_conflicts(const std::string& accelerator, const std::string& exclude_id) const {
    auto binding = keybind::parse_accelerator(accelerator);
    if (!binding) {
        std::cerr << "Invalid accelerator: " << accelerator << std::endl;
        return false;
    }

    const auto conflicts = m_backend.find_conflicts(*binding, exclude_id);
    if (conflicts.empty()) {
        m_out << binding->to_label() << " is free\n";
        return true;
    }
    for (const auto& shortcut : conflicts) {
        m_out << shortcut.id << "\t" << shortcut.name << '\n';
    }
    return true;
}

bool SettingsController::show_all_conflicts() const {
    for (const auto& [accelerator, ids] : keybind::find_all_conflicts(m_backend.load_all_shortcuts())) {
        m_out << accelerator << '\n';
        for (const auto& id : ids) {
            m_out << "    " << id << '\n';
        }
    }
    return true;
}

bool SettingsController::show_modifications(const std::string& preset_name) const {
    auto preset = m_profiles.get_profile(preset_name);
    if (!preset) {
        std::cerr << "No such profile: " << preset_name << std::endl;
        return false;
    }

    const auto diff = m_profiles.get_user_modifications(*preset);
    if (diff.empty()) {
        m_out << "No changes on top of " << preset_name << '\n';
        return true;
    }
    print_diff(diff, "expected");
    return true;
}

bool SettingsController::export_modifications(const std::string& preset_name) const {
    auto preset = m_profiles.get_profile(preset_name);
    if (!preset) {
        std::cerr << "No such profile: " << preset_name << std::endl;
        return false;
    }

    const auto [path, count] = m_profiles.export_and_clear_modifications(*preset);
    if (!path) {
        m_out << "No changes on top of " << preset_name << '\n';
        return true;
    }
    m_out << "Exported " << count << " shortcut(s) to " << *path << '\n';
    return true;
}

bool SettingsController::reset_shortcut(const std::string& id) const {
    ShortcutMap shortcuts = m_backend.load_all_shortcuts();
    auto it = shortcuts.find(id);
    if (it == shortcuts.end()) {
        std::cerr << "No such shortcut: " << id << std::endl;
        return false;
    }

    if (!m_backend.reset_shortcut(it->second)) {
        std::cerr << "Failed to reset shortcut: " << id << std::endl;
        return false;
    }
    m_out << id << " -> " << it->second.label() << '\n';
    return true;
}

bool SettingsController::list_custom() const {
    for (const auto& custom : m_backend.get_custom_keybindings()) {
        m_out << custom.path << "\t" << custom.name << "\t" << (custom.binding.empty() ? "(disabled)" : custom.binding)
              << "\t" << custom.command << '\n';
    }
    return true;
}

bool SettingsController::add_custom(const std::string& name, const std::string& command,
                                    const std::string& accelerator) const {
    auto binding = keybind::parse_accelerator(accelerator);
    if (!binding) {
        std::cerr << "Invalid accelerator: " << accelerator << std::endl;
        return false;
    }

    auto path = m_backend.add_custom_keybinding(name, command, binding->to_accelerator());
    if (!path) {
        std::cerr << "Failed to add custom shortcut: " << name << std::endl;
        return false;
    }
    m_out << *path << '\n';
    return true;
}

bool SettingsController::delete_custom(const std::string& path) const {
    if (!m_backend.delete_custom_keybinding(path)) {
        std::cerr << "No such custom shortcut: " << path << std::endl;
        return false;
    }
    return true;
}

bool SettingsController::setup_launchers() const {
    for (const auto& [app_type, outcome] : m_backend.setup_default_custom_shortcuts()) {
        m_out << app_type << "\t" << outcome << '\n';
    }
    return true;
}
