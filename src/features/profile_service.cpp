#include "features/profile_service.hpp"

#include "core/accelerator.hpp"
#include "core/errors.hpp"

#include <glibmm/miscutils.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace {
constexpr const char* kProfileExtension = ".json";

std::vector<std::string> profile_files(const std::string& dir) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && entry.path().extension() == kProfileExtension) {
            files.push_back(entry.path().string());
        }
    }
    if (ec) {
        std::cerr << "Failed to list profiles in " << dir << ": " << ec.message() << std::endl;
    }
    std::sort(files.begin(), files.end());
    return files;
}
}

std::string features::default_profiles_dir() {
    return Glib::build_filename(Glib::get_user_config_dir(), "keybind-settings", "profiles");
}

bool features::is_valid_profile_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find_first_of("/\\") == std::string::npos;
}

std::string features::default_presets_dir() {
    for (const auto& data_dir : Glib::get_system_data_dirs()) {
        const std::string candidate = Glib::build_filename(data_dir, "keybind-settings", "presets");
        std::error_code ec;
        if (fs::is_directory(candidate, ec)) {
            return candidate;
        }
    }
    return "presets";
}

ProfileService::ProfileService(ShortcutBackend& backend, std::string profiles_dir, std::string presets_dir)
    : m_backend(backend), m_profiles_dir(std::move(profiles_dir)), m_presets_dir(std::move(presets_dir)) {}

std::vector<Profile> ProfileService::list_profiles() const {
    std::vector<Profile> profiles;
    for (const auto& dir : {m_profiles_dir, m_presets_dir}) {
        for (const auto& path : profile_files(dir)) {
            try {
                profiles.push_back(Profile::load_from_file(path));
            } catch (const StorageError& error) {
                std::cerr << "Skipping invalid profile: " << error.what() << std::endl;
            }
        }
    }
    return profiles;
}

std::optional<Profile> ProfileService::get_profile(const std::string& name) const {
    if (!features::is_valid_profile_name(name)) {
        return std::nullopt;
    }
    for (const auto& dir : {m_profiles_dir, m_presets_dir}) {
        const std::string path = Glib::build_filename(dir, name + kProfileExtension);
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            return Profile::load_from_file(path);
        }
    }
    return std::nullopt;
}

std::string ProfileService::profile_path(const std::string& name) const {
    return Glib::build_filename(m_profiles_dir, name + kProfileExtension);
}

std::string ProfileService::save_profile(Profile& profile) const {
    if (!features::is_valid_profile_name(profile.name)) {
        throw StorageError(profile.name, "Invalid profile name");
    }

    std::error_code ec;
    fs::create_directories(m_profiles_dir, ec);
    if (ec) {
        throw StorageError(m_profiles_dir, "Failed to create profile directory (" + ec.message() + ")");
    }

    const std::string path = profile_path(profile.name);
    profile.save_to_file(path);
    return path;
}

bool ProfileService::delete_profile(const std::string& name) const {
    if (!features::is_valid_profile_name(name)) {
        std::cerr << "Invalid profile name: " << name << std::endl;
        return false;
    }
    std::error_code ec;
    const bool removed = fs::remove(profile_path(name), ec);
    if (ec) {
        std::cerr << "Failed to delete profile " << name << ": " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

Profile ProfileService::import_profile(const std::string& path) const {
    Profile profile = Profile::load_from_file(path);
    save_profile(profile);
    return profile;
}

void ProfileService::export_profile(Profile& profile, const std::string& path) const {
    profile.save_to_file(path);
}

Profile ProfileService::create_from_current(const std::string& name, const std::string& description) {
    Profile profile(name);
    profile.description = description;

    for (const auto& [id, shortcut] : m_backend.load_all_shortcuts()) {
        if (!shortcut.bindings.empty()) {
            profile.set_shortcut(shortcut.location.schema, shortcut.location.key, shortcut.accelerators());
        }
    }
    return profile;
}

std::map<std::string, std::string> ProfileService::shortcut_ids_by_storage_key(const ShortcutMap& shortcuts) {
    std::map<std::string, std::string> ids;
    for (const auto& [id, shortcut] : shortcuts) {
        ids.emplace(shortcut.storage_key(), id);
    }
    return ids;
}

std::vector<KeyBinding> ProfileService::storable_bindings(const std::vector<std::string>& accelerators) const {
    std::vector<KeyBinding> bindings;
    for (const auto& binding : keybind::parse_accelerators(accelerators)) {
        bindings.push_back(m_backend.storable_binding(binding));
    }
    return bindings;
}

std::set<std::string> ProfileService::storable_accelerators(const std::vector<std::string>& accelerators) const {
    std::set<std::string> normalized;
    for (const auto& binding : storable_bindings(accelerators)) {
        normalized.insert(binding.to_accelerator());
    }
    return normalized;
}

std::map<std::string, Shortcut> ProfileService::apply_profile(const Profile& profile,
                                                              std::optional<bool> clean_slate) {
    const bool use_clean_slate = clean_slate.value_or(profile.is_preset());

    ShortcutMap current = m_backend.load_all_shortcuts();
    const auto ids = shortcut_ids_by_storage_key(current);
    std::map<std::string, Shortcut> changed;

    if (use_clean_slate) {
        for (auto& [id, shortcut] : current) {
            if (shortcut.is_custom() || shortcut.bindings.empty()) {
                continue;
            }
            // Keys the profile sets are settled in the second pass.
            if (profile.shortcuts.count(shortcut.storage_key())) {
                continue;
            }

            shortcut.bindings.clear();
            if (m_backend.save_shortcut(shortcut)) {
                changed[id] = shortcut;
            }
        }
    }

    for (const auto& [storage_key, accelerators] : profile.shortcuts) {
        auto id = ids.find(storage_key);
        if (id == ids.end()) {
            continue;
        }

        Shortcut& shortcut = current.at(id->second);
        const auto live = keybind::normalize_accelerators(shortcut.accelerators());
        if (live == storable_accelerators(accelerators)) {
            continue;
        }

        // A single-binding shortcut keeps only the first accelerator; compare
        // against what would actually be stored.
        Shortcut target = shortcut;
        target.set_bindings(storable_bindings(accelerators));
        if (live == keybind::normalize_accelerators(target.accelerators())) {
            continue;
        }

        shortcut.bindings = std::move(target.bindings);
        if (m_backend.save_shortcut(shortcut)) {
            changed[id->second] = shortcut;
        }
    }

    apply_mac_keyboard(profile);
    m_active_profile = profile;
    return changed;
}

void ProfileService::apply_mac_keyboard(const Profile& profile) {
    if (!profile.mac_keyboard || !m_configurator) {
        return;
    }
    if (!m_configurator->apply_config(*profile.mac_keyboard)) {
        std::cerr << "Failed to apply Apple keyboard settings from profile: " << profile.name << std::endl;
    }
}

AcceleratorDiff ProfileService::get_profile_diff(const Profile& profile) {
    const ShortcutMap current = m_backend.load_all_shortcuts();
    const auto ids = shortcut_ids_by_storage_key(current);
    AcceleratorDiff diff;

    for (const auto& [storage_key, accelerators] : profile.shortcuts) {
        auto id = ids.find(storage_key);
        if (id == ids.end()) {
            continue;
        }

        const Shortcut& shortcut = current.at(id->second);
        const auto current_accelerators = shortcut.accelerators();
        if (keybind::normalize_accelerators(current_accelerators) != storable_accelerators(accelerators)) {
            diff[id->second] = {current_accelerators, accelerators};
        }
    }
    return diff;
}

int ProfileService::reset_orphaned_shortcuts(const Profile& old_profile, const Profile& new_profile) {
    std::vector<std::string> orphaned;
    for (const auto& entry : old_profile.shortcuts) {
        if (!new_profile.shortcuts.count(entry.first)) {
            orphaned.push_back(entry.first);
        }
    }
    if (orphaned.empty()) {
        return 0;
    }

    ShortcutMap current = m_backend.load_all_shortcuts();
    const auto ids = shortcut_ids_by_storage_key(current);
    int reset_count = 0;

    for (const auto& storage_key : orphaned) {
        auto id = ids.find(storage_key);
        if (id == ids.end()) {
            continue;
        }

        Shortcut& shortcut = current.at(id->second);
        if (!shortcut.is_modified()) {
            continue;
        }
        if (m_backend.reset_shortcut(shortcut)) {
            ++reset_count;
        } else {
            std::cerr << "Failed to reset shortcut: " << shortcut.id << std::endl;
        }
    }
    return reset_count;
}

std::map<std::string, Shortcut> ProfileService::switch_profile(const Profile& old_profile,
                                                               const Profile& new_profile,
                                                               std::optional<bool> clean_slate) {
    reset_orphaned_shortcuts(old_profile, new_profile);
    return apply_profile(new_profile, clean_slate);
}

AcceleratorDiff ProfileService::modifications(const Profile& base_preset, const ShortcutMap& shortcuts) const {
    AcceleratorDiff diff;

    for (const auto& [id, shortcut] : shortcuts) {
        const auto current_accelerators = shortcut.accelerators();
        auto preset_entry = base_preset.shortcuts.find(shortcut.storage_key());

        if (preset_entry != base_preset.shortcuts.end()) {
            const auto expected = storable_accelerators(preset_entry->second);
            if (keybind::normalize_accelerators(current_accelerators) != expected) {
                diff[id] = {current_accelerators, std::vector<std::string>(expected.begin(), expected.end())};
            }
            continue;
        }

        // Launchers default to unbound.
        if (shortcut.is_modified()) {
            std::vector<std::string> defaults;
            for (const auto& binding : shortcut.default_bindings) {
                defaults.push_back(binding.to_accelerator());
            }
            diff[id] = {current_accelerators, defaults};
        }
    }
    return diff;
}

AcceleratorDiff ProfileService::get_user_modifications(const Profile& base_preset) {
    return modifications(base_preset, m_backend.load_all_shortcuts());
}

AcceleratorDiff ProfileService::get_user_modifications(const std::string& base_preset_name) {
    auto preset = get_profile(base_preset_name);
    if (!preset) {
        std::cerr << "Unknown preset: " << base_preset_name << std::endl;
        return {};
    }
    return get_user_modifications(*preset);
}

Profile ProfileService::build_modifications_profile(const Profile& base_preset, const ShortcutMap& shortcuts,
                                                    const AcceleratorDiff& diff, const std::string& name,
                                                    const std::string& description) const {
    Profile profile(name.empty() ? "user-mods-" + base_preset.name + "-" + keybind::now_compact_timestamp() : name);
    profile.description = description;
    profile.metadata["base_preset"] = std::string(base_preset.name);
    profile.metadata["type"] = std::string("user-modifications");

    for (const auto& [id, accelerators] : diff) {
        const Shortcut& shortcut = shortcuts.at(id);
        profile.set_shortcut(shortcut.location.schema, shortcut.location.key, accelerators.first);
    }
    return profile;
}

std::optional<Profile> ProfileService::create_modifications_profile(const Profile& base_preset,
                                                                    const std::string& name,
                                                                    const std::string& description) {
    const ShortcutMap shortcuts = m_backend.load_all_shortcuts();
    const AcceleratorDiff diff = modifications(base_preset, shortcuts);
    if (diff.empty()) {
        return std::nullopt;
    }

    return build_modifications_profile(
        base_preset, shortcuts, diff, name,
        description.empty() ? "User modifications from " + base_preset.name + " preset" : description);
}

std::optional<Profile> ProfileService::create_modifications_profile(const std::string& base_preset_name,
                                                                    const std::string& name,
                                                                    const std::string& description) {
    auto preset = get_profile(base_preset_name);
    if (!preset) {
        std::cerr << "Unknown preset: " << base_preset_name << std::endl;
        return std::nullopt;
    }
    return create_modifications_profile(*preset, name, description);
}

std::pair<std::optional<std::string>, int> ProfileService::export_and_clear_modifications(
    const Profile& base_preset) {
    ShortcutMap shortcuts = m_backend.load_all_shortcuts();
    const AcceleratorDiff diff = modifications(base_preset, shortcuts);
    if (diff.empty()) {
        return {std::nullopt, 0};
    }

    Profile exported = build_modifications_profile(
        base_preset, shortcuts, diff, "", "User modifications exported from " + base_preset.name + " preset");
    const int count = static_cast<int>(exported.shortcuts.size());
    const std::string path = save_profile(exported);

    for (const auto& entry : diff) {
        Shortcut& shortcut = shortcuts.at(entry.first);
        if (base_preset.shortcuts.count(shortcut.storage_key())) {
            continue;
        }
        if (!m_backend.reset_shortcut(shortcut)) {
            std::cerr << "Failed to reset shortcut: " << shortcut.id << std::endl;
        }
    }

    apply_profile(base_preset);
    return {path, count};
}

std::pair<std::optional<std::string>, int> ProfileService::export_and_clear_modifications(
    const std::string& base_preset_name) {
    auto preset = get_profile(base_preset_name);
    if (!preset) {
        std::cerr << "Unknown preset: " << base_preset_name << std::endl;
        return {std::nullopt, 0};
    }
    return export_and_clear_modifications(*preset);
}
