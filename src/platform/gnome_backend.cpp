#include "platform/gnome_backend.hpp"

#include "core/accelerator.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <utility>

namespace {
bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const char* needle) { return contains(text, needle); });
}

bool starts_with_any(const std::string& text, std::initializer_list<const char*> prefixes) {
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&](const char* prefix) { return starts_with(text, prefix); });
}

bool one_of(const std::string& text, std::initializer_list<const char*> values) {
    return std::any_of(values.begin(), values.end(), [&](const char* value) { return text == value; });
}

const std::map<std::string, std::string>& key_categories() {
    static const std::map<std::string, std::string> table = {
        // Window management
        {"close", "window-management"},
        {"minimize", "window-management"},
        {"maximize", "window-management"},
        {"maximize-horizontally", "window-management"},
        {"maximize-vertically", "window-management"},
        {"unmaximize", "window-management"},
        {"toggle-maximized", "window-management"},
        {"toggle-fullscreen", "window-management"},
        {"always-on-top", "window-management"},
        {"toggle-above", "window-management"},
        {"raise", "window-management"},
        {"lower", "window-management"},
        {"move-to-center", "window-management"},
        {"move-to-corner-nw", "window-management"},
        {"move-to-corner-ne", "window-management"},
        {"move-to-corner-sw", "window-management"},
        {"move-to-corner-se", "window-management"},
        {"move-to-side-n", "window-management"},
        {"move-to-side-s", "window-management"},
        {"move-to-side-e", "window-management"},
        {"move-to-side-w", "window-management"},
        {"begin-move", "window-management"},
        {"begin-resize", "window-management"},
        // Navigation
        {"switch-windows", "navigation"},
        {"switch-windows-backward", "navigation"},
        {"switch-applications", "navigation"},
        {"switch-applications-backward", "navigation"},
        {"switch-group", "navigation"},
        {"switch-group-backward", "navigation"},
        {"cycle-windows", "navigation"},
        {"cycle-windows-backward", "navigation"},
        {"cycle-group", "navigation"},
        {"cycle-group-backward", "navigation"},
        {"switch-to-workspace-left", "navigation"},
        {"switch-to-workspace-right", "navigation"},
        {"switch-to-workspace-up", "navigation"},
        {"switch-to-workspace-down", "navigation"},
        {"switch-to-workspace-last", "navigation"},
        {"move-to-workspace-left", "navigation"},
        {"move-to-workspace-right", "navigation"},
        {"move-to-workspace-up", "navigation"},
        {"move-to-workspace-down", "navigation"},
        {"move-to-workspace-last", "navigation"},
        {"move-to-monitor-left", "navigation"},
        {"move-to-monitor-right", "navigation"},
        {"move-to-monitor-up", "navigation"},
        {"move-to-monitor-down", "navigation"},
        // Shell
        {"toggle-overview", "shell"},
        {"toggle-application-view", "shell"},
        {"toggle-message-tray", "shell"},
        {"focus-active-notification", "shell"},
        {"show-screenshot-ui", "shell"},
        {"show-screen-recording-ui", "shell"},
        {"screenshot", "shell"},
        {"screenshot-window", "shell"},
        {"open-application-menu", "shell"},
        {"switch-input-source", "shell"},
        {"switch-input-source-backward", "shell"},
        // System
        {"screensaver", "system"},
        {"logout", "system"},
        {"power", "system"},
        {"suspend", "system"},
        {"hibernate", "system"},
        {"lock-screen", "system"},
        // Media
        {"play", "media"},
        {"pause", "media"},
        {"stop", "media"},
        {"previous", "media"},
        {"next", "media"},
        {"volume-up", "media"},
        {"volume-down", "media"},
        {"volume-mute", "media"},
        {"mic-mute", "media"},
        {"eject", "media"},
        {"media", "media"},
        // Accessibility
        {"increase-text-size", "accessibility"},
        {"decrease-text-size", "accessibility"},
        {"toggle-contrast", "accessibility"},
        {"magnifier", "accessibility"},
        {"magnifier-zoom-in", "accessibility"},
        {"magnifier-zoom-out", "accessibility"},
        {"screenreader", "accessibility"},
        {"on-screen-keyboard", "accessibility"},
    };
    return table;
}

// Numbered workspace keys 1..10 share one rule instead of twenty table rows.
bool is_numbered_workspace_key(const std::string& key) {
    for (const char* prefix : {"switch-to-workspace-", "move-to-workspace-"}) {
        if (!starts_with(key, prefix)) {
            continue;
        }
        const std::string suffix = key.substr(std::char_traits<char>::length(prefix));
        if (suffix.empty() || suffix.size() > 2) {
            return false;
        }
        if (!std::all_of(suffix.begin(), suffix.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
            return false;
        }
        int number = std::stoi(suffix);
        return number >= 1 && number <= 10;
    }
    return false;
}

std::string capitalize(std::string word) {
    if (!word.empty()) {
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    }
    return word;
}
}

const std::vector<gnome::ShortcutSchema>& gnome::shortcut_schemas() {
    static const std::vector<ShortcutSchema> schemas = {
        {"org.gnome.desktop.wm.keybindings", "window-management"},
        {"org.gnome.shell.keybindings", "shell"},
        {"org.gnome.settings-daemon.plugins.media-keys", "media"},
        {"org.gnome.mutter.keybindings", "window-management"},
        {"org.gnome.mutter.wayland.keybindings", "window-management"},
        {"org.gnome.shell.extensions.tiling-assistant", "tiling"},
    };
    return schemas;
}

const std::vector<ShortcutCategory>& gnome::categories() {
    static const std::vector<ShortcutCategory> table = {
        {"tiling", "Tiling", "view-grid-symbolic", "Snap and tile windows"},
        {"window-management", "Window Management", "preferences-system-windows-symbolic",
         "Move, resize, and manage windows"},
        {"navigation", "Navigation", "go-home-symbolic", "Navigate between workspaces and windows"},
        {"shell", "Shell", "view-app-grid-symbolic", "GNOME Shell functions"},
        {"media", "Media", "multimedia-player-symbolic", "Media playback and volume controls"},
        {"accessibility", "Accessibility", "preferences-desktop-accessibility-symbolic", "Accessibility features"},
        {"system", "System", "preferences-system-symbolic", "System functions like lock screen and power"},
        {"custom", "Custom", "application-x-addon-symbolic", "User-defined shortcuts"},
    };
    return table;
}

bool gnome::is_shortcut_key(const std::string& key, const SettingKeyInfo& info) {
    if (contains_any(key, {"-ignore-ta", "-color", "-size", "-mode", "-behavior", "-rects", "enable-", "disable-",
                           "default-", "debugging-", "dynamic-", "favorite-", "active-window-hint", "adapt-",
                           "low-performance", "restore-window-size"})) {
        return false;
    }

    if (info.type != "as" && info.type != "s") {
        return false;
    }

    if (info.type == "as" && info.default_value.type == "as") {
        const auto& values = info.default_value.strings;
        bool plausible = std::any_of(values.begin(), values.end(), [](const std::string& value) {
            return starts_with(value, "<") || starts_with(value, "XF86") || value == "disabled" || value.empty() ||
                   value.size() <= 3;
        });
        if (!values.empty() && !plausible) {
            return false;
        }
    }

    return true;
}

std::string gnome::key_category(const std::string& key) {
    const auto& table = key_categories();
    auto it = table.find(key);
    if (it != table.end()) {
        return it->second;
    }
    if (is_numbered_workspace_key(key)) {
        return "navigation";
    }

    if (starts_with_any(key, {"switch-to-", "move-to-", "switch-"})) {
        return "navigation";
    }
    if (starts_with_any(key, {"volume-", "mic-", "media-"})) {
        return "media";
    }
    if (starts_with_any(key, {"toggle-", "show-"})) {
        return "shell";
    }
    if (starts_with_any(key, {"begin-", "maximize", "minimize", "close", "raise", "lower"})) {
        return "window-management";
    }
    return "custom";
}

std::string gnome::shortcut_group(const std::string& key) {
    if (ends_with(key, "-ignore-ta")) {
        return "Internal";
    }

    if (contains_any(key, {"left-half", "right-half", "top-half", "bottom-half", "toggle-tiled-left",
                           "toggle-tiled-right"})) {
        return "Tile Halves";
    }
    if (contains_any(key, {"quarter", "corner"})) {
        return "Tile Quarters";
    }
    if (starts_with(key, "activate-layout")) {
        return "Layouts";
    }
    if (one_of(key, {"tile-maximize", "tile-maximize-horizontally", "tile-maximize-vertically", "center-window",
                     "restore-window", "tile-edit-mode", "auto-tile"})) {
        return "Tile Actions";
    }

    if (starts_with(key, "switch-to-workspace")) {
        return "Switch Workspace";
    }
    if (starts_with(key, "move-to-workspace")) {
        return "Move to Workspace";
    }
    if (starts_with(key, "move-to-monitor")) {
        return "Move to Monitor";
    }
    if (starts_with_any(key, {"switch-", "cycle-"})) {
        return "Switch Windows";
    }

    if (starts_with(key, "move-to-side")) {
        return "Tile Halves";
    }
    if (starts_with(key, "move-to-corner") || key == "move-to-center") {
        return "Tile Quarters";
    }

    if (one_of(key, {"maximize", "minimize", "unmaximize", "toggle-maximized", "maximize-horizontally",
                     "maximize-vertically", "toggle-fullscreen"})) {
        return "Window State";
    }
    if (one_of(key, {"close", "always-on-top", "toggle-above", "raise", "lower", "begin-move", "begin-resize"})) {
        return "Window Actions";
    }

    if (starts_with(key, "volume-") || key == "mic-mute") {
        return "Volume";
    }

    const std::string base_key = ends_with(key, "-static") ? key.substr(0, key.size() - 7) : key;
    if (one_of(base_key, {"play", "pause", "stop", "previous", "next", "media", "eject"}) ||
        starts_with(base_key, "playback-")) {
        return "Playback";
    }

    if (contains(key, "screenshot") || contains(key, "screen-recording")) {
        return "Screenshots";
    }
    if (starts_with_any(key, {"toggle-", "show-"})) {
        return "Shell Actions";
    }
    if (one_of(key, {"screensaver", "logout", "power", "suspend", "hibernate", "lock-screen"})) {
        return "System";
    }
    if (contains_any(key, {"magnifier", "screenreader", "text-size", "contrast", "keyboard"})) {
        return "Accessibility";
    }
    if (contains(key, "input-source")) {
        return "Input";
    }

    return "Other";
}

std::string gnome::humanize_key_name(const std::string& key) {
    std::string name = key;
    if (ends_with(name, "-static")) {
        name = name.substr(0, name.size() - 7);
    }

    static const std::map<std::string, std::string> media_names = {
        {"next", "Next Track"},
        {"previous", "Previous Track"},
        {"play", "Play/Pause"},
        {"pause", "Pause"},
        {"stop", "Stop"},
        {"eject", "Eject"},
        {"playback-forward", "Fast Forward"},
        {"playback-rewind", "Rewind"},
        {"playback-random", "Shuffle"},
        {"playback-repeat", "Repeat"},
    };
    auto media = media_names.find(name);
    if (media != media_names.end()) {
        return media->second;
    }

    // Redundant with the group header.
    for (const char* prefix : {"switch-to-workspace-", "move-to-workspace-", "switch-to-", "move-to-", "switch-",
                               "toggle-tiled-", "toggle-", "begin-", "cycle-", "volume-", "show-", "tile-",
                               "activate-"}) {
        if (starts_with(name, prefix)) {
            name = name.substr(std::char_traits<char>::length(prefix));
            break;
        }
    }

    if (ends_with(name, "-ignore-ta")) {
        return "";
    }

    static const std::map<std::string, std::string> tiling_names = {
        {"left-half", "Left Half"},
        {"right-half", "Right Half"},
        {"top-half", "Top Half"},
        {"bottom-half", "Bottom Half"},
        {"topleft-quarter", "Top Left"},
        {"topright-quarter", "Top Right"},
        {"bottomleft-quarter", "Bottom Left"},
        {"bottomright-quarter", "Bottom Right"},
        {"maximize", "Maximize"},
        {"maximize-horizontally", "Maximize Horizontal"},
        {"maximize-vertically", "Maximize Vertical"},
        {"center-window", "Center Window"},
        {"restore-window", "Restore Window"},
        {"edit-mode", "Edit Mode"},
    };
    auto tiling = tiling_names.find(name);
    if (tiling != tiling_names.end()) {
        return tiling->second;
    }

    // layout0..layout19 -> Layout 1..Layout 20
    if (starts_with(name, "layout") && name.size() > 6) {
        const std::string digits = name.substr(6);
        if (std::all_of(digits.begin(), digits.end(), [](unsigned char ch) { return std::isdigit(ch); }) &&
            digits.size() < 9) {
            return "Layout " + std::to_string(std::stoi(digits) + 1);
        }
    }

    std::replace(name.begin(), name.end(), '-', ' ');
    std::replace(name.begin(), name.end(), '_', ' ');

    std::string humanized;
    size_t pos = 0;
    while (pos < name.size()) {
        size_t start = name.find_first_not_of(' ', pos);
        if (start == std::string::npos) {
            break;
        }
        size_t end = name.find(' ', start);
        std::string word = name.substr(start, end == std::string::npos ? std::string::npos : end - start);
        pos = end == std::string::npos ? name.size() : end;

        if (!humanized.empty()) {
            humanized += ' ';
            humanized += word.size() <= 2 ? word : capitalize(word);
        } else {
            humanized += capitalize(word);
        }
    }
    return humanized;
}

std::vector<KeyBinding> gnome::parse_binding_value(const SettingValue& value) {
    std::vector<KeyBinding> bindings;
    if (value.type != "as" && value.type != "s") {
        return bindings;
    }

    for (const auto& accelerator : value.strings) {
        if (accelerator.empty() || accelerator == keybind::DISABLED_ACCELERATOR) {
            continue;
        }
        auto binding = keybind::parse_accelerator(accelerator);
        if (!binding) {
            std::cerr << "Ignoring unparsable accelerator: " << accelerator << '\n';
            continue;
        }
        bindings.push_back(*binding);
    }
    return bindings;
}

GnomeBackend::GnomeBackend(std::shared_ptr<SettingsStore> store)
    : m_store(std::move(store)) {}

std::vector<ShortcutCategory> GnomeBackend::get_categories() const {
    return gnome::categories();
}

ShortcutMap GnomeBackend::load_all_shortcuts() {
    ShortcutMap shortcuts;

    for (const auto& schema_info : gnome::shortcut_schemas()) {
        const std::string& schema_id = schema_info.schema;
        if (!m_store->has_schema(schema_id)) {
            continue;
        }

        for (const auto& key : m_store->list_keys(schema_id)) {
            // The launcher path list, not a binding.
            if (schema_id == gnome::CUSTOM_SCHEMA && key == gnome::CUSTOM_LIST_KEY) {
                continue;
            }

            auto info = m_store->key_info(schema_id, key);
            if (!info || !gnome::is_shortcut_key(key, *info)) {
                continue;
            }

            std::string name = gnome::humanize_key_name(key);
            if (name.empty()) {
                continue;
            }
            std::string group = gnome::shortcut_group(key);
            if (group == "Internal") {
                continue;
            }

            auto current = m_store->get_value(schema_id, "", key);

            std::string category = gnome::key_category(key);
            if (category == "custom") {
                category = schema_info.category;
            }

            Shortcut shortcut;
            shortcut.id = schema_id + "." + key;
            shortcut.name = std::move(name);
            shortcut.description = info->description;
            shortcut.category = std::move(category);
            shortcut.group = std::move(group);
            shortcut.location = {schema_id, key};
            shortcut.bindings = current ? gnome::parse_binding_value(*current) : std::vector<KeyBinding>{};
            shortcut.default_bindings = gnome::parse_binding_value(info->default_value);
            shortcut.allow_multiple = current && current->type == "as";

            shortcuts.emplace(shortcut.id, std::move(shortcut));
        }
    }

    for (auto& [id, shortcut] : load_custom_shortcuts()) {
        shortcuts[id] = std::move(shortcut);
    }

    return shortcuts;
}

ShortcutMap GnomeBackend::load_custom_shortcuts() {
    ShortcutMap shortcuts;

    for (const auto& custom : get_custom_keybindings()) {
        Shortcut shortcut;
        shortcut.id = keybind::CUSTOM_ID_PREFIX + custom.path;
        shortcut.name = custom.name.empty() ? "Custom Shortcut" : custom.name;
        shortcut.description = custom.command;
        shortcut.category = "custom";
        shortcut.group = "Launchers";
        shortcut.location = {keybind::CUSTOM_LOCATION, custom.path};
        if (auto binding = keybind::parse_accelerator(custom.binding)) {
            shortcut.bindings.push_back(*binding);
        }

        shortcuts.emplace(shortcut.id, std::move(shortcut));
    }

    return shortcuts;
}

bool GnomeBackend::save_shortcut(const Shortcut& shortcut) {
    const auto accelerators = shortcut.accelerators();

    if (shortcut.is_custom()) {
        return update_custom_keybinding(shortcut.location.key, std::nullopt, std::nullopt,
                                        accelerators.empty() ? std::string() : accelerators.front());
    }

    auto info = m_store->key_info(shortcut.location.schema, shortcut.location.key);
    if (!info) {
        return false;
    }

    SettingValue value;
    if (info->type == "as") {
        value = SettingValue::string_list(accelerators.empty()
                                              ? std::vector<std::string>{keybind::DISABLED_ACCELERATOR}
                                              : accelerators);
    } else if (info->type == "s") {
        value = SettingValue::string(accelerators.empty() ? keybind::DISABLED_ACCELERATOR : accelerators.front());
    } else {
        return false;
    }

    return m_store->set_value(shortcut.location.schema, "", shortcut.location.key, value);
}

bool GnomeBackend::reset_shortcut(Shortcut& shortcut) {
    if (shortcut.is_custom()) {
        if (!update_custom_keybinding(shortcut.location.key, std::nullopt, std::nullopt, std::string())) {
            return false;
        }
        shortcut.reset();
        return true;
    }

    if (!m_store->reset(shortcut.location.schema, "", shortcut.location.key)) {
        return false;
    }

    auto value = m_store->get_value(shortcut.location.schema, "", shortcut.location.key);
    if (value) {
        shortcut.bindings = gnome::parse_binding_value(*value);
    } else {
        shortcut.reset();
    }
    return true;
}

std::vector<std::string> GnomeBackend::custom_paths() const {
    auto value = m_store->get_value(gnome::CUSTOM_SCHEMA, "", gnome::CUSTOM_LIST_KEY);
    if (!value || value->type != "as") {
        return {};
    }
    return value->strings;
}

std::vector<CustomKeybinding> GnomeBackend::get_custom_keybindings() {
    std::vector<CustomKeybinding> result;

    for (const auto& path : custom_paths()) {
        auto name = m_store->get_value(gnome::CUSTOM_BINDING_SCHEMA, path, "name");
        auto command = m_store->get_value(gnome::CUSTOM_BINDING_SCHEMA, path, "command");
        auto binding = m_store->get_value(gnome::CUSTOM_BINDING_SCHEMA, path, "binding");
        if (!name || !command || !binding) {
            std::cerr << "Skipping unreadable custom keybinding: " << path << '\n';
            continue;
        }

        CustomKeybinding custom;
        custom.path = path;
        custom.name = name->strings.empty() ? "" : name->strings.front();
        custom.command = command->strings.empty() ? "" : command->strings.front();
        custom.binding = binding->strings.empty() ? "" : binding->strings.front();
        result.push_back(std::move(custom));
    }

    return result;
}

std::optional<std::string> GnomeBackend::add_custom_keybinding(const std::string& name, const std::string& command,
                                                               const std::string& binding) {
    if (!m_store->has_schema(gnome::CUSTOM_SCHEMA)) {
        return std::nullopt;
    }

    auto paths = custom_paths();
    std::vector<std::string> entry_names;
    for (const auto& path : paths) {
        std::string trimmed = path;
        while (!trimmed.empty() && trimmed.back() == '/') {
            trimmed.pop_back();
        }
        entry_names.push_back(trimmed.substr(trimmed.rfind('/') + 1));
    }

    const int number = keybind::lowest_unused_suffix(entry_names, "custom");
    const std::string new_path = std::string(gnome::CUSTOM_PATH_PREFIX) + "/custom" + std::to_string(number) + "/";

    if (!m_store->set_value(gnome::CUSTOM_BINDING_SCHEMA, new_path, "name", SettingValue::string(name)) ||
        !m_store->set_value(gnome::CUSTOM_BINDING_SCHEMA, new_path, "command", SettingValue::string(command)) ||
        !m_store->set_value(gnome::CUSTOM_BINDING_SCHEMA, new_path, "binding", SettingValue::string(binding))) {
        std::cerr << "Failed to write custom keybinding: " << new_path << '\n';
        return std::nullopt;
    }

    paths.push_back(new_path);
    if (!m_store->set_value(gnome::CUSTOM_SCHEMA, "", gnome::CUSTOM_LIST_KEY, SettingValue::string_list(paths))) {
        return std::nullopt;
    }
    return new_path;
}

bool GnomeBackend::update_custom_keybinding(const std::string& path,
                                            const std::optional<std::string>& name,
                                            const std::optional<std::string>& command,
                                            const std::optional<std::string>& binding) {
    auto paths = custom_paths();
    if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
        return false;
    }

    bool ok = true;
    if (name) {
        ok = m_store->set_value(gnome::CUSTOM_BINDING_SCHEMA, path, "name", SettingValue::string(*name)) && ok;
    }
    if (command) {
        ok = m_store->set_value(gnome::CUSTOM_BINDING_SCHEMA, path, "command", SettingValue::string(*command)) && ok;
    }
    if (binding) {
        ok = m_store->set_value(gnome::CUSTOM_BINDING_SCHEMA, path, "binding", SettingValue::string(*binding)) && ok;
    }
    return ok;
}

bool GnomeBackend::delete_custom_keybinding(const std::string& path) {
    auto paths = custom_paths();
    auto it = std::find(paths.begin(), paths.end(), path);
    if (it == paths.end()) {
        return false;
    }

    for (const char* key : {"name", "command", "binding"}) {
        if (!m_store->reset(gnome::CUSTOM_BINDING_SCHEMA, path, key)) {
            std::cerr << "Failed to reset " << key << " of custom keybinding: " << path << '\n';
        }
    }

    paths.erase(it);
    return m_store->set_value(gnome::CUSTOM_SCHEMA, "", gnome::CUSTOM_LIST_KEY, SettingValue::string_list(paths));
}

std::optional<std::string> GnomeBackend::detect_terminal() const {
    static const std::vector<apps::Candidate> terminals = {
        {"ghostty", "ghostty"},
        {"kitty", "kitty"},
        {"alacritty", "alacritty"},
        {"wezterm", "wezterm start"},
        {"foot", "foot"},
        {"gnome-terminal", "gnome-terminal"},
        {"kgx", "kgx"},
        {"tilix", "tilix"},
        {"terminator", "terminator"},
        {"xfce4-terminal", "xfce4-terminal"},
        {"konsole", "konsole --new-tab"},
        {"xterm", "xterm"},
        {"x-terminal-emulator", "x-terminal-emulator"},
    };
    return apps::first_installed(system_environment(), terminals);
}

std::optional<std::string> GnomeBackend::detect_file_manager() const {
    static const std::vector<apps::DefaultMatch> defaults = {
        {"nautilus", "nautilus --new-window"},
        {"thunar", "thunar"},
        {"dolphin", "dolphin --new-window"},
        {"nemo", "nemo --new-window"},
        {"pcmanfm", "pcmanfm --new-win"},
        {"caja", "caja --new-window"},
    };
    static const std::vector<apps::Candidate> installed = {
        {"nautilus", "nautilus --new-window"},
        {"thunar", "thunar"},
        {"dolphin", "dolphin --new-window"},
        {"nemo", "nemo --new-window"},
        {"pcmanfm", "pcmanfm --new-win"},
        {"caja", "caja --new-window"},
    };

    if (auto command = apps::match_default(system_environment(), "xdg-mime query default inode/directory", defaults)) {
        return command;
    }
    return apps::first_installed(system_environment(), installed);
}

std::optional<std::string> GnomeBackend::detect_browser() const {
    static const std::vector<apps::DefaultMatch> defaults = {
        {"firefox", "firefox --new-window"},
        {"chrome", apps::GOOGLE_CHROME},
        {"chromium", apps::GOOGLE_CHROME},
        {"brave", "brave --new-window"},
        {"vivaldi", "vivaldi --new-window"},
        {"epiphany", "epiphany --new-window"},
        {"gnome-web", "epiphany --new-window"},
        {"zen", "zen-browser --new-window"},
    };
    static const std::vector<apps::Candidate> installed = {
        {"firefox", "firefox --new-window"},
        {"google-chrome", apps::GOOGLE_CHROME},
        {"google-chrome-stable", "google-chrome-stable --new-window"},
        {"chromium", apps::CHROMIUM},
        {"chromium-browser", "chromium-browser --new-window"},
        {"brave-browser", "brave-browser --new-window"},
        {"vivaldi", "vivaldi --new-window"},
        {"epiphany", "epiphany --new-window"},
        {"zen-browser", "zen-browser --new-window"},
    };

    if (auto command = apps::default_browser(system_environment(), defaults)) {
        return command;
    }
    return apps::first_installed(system_environment(), installed);
}

std::optional<std::string> GnomeBackend::detect_music_player() const {
    static const std::vector<apps::Candidate> players = {
        {"rhythmbox", "rhythmbox"},
        {"gnome-music", "gnome-music"},
        {"lollypop", "lollypop"},
        {"elisa", "elisa"},
        {"audacious", "audacious"},
        {"clementine", "clementine"},
        {"strawberry", "strawberry"},
        {"amberol", "amberol"},
    };

    const apps::SystemEnvironment& env = system_environment();
    if (auto spotify = apps::flatpak_app(env, "com.spotify.Client")) {
        return spotify;
    }
    if (env.has_program("spotify")) {
        return std::string("spotify");
    }
    if (auto tidal = apps::flatpak_app(env, "com.mastermindzh.tidal-hifi")) {
        return tidal;
    }
    return apps::first_installed(env, players);
}
