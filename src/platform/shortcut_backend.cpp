#include "platform/shortcut_backend.hpp"

#include "core/conflict_detector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <set>
#include <stdexcept>

namespace {
std::string lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

const std::map<std::string, std::vector<std::string>>& app_type_patterns() {
    static const std::map<std::string, std::vector<std::string>> patterns = {
        {"terminal", {"terminal", "term", "console", "shell"}},
        {"file_manager", {"file", "files", "folder", "nautilus", "thunar", "dolphin", "manager"}},
        {"browser", {"browser", "firefox", "chrome", "chromium", "web", "internet"}},
        {"cheat_sheet", {"cheat", "keybind-settings", "shortcut", "help"}},
        {"music", {"music", "spotify", "player", "rhythmbox", "tidal", "audio"}},
    };
    return patterns;
}

struct DefaultLauncher {
    const char* type;
    const char* name;
    const char* binding;
    const char* missing;
};

constexpr std::array<DefaultLauncher, 4> kDefaultLaunchers = {{
    {"terminal", "Launch Terminal", "<Super>Return", "No terminal found"},
    {"file_manager", "Launch Files", "<Super>e", "No file manager found"},
    {"browser", "Launch Browser", "<Super>b", "No browser found"},
    {"music", "Launch Music", "<Super>p", "No music player found"},
}};
}

std::vector<Shortcut> ShortcutBackend::find_conflicts(const KeyBinding& binding, const std::string& exclude_id) {
    return keybind::find_conflicts(load_all_shortcuts(), binding, exclude_id);
}

std::optional<CustomKeybinding> ShortcutBackend::find_custom_keybinding(const std::string& name) {
    for (auto& binding : get_custom_keybindings()) {
        if (binding.name == name) {
            return binding;
        }
    }
    return std::nullopt;
}

std::optional<CustomKeybinding> ShortcutBackend::find_custom_keybinding_by_type(const std::string& app_type) {
    const auto& patterns = app_type_patterns();
    auto it = patterns.find(app_type);
    if (it == patterns.end()) {
        return std::nullopt;
    }

    for (auto& binding : get_custom_keybindings()) {
        const std::string name = lower_copy(binding.name);
        const std::string command = lower_copy(binding.command);
        for (const auto& term : it->second) {
            if (name.find(term) != std::string::npos || command.find(term) != std::string::npos) {
                return binding;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> ShortcutBackend::detect_app(const std::string& app_type) const {
    if (app_type == "terminal") {
        return detect_terminal();
    }
    if (app_type == "file_manager") {
        return detect_file_manager();
    }
    if (app_type == "browser") {
        return detect_browser();
    }
    if (app_type == "music") {
        return detect_music_player();
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> ShortcutBackend::setup_default_custom_shortcuts() {
    std::vector<std::pair<std::string, std::string>> results;
    for (const auto& launcher : kDefaultLaunchers) {
        const auto command = detect_app(launcher.type);
        if (!command) {
            results.emplace_back(launcher.type, launcher.missing);
            continue;
        }

        auto existing = find_custom_keybinding_by_type(launcher.type);
        if (existing) {
            const bool updated =
                update_custom_keybinding(existing->path, std::nullopt, *command, std::string(launcher.binding));
            results.emplace_back(launcher.type, updated ? "Updated: " + *command : "Failed to update");
            continue;
        }

        auto path = add_custom_keybinding(launcher.name, *command, launcher.binding);
        results.emplace_back(launcher.type, path ? "Added: " + *command : "Failed to add");
    }
    return results;
}

int keybind::lowest_unused_suffix(const std::vector<std::string>& existing, const std::string& prefix) {
    std::set<int> used;
    for (const auto& name : existing) {
        if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const std::string digits = name.substr(prefix.size());
        if (!std::all_of(digits.begin(), digits.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
            continue;
        }
        try {
            used.insert(std::stoi(digits));
        } catch (const std::out_of_range&) {
            continue;
        }
    }

    int candidate = 0;
    while (used.count(candidate)) {
        ++candidate;
    }
    return candidate;
}
