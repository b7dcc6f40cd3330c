#ifndef TESTS_FAKE_BACKEND_HPP
#define TESTS_FAKE_BACKEND_HPP

#include "core/accelerator.hpp"
#include "platform/shortcut_backend.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <vector>

inline Shortcut make_shortcut(const std::string& location, const std::string& key,
                              const std::vector<std::string>& current, const std::vector<std::string>& defaults,
                              bool allow_multiple = false) {
    Shortcut shortcut;
    shortcut.id = location + "." + key;
    shortcut.name = key;
    shortcut.category = "custom";
    shortcut.location = {location, key};
    shortcut.allow_multiple = allow_multiple;
    shortcut.bindings = keybind::parse_accelerators(current);
    shortcut.default_bindings = keybind::parse_accelerators(defaults);
    return shortcut;
}

// In-memory native store. Saves and resets are counted; ids listed in
// failing_saves refuse to be written.
class FakeBackend : public ShortcutBackend {
public:
    void add(const Shortcut& shortcut) { live[shortcut.id] = shortcut; }

    std::vector<std::string> accelerators(const std::string& id) const { return live.at(id).accelerators(); }

    std::string name() const override { return "fake"; }

    std::vector<ShortcutCategory> get_categories() const override {
        return {{"custom", "Custom", "application-x-addon-symbolic", "User-defined shortcuts"}};
    }

    ShortcutMap load_all_shortcuts() override { return live; }

    bool save_shortcut(const Shortcut& shortcut) override {
        auto it = live.find(shortcut.id);
        if (it == live.end() || failing_saves.count(shortcut.id)) {
            return false;
        }
        it->second.bindings = shortcut.bindings;
        ++saves;
        return true;
    }

    bool reset_shortcut(Shortcut& shortcut) override {
        auto it = live.find(shortcut.id);
        if (it == live.end()) {
            return false;
        }
        it->second.reset();
        shortcut.bindings = it->second.bindings;
        ++resets;
        return true;
    }

    std::vector<CustomKeybinding> get_custom_keybindings() override { return customs; }

    std::optional<std::string> add_custom_keybinding(const std::string& name, const std::string& command,
                                                     const std::string& binding) override {
        std::vector<std::string> paths;
        for (const auto& custom : customs) {
            paths.push_back(custom.path);
        }
        const std::string path = "custom" + std::to_string(keybind::lowest_unused_suffix(paths, "custom"));
        customs.push_back({path, name, command, binding});
        return path;
    }

    bool update_custom_keybinding(const std::string& path, const std::optional<std::string>& name,
                                  const std::optional<std::string>& command,
                                  const std::optional<std::string>& binding) override {
        for (auto& custom : customs) {
            if (custom.path != path) {
                continue;
            }
            if (name) {
                custom.name = *name;
            }
            if (command) {
                custom.command = *command;
            }
            if (binding) {
                custom.binding = *binding;
            }
            return true;
        }
        return false;
    }

    bool delete_custom_keybinding(const std::string& path) override {
        auto it = std::find_if(customs.begin(), customs.end(),
                               [&](const CustomKeybinding& custom) { return custom.path == path; });
        if (it == customs.end()) {
            return false;
        }
        customs.erase(it);
        return true;
    }

    std::optional<std::string> detect_terminal() const override { return terminal; }
    std::optional<std::string> detect_file_manager() const override { return file_manager; }
    std::optional<std::string> detect_browser() const override { return browser; }
    std::optional<std::string> detect_music_player() const override { return music_player; }

    ShortcutMap live;
    std::vector<CustomKeybinding> customs;
    std::optional<std::string> terminal;
    std::optional<std::string> file_manager;
    std::optional<std::string> browser;
    std::optional<std::string> music_player;
    std::set<std::string> failing_saves;
    int saves = 0;
    int resets = 0;
};

#endif
