#include "core/conflict_detector.hpp"

#include <algorithm>

std::vector<Shortcut> keybind::find_conflicts(const std::map<std::string, Shortcut>& shortcuts,
                                               const KeyBinding& binding, const std::string& exclude_id) {
    std::vector<Shortcut> conflicts;
    for (const auto& [id, shortcut] : shortcuts) {
        if (!exclude_id.empty() && id == exclude_id) {
            continue;
        }
        if (std::find(shortcut.bindings.begin(), shortcut.bindings.end(), binding) != shortcut.bindings.end()) {
            conflicts.push_back(shortcut);
        }
    }
    return conflicts;
}

std::map<std::string, std::vector<std::string>> keybind::find_all_conflicts(
    const std::map<std::string, Shortcut>& shortcuts) {
    std::map<std::string, std::vector<std::string>> owners;
    for (const auto& [id, shortcut] : shortcuts) {
        for (const auto& binding : shortcut.bindings) {
            auto& ids = owners[binding.to_accelerator()];
            if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
                ids.push_back(id);
            }
        }
    }

    for (auto it = owners.begin(); it != owners.end();) {
        if (it->second.size() < 2) {
            it = owners.erase(it);
        } else {
            ++it;
        }
    }
    return owners;
}
