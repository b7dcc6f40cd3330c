#ifndef CORE_CONFLICT_DETECTOR_HPP
#define CORE_CONFLICT_DETECTOR_HPP

#include "core/models.hpp"

#include <map>
#include <string>
#include <vector>

namespace keybind {
// Every shortcut other than exclude_id whose current bindings contain binding.
std::vector<Shortcut> find_conflicts(const std::map<std::string, Shortcut>& shortcuts, const KeyBinding& binding,
                                     const std::string& exclude_id);

// Bindings shared by more than one shortcut, mapped to the ids that share them.
std::map<std::string, std::vector<std::string>> find_all_conflicts(const std::map<std::string, Shortcut>& shortcuts);
}

#endif
