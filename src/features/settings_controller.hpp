#ifndef SETTINGS_CONTROLLER_HPP
#define SETTINGS_CONTROLLER_HPP

#include "features/profile_service.hpp"
#include "platform/shortcut_backend.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Command-line front end over one backend and its profile service. Every
// command writes its report to the given stream and returns false when it
// could not do what was asked.
class SettingsController {
public:
    SettingsController(ShortcutBackend& backend, ProfileService& profiles, std::ostream& out = std::cout);

    // args[0] is the command name. Returns the process exit status.
    int run(const std::vector<std::string>& args, std::optional<bool> clean_slate = std::nullopt);

    static void print_usage(std::ostream& out);

    bool list_shortcuts() const;
    bool list_categories() const;
    bool list_profiles() const;
    bool show_profile(const std::string& name) const;
    bool diff_profile(const std::string& name) const;
    bool apply_profile(const std::string& name, std::optional<bool> clean_slate) const;
    bool switch_profile(const std::string& old_name, const std::string& new_name,
                        std::optional<bool> clean_slate) const;
    bool save_current(const std::string& name, const std::string& description) const;
    bool show_conflicts(const std::string& accelerator, const std::string& exclude_id) const;
    bool show_all_conflicts() const;
    bool show_modifications(const std::string& preset_name) const;
    bool export_modifications(const std::string& preset_name) const;
    bool reset_shortcut(const std::string& id) const;
    bool list_custom() const;
    bool add_custom(const std::string& name, const std::string& command, const std::string& accelerator) const;
    bool delete_custom(const std::string& path) const;
    bool setup_launchers() const;

private:
    void print_diff(const AcceleratorDiff& diff, const char* other_label) const;
    void print_changes(const std::map<std::string, Shortcut>& changed) const;

    ShortcutBackend& m_backend;
    ProfileService& m_profiles;
    std::ostream& m_out;
};

#endif
