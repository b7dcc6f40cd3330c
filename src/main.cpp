#include "core/errors.hpp"
#include "features/profile_service.hpp"
#include "features/settings_controller.hpp"
#include "platform/desktop_detection.hpp"
#include "platform/gio_settings_store.hpp"

#include <giomm.h>
#include <glibmm.h>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    Gio::init();

    std::string profiles_dir = features::default_profiles_dir();
    std::string presets_dir = features::default_presets_dir();
    Glib::ustring backend_name;
    bool clean_slate = false;
    bool no_clean_slate = false;

    Glib::OptionGroup group("keybind-settings", "Options", "Show keybind-settings options");

    Glib::OptionEntry profiles_entry;
    profiles_entry.set_long_name("profiles-dir");
    profiles_entry.set_description("Directory holding user profiles");
    profiles_entry.set_arg_description("DIR");
    group.add_entry_filename(profiles_entry, profiles_dir);

    Glib::OptionEntry presets_entry;
    presets_entry.set_long_name("presets-dir");
    presets_entry.set_description("Directory holding built-in presets");
    presets_entry.set_arg_description("DIR");
    group.add_entry_filename(presets_entry, presets_dir);

    Glib::OptionEntry backend_entry;
    backend_entry.set_long_name("backend");
    backend_entry.set_description("Shortcut store to use: gnome or kde");
    backend_entry.set_arg_description("NAME");
    group.add_entry(backend_entry, backend_name);

    Glib::OptionEntry clean_entry;
    clean_entry.set_long_name("clean-slate");
    clean_entry.set_description("Disable every other shortcut when applying");
    group.add_entry(clean_entry, clean_slate);

    Glib::OptionEntry no_clean_entry;
    no_clean_entry.set_long_name("no-clean-slate");
    no_clean_entry.set_description("Leave shortcuts the profile does not mention alone");
    group.add_entry(no_clean_entry, no_clean_slate);

    std::ostringstream usage;
    SettingsController::print_usage(usage);

    Glib::OptionContext context("COMMAND [ARGS]");
    context.set_description(usage.str());
    context.set_main_group(group);

    try {
        context.parse(argc, argv);
    } catch (const Glib::OptionError& error) {
        std::cerr << error.what() << std::endl;
        return 2;
    }

    if (clean_slate && no_clean_slate) {
        std::cerr << "--clean-slate and --no-clean-slate are mutually exclusive" << std::endl;
        return 2;
    }
    std::optional<bool> clean_slate_mode;
    if (clean_slate || no_clean_slate) {
        clean_slate_mode = clean_slate;
    }

    std::optional<DesktopEnvironment> forced;
    if (!backend_name.empty()) {
        forced = desktop_from_name(backend_name.raw());
        if (!forced) {
            std::cerr << "Unknown backend: " << backend_name << std::endl;
            return 2;
        }
    }

    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        BackendContext backends(forced);
        ProfileService profiles(backends.backend(), profiles_dir, presets_dir);
        SettingsController controller(backends.backend(), profiles);

        const int status = controller.run(args, clean_slate_mode);
        GioSettingsStore::sync();
        return status;
    } catch (const StorageError& error) {
        std::cerr << error.what() << std::endl;
        return 1;
    }
}
