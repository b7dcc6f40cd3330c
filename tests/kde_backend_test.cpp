#include "platform/kde_backend.hpp"

#include "core/errors.hpp"
#include "features/profile_service.hpp"
#include "temp_dir.hpp"

#include <gdk/gdk.h>

#include <cassert>
#include <fstream>
#include <sstream>
#include <string>

namespace {
const std::string kConfig =
    "[kwin]\n"
    "_k_friendly_name=KWin\n"
    "Window Close=Alt+F4,Alt+F4,Close Window\n"
    "Window Maximize=Meta+PgUp,Meta+PgUp,Maximize Window\n"
    "Expose=Ctrl+F9\tMeta+Tab,Ctrl+F9,Toggle Present Windows (Current desktop)\n"
    "Show Desktop=none,none,Peek at Desktop\n"
    "Walk Through Windows=Alt+Tab\\tMeta+Tab,Alt+Tab\\tMeta+Tab,Walk Through Windows\n"
    "\n"
    "[kmix]\n"
    "increase_volume=Volume Up,Volume Up,Increase Volume\n"
    "\n"
    "[plasmashell]\n"
    "activate task manager entry 1=Meta+1,Meta+1,Activate Task Manager Entry 1\n"
    "\n"
    "[khotkeys]\n"
    "custom0=Meta+Return,none,Launch Terminal\n";

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool file_contains(const std::string& path, const std::string& line) {
    return read_file(path).find(line + "\n") != std::string::npos;
}
}

int main() {
    {
        auto value = kde::parse_shortcut_value("Meta+Return,none,Launch Terminal");
        assert(value.current == "Meta+Return");
        assert(value.default_value == "none");
        assert(value.description == "Launch Terminal");

        auto with_comma = kde::parse_shortcut_value("Meta+E,Meta+E,Dolphin, the file manager");
        assert(with_comma.description == "Dolphin, the file manager");
        assert(kde::format_shortcut_value(with_comma) == "Meta+E,Meta+E,Dolphin, the file manager");

        auto bare = kde::parse_shortcut_value("Alt+F4");
        assert(bare.current == "Alt+F4");
        assert(bare.default_value.empty());
        assert(bare.description.empty());
    }

    {
        assert(kde::parse_shortcut("Meta+Return") == KeyBinding(GDK_KEY_Return, Modifier::Super));
        assert(kde::parse_shortcut("Ctrl+Alt+T") == KeyBinding(GDK_KEY_t, Modifier::Ctrl | Modifier::Alt));
        assert(kde::parse_shortcut("Ctrl++") == KeyBinding(GDK_KEY_plus, Modifier::Ctrl));
        assert(kde::parse_shortcut("Meta+PgUp") == KeyBinding(GDK_KEY_Page_Up, Modifier::Super));
        assert(kde::parse_shortcut("Enter") == KeyBinding(GDK_KEY_KP_Enter));
        assert(kde::parse_shortcut("Volume Up") == KeyBinding(GDK_KEY_XF86AudioRaiseVolume));
        assert(kde::parse_shortcut("Print\tCtrl+Print") == KeyBinding(GDK_KEY_Print));
        assert(kde::parse_shortcut("Ctrl+F9\\tMeta+Tab") == KeyBinding(GDK_KEY_F9, Modifier::Ctrl));
        assert(kde::parse_shortcut("Alt+Tab\\tAlt+Shift+Tab") == KeyBinding(GDK_KEY_Tab, Modifier::Alt));
        assert(!kde::parse_shortcut("none"));
        assert(!kde::parse_shortcut(""));
        assert(!kde::parse_shortcut("Hyper+X"));
        assert(!kde::parse_shortcut("Ctrl+"));
        assert(!kde::parse_shortcut("Meta+NoSuchKey"));

        assert(kde::to_canonical_accelerator("Meta+Shift+Ctrl+Alt+A") == std::string("<Shift><Control><Alt><Super>a"));
        assert(!kde::to_canonical_accelerator("none"));
    }

    {
        assert(kde::format_shortcut(KeyBinding(GDK_KEY_Return, Modifier::Super)) == "Meta+Return");
        assert(kde::format_shortcut(KeyBinding(GDK_KEY_a, Modifier::Shift | Modifier::Ctrl | Modifier::Alt |
                                                              Modifier::Super)) == "Meta+Ctrl+Alt+Shift+A");
        assert(kde::format_shortcut(KeyBinding(GDK_KEY_Page_Down)) == "PgDown");
        assert(kde::format_shortcut(KeyBinding(GDK_KEY_plus, Modifier::Ctrl)) == "Ctrl++");

        assert(kde::from_canonical_accelerator("<Super><Shift>t") == "Meta+Shift+T");
        assert(kde::from_canonical_accelerator("<Meta>x") == "Meta+X");
        assert(kde::from_canonical_accelerator("<Hyper>x") == "X");

        assert(kde::storable_binding(KeyBinding(GDK_KEY_x, Modifier::Meta)) == KeyBinding(GDK_KEY_x, Modifier::Super));
        assert(kde::storable_binding(KeyBinding(GDK_KEY_x, Modifier::Hyper | Modifier::Ctrl)) ==
               KeyBinding(GDK_KEY_x, Modifier::Ctrl));
        assert(kde::storable_binding(KeyBinding(GDK_KEY_x, Modifier::Shift | Modifier::Alt)) ==
               KeyBinding(GDK_KEY_x, Modifier::Shift | Modifier::Alt));
        assert(kde::from_canonical_accelerator("") == "none");
        assert(kde::from_canonical_accelerator("garbage<") == "none");
    }

    {
        assert(kde::component_category("kwin") == "kwin");
        assert(kde::component_category("KWin") == "kwin");
        assert(kde::component_category("kmix") == "media");
        assert(kde::component_category("org_kde_powerdevil") == "plasma");
        assert(kde::component_category("org.kde.konsole.desktop") == "apps");
        assert(kde::component_category("org.example.unknown") == "apps");

        assert(kde::humanize_key("increase_volume") == "Increase Volume");
        assert(kde::humanize_key("view-zoom-in") == "View Zoom In");
        assert(kde::humanize_key("activate task manager entry 1") == "Activate Task Manager Entry 1");

        assert(kde::categories().size() == 5);
    }

    {
        TempDir dir;
        const std::string path = dir.file("kglobalshortcutsrc");
        write_file(path, kConfig);

        int reloads = 0;
        KdeBackend backend(path, [&reloads] { ++reloads; });
        assert(backend.name() == "kde");
        assert(backend.config_path() == path);

        ShortcutMap shortcuts = backend.load_all_shortcuts();
        assert(shortcuts.size() == 8);
        assert(!shortcuts.count("kwin._k_friendly_name"));
        assert(!shortcuts.count("khotkeys.custom0"));

        const Shortcut& close = shortcuts.at("kwin.Window Close");
        assert(close.name == "Window Close");
        assert(close.description == "Close Window");
        assert(close.category == "kwin");
        assert(close.group == "kwin");
        assert(close.location.schema == "kwin" && close.location.key == "Window Close");
        assert(close.accelerator() == "<Alt>F4");
        assert(!close.is_modified());

        assert(shortcuts.at("kwin.Expose").accelerators() == std::vector<std::string>{"<Control>F9"});
        assert(shortcuts.at("kwin.Show Desktop").bindings.empty());
        const Shortcut& walk = shortcuts.at("kwin.Walk Through Windows");
        assert(walk.accelerators() == std::vector<std::string>{"<Alt>Tab"});
        assert(walk.default_bindings == std::vector<KeyBinding>{KeyBinding(GDK_KEY_Tab, Modifier::Alt)});
        assert(!walk.is_modified());
        assert(shortcuts.at("kwin.Show Desktop").default_bindings.empty());
        assert(shortcuts.at("kmix.increase_volume").name == "Increase Volume");
        assert(shortcuts.at("kmix.increase_volume").category == "media");
        assert(shortcuts.at("plasmashell.activate task manager entry 1").category == "plasma");

        const Shortcut& launcher = shortcuts.at("custom:khotkeys/custom0");
        assert(launcher.is_custom());
        assert(launcher.name == "Launch Terminal");
        assert(launcher.category == "custom");
        assert(launcher.group == "Launchers");
        assert(launcher.accelerator() == "<Super>Return");

        auto conflicts = backend.find_conflicts(KeyBinding(GDK_KEY_Return, Modifier::Super), "");
        assert(conflicts.size() == 1);
        assert(conflicts.front().id == "custom:khotkeys/custom0");
        assert(reloads == 0);
    }

    {
        TempDir dir;
        const std::string path = dir.file("kglobalshortcutsrc");
        write_file(path, kConfig);

        int reloads = 0;
        KdeBackend backend(path, [&reloads] { ++reloads; });
        ShortcutMap shortcuts = backend.load_all_shortcuts();

        Shortcut close = shortcuts.at("kwin.Window Close");
        close.set_binding(KeyBinding(GDK_KEY_q, Modifier::Super));
        assert(backend.save_shortcut(close));
        assert(reloads == 1);
        assert(file_contains(path, "Window Close=Meta+Q,Alt+F4,Close Window"));
        assert(file_contains(path, "_k_friendly_name=KWin"));
        assert(backend.load_all_shortcuts().at("kwin.Window Close").is_modified());

        close.bindings.clear();
        assert(backend.save_shortcut(close));
        assert(file_contains(path, "Window Close=none,Alt+F4,Close Window"));

        assert(backend.reset_shortcut(close));
        assert(close.accelerator() == "<Alt>F4");
        assert(file_contains(path, "Window Close=Alt+F4,Alt+F4,Close Window"));
        assert(reloads == 3);

        Shortcut missing_key = close;
        missing_key.location.key = "Window Shade";
        assert(!backend.save_shortcut(missing_key));
        assert(!backend.reset_shortcut(missing_key));
        Shortcut missing_section = close;
        missing_section.location.schema = "kded6";
        assert(!backend.save_shortcut(missing_section));
        assert(!backend.reset_shortcut(missing_section));
        assert(reloads == 3);
        assert(read_file(path).find("[kded6]") == std::string::npos);
    }

    {
        TempDir dir;
        const std::string path = dir.file("kglobalshortcutsrc");
        write_file(path, kConfig);

        int reloads = 0;
        KdeBackend backend(path, [&reloads] { ++reloads; });

        auto customs = backend.get_custom_keybindings();
        assert(customs.size() == 1);
        assert(customs[0].path == "khotkeys/custom0");
        assert(customs[0].name == "Launch Terminal");
        assert(customs[0].command.empty());
        assert(customs[0].binding == "<Super>Return");

        auto browser = backend.add_custom_keybinding("Browser", "firefox", "<Super>b");
        assert(browser && *browser == "khotkeys/custom1");
        assert(file_contains(path, "custom1=Meta+B,none,Browser"));

        assert(backend.update_custom_keybinding("khotkeys/custom0", std::string("Console"), std::nullopt,
                                                std::nullopt));
        assert(file_contains(path, "custom0=Meta+Return,none,Console"));
        assert(backend.update_custom_keybinding("khotkeys/custom0", std::nullopt, std::nullopt, std::string()));
        assert(file_contains(path, "custom0=none,none,Console"));
        assert(!backend.update_custom_keybinding("khotkeys/custom9", std::string("Nope"), std::nullopt, std::nullopt));
        assert(!backend.update_custom_keybinding("khotkeys", std::string("Nope"), std::nullopt, std::nullopt));

        ShortcutMap shortcuts = backend.load_all_shortcuts();
        Shortcut launcher = shortcuts.at("custom:khotkeys/custom1");
        launcher.set_binding(KeyBinding(GDK_KEY_w, Modifier::Super | Modifier::Shift));
        assert(backend.save_shortcut(launcher));
        assert(file_contains(path, "custom1=Meta+Shift+W,none,Browser"));

        assert(backend.delete_custom_keybinding("khotkeys/custom0"));
        assert(!backend.delete_custom_keybinding("khotkeys/custom0"));
        assert(!backend.delete_custom_keybinding("custom0"));

        auto again = backend.add_custom_keybinding("Files", "", "<Super>e");
        assert(again && *again == "khotkeys/custom0");
        assert(backend.get_custom_keybindings().size() == 2);
        assert(reloads == 6);
    }

    {
        TempDir dir;
        const std::string path = dir.file("kglobalshortcutsrc");
        KdeBackend backend(path, nullptr);
        assert(backend.load_all_shortcuts().empty());
        assert(backend.get_custom_keybindings().empty());

        auto created = backend.add_custom_keybinding("Terminal", "", "<Super>t");
        assert(created && *created == "khotkeys/custom0");
        assert(read_file(path) == "[khotkeys]\ncustom0=Meta+T,none,Terminal\n");
    }

    {
        KdeBackend backend("/no/such/dir/kglobalshortcutsrc", nullptr);
        bool threw = false;
        try {
            backend.add_custom_keybinding("Terminal", "", "<Super>t");
        } catch (const StorageError&) {
            threw = true;
        }
        assert(threw);
    }

    {
        TempDir dir;
        const std::string path = dir.file("kglobalshortcutsrc");
        write_file(path, kConfig);

        int reloads = 0;
        KdeBackend backend(path, [&reloads] { ++reloads; });
        assert(backend.storable_binding(KeyBinding(GDK_KEY_x, Modifier::Meta)) ==
               KeyBinding(GDK_KEY_x, Modifier::Super));

        ProfileService service(backend, dir.file("profiles"), dir.file("presets"));
        Profile meta("meta");
        meta.set_shortcut("kwin", "Window Close", {"<Meta>x"});
        meta.set_shortcut("kwin", "Walk Through Windows", {"<Alt>Tab"});

        auto changed = service.apply_profile(meta);
        assert(changed.size() == 1);
        assert(file_contains(path, "Window Close=Meta+X,Alt+F4,Close Window"));
        assert(service.apply_profile(meta).empty());
        assert(service.get_profile_diff(meta).empty());
        assert(reloads == 1);
    }

    {
        TempDir dir;
        const std::string path = dir.file("kglobalshortcutsrc");
        write_file(path, kConfig);

        KdeBackend backend(path, nullptr);
        ProfileService service(backend, dir.file("profiles"), dir.file("presets"));
        Profile preset("plasma");
        preset.metadata["preset"] = true;
        preset.set_shortcut("kwin", "Window Close", {"<Alt>F4"});

        service.apply_profile(preset);
        assert(file_contains(path, "Expose=none,Ctrl+F9,Toggle Present Windows (Current desktop)"));
        assert(file_contains(path, "Walk Through Windows=none,Alt+Tab\\tMeta+Tab,Walk Through Windows"));
    }

    return 0;
}
