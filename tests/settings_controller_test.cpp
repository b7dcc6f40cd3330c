#include "features/settings_controller.hpp"

#include "fake_backend.hpp"
#include "temp_dir.hpp"

#include <cassert>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace {
void populate(FakeBackend& backend) {
    backend.add(make_shortcut("wm", "close", {"<Alt>F4"}, {"<Alt>F4"}));
    backend.add(make_shortcut("wm", "minimize", {"<Super>h"}, {"<Super>h"}));
    backend.add(make_shortcut("apps", "quit", {"<Super>h"}, {}));
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}
}

int main() {
    {
        TempDir dir;
        FakeBackend backend;
        populate(backend);
        ProfileService profiles(backend, dir.file("profiles"), dir.file("presets"));
        std::ostringstream out;
        SettingsController controller(backend, profiles, out);

        assert(controller.run({}) == 2);
        assert(controller.run({"frobnicate"}) == 2);
        assert(controller.run({"show"}) == 2);
        assert(controller.run({"list", "extra"}) == 2);
        assert(out.str().empty());

        assert(controller.run({"categories"}) == 0);
        assert(contains(out.str(), "custom\tCustom"));

        out.str("");
        assert(controller.run({"list"}) == 0);
        assert(contains(out.str(), "Custom\n"));
        assert(contains(out.str(), "wm.close"));
        assert(contains(out.str(), "(modified)\tapps.quit"));
    }

    {
        TempDir dir;
        FakeBackend backend;
        populate(backend);
        ProfileService profiles(backend, dir.file("profiles"), dir.file("presets"));
        std::ostringstream out;
        SettingsController controller(backend, profiles, out);

        assert(controller.run({"save-current", "../outside"}) == 1);
        assert(!std::filesystem::exists(dir.file("outside.json")));
        assert(controller.run({"save-current", "snapshot", "Before changes"}) == 0);
        assert(contains(out.str(), "Saved 3 shortcut(s)"));
        assert(std::filesystem::is_regular_file(profiles.profile_path("snapshot")));

        out.str("");
        assert(controller.run({"profiles"}) == 0);
        assert(out.str() == "snapshot\tBefore changes\n");

        out.str("");
        assert(controller.run({"diff", "snapshot"}) == 0);
        assert(out.str() == "Live shortcuts match snapshot\n");

        Profile work("work");
        work.set_shortcut("wm", "close", {"<Super>q"});
        work.set_shortcut("wm", "minimize", {});
        profiles.save_profile(work);

        out.str("");
        assert(controller.run({"show", "work"}) == 0);
        assert(contains(out.str(), "work (version 1.0)"));
        assert(contains(out.str(), "wm.minimize = (disabled)"));
        assert(contains(out.str(), "wm.close = <Super>q"));

        out.str("");
        assert(controller.run({"diff", "work"}) == 0);
        assert(contains(out.str(), "wm.close\n    current: <Alt>F4\n    profile: <Super>q\n"));

        out.str("");
        assert(controller.run({"apply", "work"}) == 0);
        assert(contains(out.str(), "Changed 2 shortcut(s)"));
        assert(backend.accelerators("wm.close") == std::vector<std::string>{"<Super>q"});

        out.str("");
        assert(controller.run({"profiles"}) == 0);
        assert(contains(out.str(), "work [active]"));

        out.str("");
        assert(controller.run({"apply", "work"}) == 0);
        assert(out.str() == "Changed 0 shortcut(s)\n");

        out.str("");
        assert(controller.run({"switch", "work", "snapshot"}) == 0);
        assert(contains(out.str(), "wm.close -> "));
        assert(contains(out.str(), "Changed 2 shortcut(s)"));
        assert(backend.accelerators("wm.close") == std::vector<std::string>{"<Alt>F4"});

        assert(controller.run({"apply", "missing"}) == 1);
        assert(controller.run({"show", "missing"}) == 1);
        assert(controller.run({"switch", "work", "missing"}) == 1);
    }

    {
        TempDir dir;
        FakeBackend backend;
        populate(backend);
        ProfileService profiles(backend, dir.file("profiles"), dir.file("presets"));
        std::ostringstream out;
        SettingsController controller(backend, profiles, out);

        Profile preset("macos");
        preset.set_shortcut("wm", "close", {"<Super>q"});
        preset.set_shortcut("apps", "quit", {"<Super>h"});
        profiles.save_profile(preset);

        assert(controller.run({"mods", "macos"}) == 0);
        assert(contains(out.str(), "wm.close\n    current: <Alt>F4\n    expected: <Super>q\n"));

        out.str("");
        assert(controller.run({"export-mods", "macos"}) == 0);
        assert(contains(out.str(), "Exported 1 shortcut(s) to "));

        out.str("");
        assert(controller.run({"mods", "macos"}) == 0);
        assert(out.str() == "No changes on top of macos\n");

        out.str("");
        assert(controller.run({"export-mods", "macos"}) == 0);
        assert(out.str() == "No changes on top of macos\n");

        assert(controller.run({"mods", "missing"}) == 1);
    }

    {
        TempDir dir;
        FakeBackend backend;
        populate(backend);
        ProfileService profiles(backend, dir.file("profiles"), dir.file("presets"));
        std::ostringstream out;
        SettingsController controller(backend, profiles, out);

        assert(controller.run({"conflicts"}) == 0);
        assert(out.str() == "<Super>h\n    apps.quit\n    wm.minimize\n");

        out.str("");
        assert(controller.run({"conflicts", "<Super>h", "wm.minimize"}) == 0);
        assert(out.str() == "apps.quit\tquit\n");

        out.str("");
        assert(controller.run({"conflicts", "<Control><Alt>Delete"}) == 0);
        assert(contains(out.str(), "is free"));

        assert(controller.run({"conflicts", "<Bogus>x"}) == 1);

        out.str("");
        backend.live.at("wm.close").bindings.clear();
        assert(controller.run({"reset", "wm.close"}) == 0);
        assert(backend.accelerators("wm.close") == std::vector<std::string>{"<Alt>F4"});
        assert(backend.resets == 1);
        assert(controller.run({"reset", "wm.nothing"}) == 1);
    }

    {
        TempDir dir;
        FakeBackend backend;
        ProfileService profiles(backend, dir.file("profiles"), dir.file("presets"));
        std::ostringstream out;
        SettingsController controller(backend, profiles, out);

        assert(controller.run({"custom-add", "Terminal", "kgx", "<Super>t"}) == 0);
        assert(out.str() == "custom0\n");
        assert(controller.run({"custom-add", "Broken", "true", "nope<"}) == 1);

        out.str("");
        assert(controller.run({"custom-list"}) == 0);
        assert(out.str() == "custom0\tTerminal\t<Super>t\tkgx\n");

        backend.terminal = "kgx";
        out.str("");
        assert(controller.run({"setup-launchers"}) == 0);
        assert(out.str() == "terminal\tUpdated: kgx\n"
                            "file_manager\tNo file manager found\n"
                            "browser\tNo browser found\n"
                            "music\tNo music player found\n");
        assert(backend.customs.size() == 1);
        assert(backend.customs[0].binding == "<Super>Return");
        assert(controller.run({"setup-launchers", "extra"}) == 2);

        assert(controller.run({"custom-delete", "custom0"}) == 0);
        assert(controller.run({"custom-delete", "custom0"}) == 1);
        assert(backend.customs.empty());
    }

    return 0;
}
