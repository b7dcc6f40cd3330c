#include "core/conflict_detector.hpp"

#include "fake_backend.hpp"

#include <gdk/gdk.h>

#include <cassert>
#include <map>
#include <string>

int main() {
    std::map<std::string, Shortcut> shortcuts;
    for (const auto& shortcut : {
             make_shortcut("wm", "close", {"<Super>q"}, {"<Alt>F4"}),
             make_shortcut("apps", "quit", {"<Super>q"}, {}),
             make_shortcut("wm", "minimize", {"<Super>h"}, {"<Super>h"}),
             make_shortcut("wm", "switch", {"<Alt>Tab", "<Super>Tab"}, {"<Alt>Tab"}, true),
             make_shortcut("shell", "overview", {"<Super>Tab"}, {}),
         }) {
        shortcuts[shortcut.id] = shortcut;
    }

    {
        const KeyBinding super_q(GDK_KEY_q, Modifier::Super);
        auto conflicts = keybind::find_conflicts(shortcuts, super_q, "");
        assert(conflicts.size() == 2);

        auto from_close = keybind::find_conflicts(shortcuts, super_q, "wm.close");
        assert(from_close.size() == 1);
        assert(from_close.front().id == "apps.quit");

        auto from_quit = keybind::find_conflicts(shortcuts, super_q, "apps.quit");
        assert(from_quit.size() == 1);
        assert(from_quit.front().id == "wm.close");
    }

    {
        auto conflicts = keybind::find_conflicts(shortcuts, KeyBinding(GDK_KEY_h, Modifier::Super), "wm.minimize");
        assert(conflicts.empty());
    }

    {
        auto conflicts = keybind::find_conflicts(shortcuts, KeyBinding(GDK_KEY_Tab, Modifier::Super), "");
        assert(conflicts.size() == 2);
    }

    {
        auto all = keybind::find_all_conflicts(shortcuts);
        assert(all.size() == 2);
        assert(all.at("<Super>q").size() == 2);
        assert(all.at("<Super>Tab").size() == 2);
        assert(all.count("<Super>h") == 0);
    }

    {
        FakeBackend backend;
        for (const auto& entry : shortcuts) {
            backend.add(entry.second);
        }
        auto conflicts = backend.find_conflicts(KeyBinding(GDK_KEY_q, Modifier::Super), "wm.close");
        assert(conflicts.size() == 1);
        assert(conflicts.front().id == "apps.quit");
    }

    return 0;
}
