#include "platform/desktop_detection.hpp"

#include "fake_backend.hpp"

#include <glib.h>

#include <cassert>
#include <memory>
#include <vector>

int main() {
    {
        assert(detect_desktop("GNOME", "") == DesktopEnvironment::Gnome);
        assert(detect_desktop("ubuntu:GNOME", "ubuntu") == DesktopEnvironment::Gnome);
        assert(detect_desktop("Unity", "") == DesktopEnvironment::Gnome);
        assert(detect_desktop("KDE", "") == DesktopEnvironment::Kde);
        assert(detect_desktop("plasma", "") == DesktopEnvironment::Kde);
        assert(detect_desktop("", "gnome-wayland") == DesktopEnvironment::Gnome);
        assert(detect_desktop("", "plasmawayland") == DesktopEnvironment::Kde);
        assert(detect_desktop("X-Cinnamon", "cinnamon") == DesktopEnvironment::Unknown);
        assert(detect_desktop("", "") == DesktopEnvironment::Unknown);
        // XDG_CURRENT_DESKTOP wins over the session name.
        assert(detect_desktop("KDE", "gnome") == DesktopEnvironment::Kde);
    }

    {
        assert(desktop_from_name("gnome") == DesktopEnvironment::Gnome);
        assert(desktop_from_name("KDE") == DesktopEnvironment::Kde);
        assert(!desktop_from_name("xfce"));
        assert(!desktop_from_name(""));
        assert(std::string(desktop_name(DesktopEnvironment::Gnome)) == "gnome");
        assert(std::string(desktop_name(DesktopEnvironment::Kde)) == "kde");
        assert(std::string(desktop_name(DesktopEnvironment::Unknown)) == "unknown");
    }

    {
        std::vector<DesktopEnvironment> built;
        BackendContext context(DesktopEnvironment::Kde, [&built](DesktopEnvironment desktop) {
            built.push_back(desktop);
            return std::unique_ptr<ShortcutBackend>(new FakeBackend());
        });

        assert(context.desktop() == DesktopEnvironment::Kde);
        ShortcutBackend& first = context.backend();
        ShortcutBackend& second = context.backend();
        assert(&first == &second);
        assert(built == std::vector<DesktopEnvironment>{DesktopEnvironment::Kde});

        context.reset();
        context.backend();
        assert(built.size() == 2);
    }

    {
        std::vector<DesktopEnvironment> built;
        BackendContext context(DesktopEnvironment::Unknown, [&built](DesktopEnvironment desktop) {
            built.push_back(desktop);
            return std::unique_ptr<ShortcutBackend>(new FakeBackend());
        });

        assert(context.backend().name() == "fake");
        assert(context.desktop() == DesktopEnvironment::Unknown);
        assert(built == std::vector<DesktopEnvironment>{DesktopEnvironment::Gnome});
    }

    {
        g_setenv(BACKEND_OVERRIDE_ENV, "kde", TRUE);
        std::vector<DesktopEnvironment> built;
        BackendContext context(std::nullopt, [&built](DesktopEnvironment desktop) {
            built.push_back(desktop);
            return std::unique_ptr<ShortcutBackend>(new FakeBackend());
        });
        assert(context.desktop() == DesktopEnvironment::Kde);
        context.backend();
        assert(built == std::vector<DesktopEnvironment>{DesktopEnvironment::Kde});

        BackendContext forced(DesktopEnvironment::Gnome, [&built](DesktopEnvironment desktop) {
            built.push_back(desktop);
            return std::unique_ptr<ShortcutBackend>(new FakeBackend());
        });
        assert(forced.desktop() == DesktopEnvironment::Gnome);
        g_unsetenv(BACKEND_OVERRIDE_ENV);
    }

    return 0;
}
