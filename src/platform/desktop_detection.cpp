#include "platform/desktop_detection.hpp"

#include "platform/gio_settings_store.hpp"
#include "platform/gnome_backend.hpp"
#include "platform/kde_backend.hpp"

#include <giomm.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <vector>

namespace {
std::string upper_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream stream(text);
    std::string part;
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

bool one_of(const std::string& value, std::initializer_list<const char*> candidates) {
    return std::any_of(candidates.begin(), candidates.end(),
                       [&](const char* candidate) { return value == candidate; });
}

bool bus_name_has_owner(const std::string& bus_name) {
    try {
        auto connection = Gio::DBus::Connection::get_sync(Gio::DBus::BusType::SESSION);
        if (!connection) {
            return false;
        }

        auto parameters = Glib::VariantContainerBase::create_tuple(Glib::Variant<Glib::ustring>::create(bus_name));
        auto reply = connection->call_sync("/org/freedesktop/DBus", "org.freedesktop.DBus", "NameHasOwner",
                                           parameters, "org.freedesktop.DBus", 1000);

        Glib::Variant<bool> owned;
        reply.get_child(owned, 0);
        return owned.get();
    } catch (const Glib::Error& error) {
        std::cerr << "Failed to query session bus for " << bus_name << ": " << error.what() << std::endl;
        return false;
    }
}
}

const char* desktop_name(DesktopEnvironment desktop) {
    switch (desktop) {
    case DesktopEnvironment::Gnome:
        return "gnome";
    case DesktopEnvironment::Kde:
        return "kde";
    case DesktopEnvironment::Unknown:
        break;
    }
    return "unknown";
}

std::optional<DesktopEnvironment> desktop_from_name(const std::string& name) {
    const std::string upper = upper_copy(name);
    if (upper == "GNOME") {
        return DesktopEnvironment::Gnome;
    }
    if (upper == "KDE") {
        return DesktopEnvironment::Kde;
    }
    return std::nullopt;
}

DesktopEnvironment detect_desktop(const std::string& current_desktop, const std::string& session_desktop) {
    const auto parts = split(upper_copy(current_desktop), ':');

    if (std::any_of(parts.begin(), parts.end(),
                    [](const std::string& part) { return one_of(part, {"GNOME", "UNITY", "UBUNTU"}); })) {
        return DesktopEnvironment::Gnome;
    }
    if (std::any_of(parts.begin(), parts.end(),
                    [](const std::string& part) { return one_of(part, {"KDE", "PLASMA"}); })) {
        return DesktopEnvironment::Kde;
    }

    const std::string session = upper_copy(session_desktop);
    if (one_of(session, {"GNOME", "GNOME-XORG", "GNOME-WAYLAND", "UBUNTU"})) {
        return DesktopEnvironment::Gnome;
    }
    if (one_of(session, {"KDE", "PLASMA", "PLASMAWAYLAND"})) {
        return DesktopEnvironment::Kde;
    }

    return DesktopEnvironment::Unknown;
}

DesktopEnvironment detect_desktop() {
    auto desktop = detect_desktop(Glib::getenv("XDG_CURRENT_DESKTOP"), Glib::getenv("XDG_SESSION_DESKTOP"));
    if (desktop != DesktopEnvironment::Unknown) {
        return desktop;
    }

    Gio::init();
    if (bus_name_has_owner("org.gnome.Shell")) {
        return DesktopEnvironment::Gnome;
    }
    if (bus_name_has_owner("org.kde.plasmashell")) {
        return DesktopEnvironment::Kde;
    }
    return DesktopEnvironment::Unknown;
}

BackendContext::BackendContext(std::optional<DesktopEnvironment> forced, Factory factory)
    : m_forced(forced), m_factory(std::move(factory)) {
    if (!m_factory) {
        m_factory = &BackendContext::create_backend;
    }
}

DesktopEnvironment BackendContext::resolve_desktop() const {
    if (m_forced) {
        return *m_forced;
    }

    const std::string override_name = Glib::getenv(BACKEND_OVERRIDE_ENV);
    if (!override_name.empty()) {
        if (auto desktop = desktop_from_name(override_name)) {
            return *desktop;
        }
        std::cerr << "Ignoring unknown " << BACKEND_OVERRIDE_ENV << " value: " << override_name << std::endl;
    }

    return detect_desktop();
}

DesktopEnvironment BackendContext::desktop() {
    if (!m_desktop) {
        m_desktop = resolve_desktop();
    }
    return *m_desktop;
}

ShortcutBackend& BackendContext::backend() {
    if (!m_backend) {
        DesktopEnvironment detected = desktop();
        if (detected == DesktopEnvironment::Unknown) {
            std::cerr << "Unknown desktop environment, falling back to the GNOME backend" << std::endl;
            detected = DesktopEnvironment::Gnome;
        }
        m_backend = m_factory(detected);
    }
    return *m_backend;
}

void BackendContext::reset() {
    m_backend.reset();
    m_desktop.reset();
}

std::unique_ptr<ShortcutBackend> BackendContext::create_backend(DesktopEnvironment desktop) {
    if (desktop == DesktopEnvironment::Kde) {
        return std::make_unique<KdeBackend>();
    }
    return std::make_unique<GnomeBackend>(std::make_shared<GioSettingsStore>());
}
