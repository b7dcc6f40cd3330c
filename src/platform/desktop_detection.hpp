#ifndef PLATFORM_DESKTOP_DETECTION_HPP
#define PLATFORM_DESKTOP_DETECTION_HPP

#include "platform/shortcut_backend.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

enum class DesktopEnvironment {
    Gnome,
    Kde,
    Unknown,
};

inline constexpr const char* BACKEND_OVERRIDE_ENV = "KEYBIND_SETTINGS_BACKEND";

const char* desktop_name(DesktopEnvironment desktop);

// "gnome" / "kde", case-insensitive.
std::optional<DesktopEnvironment> desktop_from_name(const std::string& name);

// XDG_CURRENT_DESKTOP is a colon separated list, e.g. "ubuntu:GNOME".
DesktopEnvironment detect_desktop(const std::string& current_desktop, const std::string& session_desktop);

// Environment variables first, then which shell owns its bus name.
DesktopEnvironment detect_desktop();

// Owns the one backend the process talks to. The backend is built on first
// use; reset() drops it so the next call detects again.
class BackendContext {
public:
    using Factory = std::function<std::unique_ptr<ShortcutBackend>(DesktopEnvironment)>;

    explicit BackendContext(std::optional<DesktopEnvironment> forced = std::nullopt, Factory factory = nullptr);

    ShortcutBackend& backend();
    DesktopEnvironment desktop();

    void reset();

    static std::unique_ptr<ShortcutBackend> create_backend(DesktopEnvironment desktop);

private:
    DesktopEnvironment resolve_desktop() const;

    std::optional<DesktopEnvironment> m_forced;
    Factory m_factory;
    std::optional<DesktopEnvironment> m_desktop;
    std::unique_ptr<ShortcutBackend> m_backend;
};

#endif
