#ifndef PLATFORM_APP_DETECTION_HPP
#define PLATFORM_APP_DETECTION_HPP

#include <optional>
#include <string>
#include <vector>

namespace apps {
inline constexpr const char* GOOGLE_CHROME = "google-chrome --new-window";
inline constexpr const char* CHROMIUM = "chromium --new-window";
// Installed binary -> command line that launches it.
struct Candidate {
    std::string binary;
    std::string command;
};

// Fragment of a desktop-file id reported by xdg -> command line.
struct DefaultMatch {
    std::string fragment;
    std::string command;
};

// Read-only view of the host's installed programs.
class SystemEnvironment {
public:
    virtual ~SystemEnvironment() = default;

    virtual bool has_program(const std::string& binary) const = 0;

    // Runs cmd through the shell. Output is stdout; false on a non-zero exit.
    virtual bool run(const std::string& cmd, std::string& output) const = 0;
};

// PATH lookup and popen.
class HostEnvironment : public SystemEnvironment {
public:
    bool has_program(const std::string& binary) const override;
    bool run(const std::string& cmd, std::string& output) const override;
};

std::optional<std::string> first_installed(const SystemEnvironment& env, const std::vector<Candidate>& candidates);

// Runs query (e.g. "xdg-settings get default-web-browser") and maps its
// trimmed output by the first fragment it contains.
std::optional<std::string> match_default(const SystemEnvironment& env, const std::string& query,
                                         const std::vector<DefaultMatch>& matches);

// xdg's default web browser. A Chrome/Chromium match resolves to
// whichever of the two is installed.
std::optional<std::string> default_browser(const SystemEnvironment& env, const std::vector<DefaultMatch>& matches);

// "flatpak run <app_id>" when the flatpak is installed.
std::optional<std::string> flatpak_app(const SystemEnvironment& env, const std::string& app_id);
}

#endif
