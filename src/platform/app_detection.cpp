#include "platform/app_detection.hpp"

#include <glibmm/miscutils.h>

#include <cstdio>

namespace {
std::string trim(const std::string& text) {
    const auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}
}

bool apps::HostEnvironment::has_program(const std::string& binary) const {
    return !Glib::find_program_in_path(binary).empty();
}

bool apps::HostEnvironment::run(const std::string& cmd, std::string& output) const {
    FILE* pipe = popen((cmd + " 2>/dev/null").c_str(), "r");
    if (!pipe) {
        return false;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }

    return pclose(pipe) == 0;
}

std::optional<std::string> apps::first_installed(const SystemEnvironment& env, const std::vector<Candidate>& candidates) {
    for (const auto& candidate : candidates) {
        if (env.has_program(candidate.binary)) {
            return candidate.command;
        }
    }
    return std::nullopt;
}

std::optional<std::string> apps::match_default(const SystemEnvironment& env, const std::string& query,
                                               const std::vector<DefaultMatch>& matches) {
    std::string output;
    if (!env.run(query, output)) {
        return std::nullopt;
    }

    const std::string desktop_file = trim(output);
    if (desktop_file.empty()) {
        return std::nullopt;
    }
    for (const auto& match : matches) {
        if (desktop_file.find(match.fragment) != std::string::npos) {
            return match.command;
        }
    }
    return std::nullopt;
}

std::optional<std::string> apps::default_browser(const SystemEnvironment& env, const std::vector<DefaultMatch>& matches) {
    auto browser = match_default(env, "xdg-settings get default-web-browser", matches);
    if (browser && *browser == GOOGLE_CHROME && !env.has_program("google-chrome")) {
        return std::string(CHROMIUM);
    }
    return browser;
}

std::optional<std::string> apps::flatpak_app(const SystemEnvironment& env, const std::string& app_id) {
    std::string output;
    if (!env.run("flatpak info " + app_id, output)) {
        return std::nullopt;
    }
    return "flatpak run " + app_id;
}
