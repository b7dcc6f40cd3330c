#include "platform/kde_backend.hpp"

#include "core/accelerator.hpp"

#include <gdk/gdk.h>
#include <glibmm/miscutils.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace {
std::string lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

struct KeyName {
    const char* kde;
    const char* gdk;
};

// KDE key names that differ from gdk keyval names. For the reverse direction
// the first row naming a keyval wins.
constexpr std::array<KeyName, 38> kKeyNames = {{
    {"Esc", "Escape"},
    {"Escape", "Escape"},
    {"Del", "Delete"},
    {"Delete", "Delete"},
    {"Ins", "Insert"},
    {"Insert", "Insert"},
    {"PgUp", "Page_Up"},
    {"PgDown", "Page_Down"},
    {"Backspace", "BackSpace"},
    {"Space", "space"},
    {"Return", "Return"},
    {"Enter", "KP_Enter"},
    {"Print", "Print"},
    {"Volume Up", "XF86AudioRaiseVolume"},
    {"Volume Down", "XF86AudioLowerVolume"},
    {"Volume Mute", "XF86AudioMute"},
    {"Microphone Mute", "XF86AudioMicMute"},
    {"Media Play", "XF86AudioPlay"},
    {"Media Pause", "XF86AudioPause"},
    {"Media Stop", "XF86AudioStop"},
    {"Media Next", "XF86AudioNext"},
    {"Media Previous", "XF86AudioPrev"},
    {"Monitor Brightness Up", "XF86MonBrightnessUp"},
    {"Monitor Brightness Down", "XF86MonBrightnessDown"},
    {"Power Off", "XF86PowerOff"},
    {"+", "plus"},
    {"-", "minus"},
    {"=", "equal"},
    {",", "comma"},
    {".", "period"},
    {"/", "slash"},
    {"\\", "backslash"},
    {";", "semicolon"},
    {"'", "apostrophe"},
    {"`", "grave"},
    {"~", "asciitilde"},
    {"[", "bracketleft"},
    {"]", "bracketright"},
}};

std::optional<Modifier> kde_modifier(const std::string& token) {
    const std::string lowered = lower_copy(token);
    if (lowered == "meta" || lowered == "super") {
        return Modifier::Super;
    }
    if (lowered == "ctrl" || lowered == "control") {
        return Modifier::Ctrl;
    }
    if (lowered == "shift") {
        return Modifier::Shift;
    }
    if (lowered == "alt") {
        return Modifier::Alt;
    }
    return std::nullopt;
}

std::string gdk_key_name(const std::string& kde_key) {
    for (const auto& entry : kKeyNames) {
        if (kde_key == entry.kde) {
            return entry.gdk;
        }
    }
    return kde_key;
}

std::string kde_key_name(const std::string& gdk_key) {
    for (const auto& entry : kKeyNames) {
        if (gdk_key == entry.gdk) {
            return entry.kde;
        }
    }
    if (gdk_key.size() == 1) {
        return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(gdk_key[0]))));
    }
    return gdk_key;
}

std::string trim(const std::string& text) {
    const auto start = text.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

bool run_system(const std::string& cmd) {
    int ret = std::system(cmd.c_str());
    return ret == 0;
}

// "khotkeys/custom0" -> ("khotkeys", "custom0")
std::optional<std::pair<std::string, std::string>> split_custom_path(const std::string& path) {
    const auto slash = path.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(path.substr(0, slash), path.substr(slash + 1));
}
}

kde::ShortcutValue kde::parse_shortcut_value(const std::string& value) {
    ShortcutValue parsed;
    const auto first = value.find(',');
    parsed.current = value.substr(0, first);
    if (first == std::string::npos) {
        return parsed;
    }

    const auto second = value.find(',', first + 1);
    parsed.default_value = value.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
    if (second != std::string::npos) {
        parsed.description = value.substr(second + 1);
    }
    return parsed;
}

std::string kde::format_shortcut_value(const ShortcutValue& value) {
    return value.current + "," + value.default_value + "," + value.description;
}

std::optional<KeyBinding> kde::parse_shortcut(const std::string& shortcut) {
    // Only the first of several packed shortcuts is used. KConfig stores the
    // tab separator escaped as the two characters "\t".
    std::string text = shortcut;
    for (const char* separator : {"\t", "\\t", ","}) {
        const auto found = text.find(separator);
        if (found != std::string::npos) {
            text = text.substr(0, found);
        }
    }
    text = trim(text);

    if (text.empty() || lower_copy(text) == NO_SHORTCUT) {
        return std::nullopt;
    }

    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos <= text.size()) {
        auto plus = text.find('+', pos);
        if (plus == pos && plus + 1 == text.size()) {
            // Trailing "++": the key itself is '+'.
            tokens.emplace_back("+");
            break;
        }
        if (plus == std::string::npos) {
            tokens.push_back(text.substr(pos));
            break;
        }
        tokens.push_back(text.substr(pos, plus - pos));
        pos = plus + 1;
    }

    if (tokens.empty() || tokens.back().empty()) {
        std::cerr << "Ignoring malformed KDE shortcut: " << shortcut << '\n';
        return std::nullopt;
    }

    Modifier modifiers = Modifier::None;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        auto modifier = kde_modifier(tokens[i]);
        if (!modifier) {
            std::cerr << "Ignoring KDE shortcut with unknown modifier '" << tokens[i] << "': " << shortcut << '\n';
            return std::nullopt;
        }
        modifiers |= *modifier;
    }

    const std::string key = gdk_key_name(tokens.back());
    guint keyval = gdk_keyval_from_name(key.c_str());
    if (keyval == 0 || keyval == GDK_KEY_VoidSymbol) {
        // Letters are stored uppercase; gdk names lowercase letters.
        keyval = gdk_keyval_from_name(lower_copy(key).c_str());
    }
    if (keyval == 0 || keyval == GDK_KEY_VoidSymbol) {
        std::cerr << "Ignoring KDE shortcut with unknown key '" << tokens.back() << "'" << '\n';
        return std::nullopt;
    }

    return KeyBinding(keyval, modifiers);
}

std::optional<std::string> kde::to_canonical_accelerator(const std::string& shortcut) {
    auto binding = parse_shortcut(shortcut);
    if (!binding) {
        return std::nullopt;
    }
    return keybind::format_accelerator(*binding);
}

std::string kde::format_shortcut(const KeyBinding& binding) {
    std::string text;
    const Modifier modifiers = binding.modifiers();
    if (has_modifier(modifiers, Modifier::Super) || has_modifier(modifiers, Modifier::Meta)) {
        text += "Meta+";
    }
    if (has_modifier(modifiers, Modifier::Ctrl)) {
        text += "Ctrl+";
    }
    if (has_modifier(modifiers, Modifier::Alt)) {
        text += "Alt+";
    }
    if (has_modifier(modifiers, Modifier::Shift)) {
        text += "Shift+";
    }
    return text + kde_key_name(binding.key_name());
}

KeyBinding kde::storable_binding(const KeyBinding& binding) {
    Modifier modifiers = Modifier::None;
    for (Modifier modifier : {Modifier::Shift, Modifier::Ctrl, Modifier::Alt, Modifier::Super}) {
        if (has_modifier(binding.modifiers(), modifier)) {
            modifiers |= modifier;
        }
    }
    if (has_modifier(binding.modifiers(), Modifier::Meta)) {
        modifiers |= Modifier::Super;
    }
    return KeyBinding(binding.keyval(), modifiers);
}

std::string kde::from_canonical_accelerator(const std::string& accelerator) {
    auto binding = keybind::parse_accelerator(accelerator);
    if (!binding) {
        return NO_SHORTCUT;
    }
    return format_shortcut(*binding);
}

const std::vector<ShortcutCategory>& kde::categories() {
    static const std::vector<ShortcutCategory> table = {
        {"kwin", "Window Management", "preferences-system-windows-symbolic", "KWin window manager shortcuts"},
        {"plasma", "Plasma", "view-app-grid-symbolic", "Plasma desktop shortcuts"},
        {"media", "Media", "multimedia-player-symbolic", "Media playback and volume controls"},
        {"apps", "Applications", "application-x-addon-symbolic", "Application launchers"},
        {"custom", "Custom", "application-x-addon-symbolic", "User-defined shortcuts"},
    };
    return table;
}

std::string kde::component_category(const std::string& component) {
    static const std::vector<std::pair<std::string, std::string>> components = {
        {"kwin", "kwin"},
        {"ksmserver", "plasma"},
        {"plasmashell", "plasma"},
        {"org.kde.krunner.desktop", "apps"},
        {"org.kde.spectacle.desktop", "plasma"},
        {"org.kde.dolphin.desktop", "apps"},
        {"org.kde.konsole.desktop", "apps"},
        {"kmix", "media"},
        {"org_kde_powerdevil", "plasma"},
        {"kded5", "plasma"},
        {"kded6", "plasma"},
        {"kaccess", "plasma"},
    };

    const std::string lowered = lower_copy(component);
    for (const auto& [pattern, category] : components) {
        if (lowered.find(pattern) != std::string::npos) {
            return category;
        }
    }
    return "apps";
}

std::string kde::humanize_key(const std::string& key) {
    std::string name = key;
    std::replace(name.begin(), name.end(), '_', ' ');
    std::replace(name.begin(), name.end(), '-', ' ');

    bool word_start = true;
    for (auto& ch : name) {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isalpha(uch)) {
            ch = static_cast<char>(word_start ? std::toupper(uch) : std::tolower(uch));
            word_start = false;
        } else {
            word_start = true;
        }
    }
    return name;
}

std::string kde::default_config_path() {
    return Glib::build_filename(Glib::get_user_config_dir(), "kglobalshortcutsrc");
}

void kde::notify_reload() {
    if (!run_system("qdbus org.kde.KWin /KWin reconfigure >/dev/null 2>&1")) {
        std::cerr << "Failed to signal KWin to reload shortcuts" << std::endl;
    }
}

KdeBackend::KdeBackend(std::string config_path, std::function<void()> reload)
    : m_config_path(std::move(config_path)), m_reload(std::move(reload)) {}

IniDocument KdeBackend::load_document() const {
    auto document = ConfigIO::readIni(m_config_path);
    if (!document) {
        return IniDocument{};
    }
    return *document;
}

void KdeBackend::store_document(const IniDocument& document) {
    ConfigIO::writeIni(m_config_path, document);
    if (m_reload) {
        m_reload();
    }
}

std::vector<ShortcutCategory> KdeBackend::get_categories() const {
    return kde::categories();
}

ShortcutMap KdeBackend::load_all_shortcuts() {
    ShortcutMap shortcuts;
    const IniDocument document = load_document();

    for (const auto& section : document.sections) {
        if (section.name == kde::CUSTOM_SECTION) {
            continue;
        }
        const std::string category = kde::component_category(section.name);

        for (const auto& [key, value] : section.entries()) {
            if (!key.empty() && key[0] == '_') {
                continue;
            }

            const auto fields = kde::parse_shortcut_value(value);

            Shortcut shortcut;
            shortcut.id = section.name + "." + key;
            shortcut.name = kde::humanize_key(key);
            shortcut.description = fields.description;
            shortcut.category = category;
            shortcut.group = section.name;
            shortcut.location = {section.name, key};
            if (auto binding = kde::parse_shortcut(fields.current)) {
                shortcut.bindings.push_back(*binding);
            }
            if (auto binding = kde::parse_shortcut(fields.default_value)) {
                shortcut.default_bindings.push_back(*binding);
            }

            shortcuts.emplace(shortcut.id, std::move(shortcut));
        }
    }

    for (const auto& custom : get_custom_keybindings()) {
        Shortcut shortcut;
        shortcut.id = keybind::CUSTOM_ID_PREFIX + custom.path;
        shortcut.name = custom.name;
        shortcut.description = custom.command;
        shortcut.category = "custom";
        shortcut.group = "Launchers";
        shortcut.location = {keybind::CUSTOM_LOCATION, custom.path};
        if (auto binding = keybind::parse_accelerator(custom.binding)) {
            shortcut.bindings.push_back(*binding);
        }

        shortcuts.emplace(shortcut.id, std::move(shortcut));
    }

    return shortcuts;
}

bool KdeBackend::save_shortcut(const Shortcut& shortcut) {
    const std::string primary = shortcut.accelerator();
    if (!shortcut.bindings.empty()) {
        const KeyBinding stored = kde::storable_binding(shortcut.bindings.front());
        if (stored != shortcut.bindings.front()) {
            std::cerr << "KDE cannot store " << primary << " for " << shortcut.id << ", writing "
                      << stored.to_accelerator() << " instead" << std::endl;
        }
    }

    if (shortcut.is_custom()) {
        return update_custom_keybinding(shortcut.location.key, std::nullopt, std::nullopt, primary);
    }

    IniDocument document = load_document();
    IniSection* section = document.find_section(shortcut.location.schema);
    if (!section) {
        return false;
    }
    auto existing = section->get(shortcut.location.key);
    if (!existing) {
        return false;
    }

    auto fields = kde::parse_shortcut_value(*existing);
    fields.current = kde::from_canonical_accelerator(primary);
    section->set(shortcut.location.key, kde::format_shortcut_value(fields));

    store_document(document);
    return true;
}

bool KdeBackend::reset_shortcut(Shortcut& shortcut) {
    if (shortcut.is_custom()) {
        if (!update_custom_keybinding(shortcut.location.key, std::nullopt, std::nullopt, std::string())) {
            return false;
        }
        shortcut.reset();
        return true;
    }

    IniDocument document = load_document();
    IniSection* section = document.find_section(shortcut.location.schema);
    if (!section) {
        return false;
    }
    auto existing = section->get(shortcut.location.key);
    if (!existing) {
        return false;
    }

    auto fields = kde::parse_shortcut_value(*existing);
    fields.current = fields.default_value;
    section->set(shortcut.location.key, kde::format_shortcut_value(fields));
    store_document(document);

    shortcut.bindings.clear();
    if (auto binding = kde::parse_shortcut(fields.default_value)) {
        shortcut.bindings.push_back(*binding);
    }
    return true;
}

std::vector<CustomKeybinding> KdeBackend::get_custom_keybindings() {
    std::vector<CustomKeybinding> result;
    const IniDocument document = load_document();
    const IniSection* section = document.find_section(kde::CUSTOM_SECTION);
    if (!section) {
        return result;
    }

    for (const auto& [key, value] : section->entries()) {
        if (!key.empty() && key[0] == '_') {
            continue;
        }
        const auto fields = kde::parse_shortcut_value(value);

        CustomKeybinding custom;
        custom.path = std::string(kde::CUSTOM_SECTION) + "/" + key;
        custom.name = fields.description.empty() ? key : fields.description;
        // khotkeys keeps the command in its own file.
        custom.binding = kde::to_canonical_accelerator(fields.current).value_or("");
        result.push_back(std::move(custom));
    }
    return result;
}

std::optional<std::string> KdeBackend::add_custom_keybinding(const std::string& name, const std::string& command,
                                                             const std::string& binding) {
    IniDocument document = load_document();
    IniSection& section = document.ensure_section(kde::CUSTOM_SECTION);

    std::vector<std::string> keys;
    for (const auto& entry : section.entries()) {
        keys.push_back(entry.first);
    }
    const std::string key = "custom" + std::to_string(keybind::lowest_unused_suffix(keys, "custom"));

    if (!command.empty()) {
        std::cerr << "KDE launcher commands are not stored in kglobalshortcutsrc: " << command << '\n';
    }

    kde::ShortcutValue value{kde::from_canonical_accelerator(binding), kde::NO_SHORTCUT, name};
    section.set(key, kde::format_shortcut_value(value));

    store_document(document);
    return std::string(kde::CUSTOM_SECTION) + "/" + key;
}

bool KdeBackend::update_custom_keybinding(const std::string& path,
                                          const std::optional<std::string>& name,
                                          const std::optional<std::string>& command,
                                          const std::optional<std::string>& binding) {
    auto location = split_custom_path(path);
    if (!location) {
        return false;
    }

    IniDocument document = load_document();
    IniSection* section = document.find_section(location->first);
    if (!section) {
        return false;
    }
    auto existing = section->get(location->second);
    if (!existing) {
        return false;
    }

    auto fields = kde::parse_shortcut_value(*existing);
    if (binding) {
        fields.current = kde::from_canonical_accelerator(*binding);
    }
    if (name) {
        fields.description = *name;
    }
    if (command && !command->empty()) {
        std::cerr << "KDE launcher commands are not stored in kglobalshortcutsrc: " << *command << '\n';
    }
    section->set(location->second, kde::format_shortcut_value(fields));

    store_document(document);
    return true;
}

bool KdeBackend::delete_custom_keybinding(const std::string& path) {
    auto location = split_custom_path(path);
    if (!location) {
        return false;
    }

    IniDocument document = load_document();
    IniSection* section = document.find_section(location->first);
    if (!section || !section->remove(location->second)) {
        return false;
    }

    store_document(document);
    return true;
}

std::optional<std::string> KdeBackend::detect_terminal() const {
    static const std::vector<apps::Candidate> terminals = {
        {"konsole", "konsole --new-tab"},
        {"yakuake", "yakuake"},
        {"ghostty", "ghostty"},
        {"kitty", "kitty"},
        {"alacritty", "alacritty"},
        {"wezterm", "wezterm start"},
        {"gnome-terminal", "gnome-terminal"},
        {"xterm", "xterm"},
    };
    return apps::first_installed(system_environment(), terminals);
}

std::optional<std::string> KdeBackend::detect_file_manager() const {
    static const std::vector<apps::Candidate> file_managers = {
        {"dolphin", "dolphin --new-window"},
        {"nautilus", "nautilus --new-window"},
        {"thunar", "thunar"},
        {"nemo", "nemo --new-window"},
        {"pcmanfm-qt", "pcmanfm-qt"},
        {"pcmanfm", "pcmanfm --new-win"},
    };
    return apps::first_installed(system_environment(), file_managers);
}

std::optional<std::string> KdeBackend::detect_browser() const {
    static const std::vector<apps::DefaultMatch> defaults = {
        {"firefox", "firefox --new-window"},
        {"chrome", apps::GOOGLE_CHROME},
        {"chromium", apps::GOOGLE_CHROME},
        {"brave", "brave --new-window"},
        {"falkon", "falkon"},
    };
    static const std::vector<apps::Candidate> installed = {
        {"firefox", "firefox --new-window"},
        {"google-chrome", apps::GOOGLE_CHROME},
        {"chromium", apps::CHROMIUM},
        {"falkon", "falkon"},
        {"brave-browser", "brave-browser --new-window"},
    };

    if (auto command = apps::default_browser(system_environment(), defaults)) {
        return command;
    }
    return apps::first_installed(system_environment(), installed);
}

std::optional<std::string> KdeBackend::detect_music_player() const {
    static const std::vector<apps::Candidate> players = {
        {"strawberry", "strawberry"},
        {"clementine", "clementine"},
        {"amarok", "amarok"},
        {"audacious", "audacious"},
    };

    const apps::SystemEnvironment& env = system_environment();
    if (env.has_program("elisa")) {
        return std::string("elisa");
    }
    if (auto spotify = apps::flatpak_app(env, "com.spotify.Client")) {
        return spotify;
    }
    if (env.has_program("spotify")) {
        return std::string("spotify");
    }
    return apps::first_installed(env, players);
}
