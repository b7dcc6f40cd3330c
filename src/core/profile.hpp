#ifndef CORE_PROFILE_HPP
#define CORE_PROFILE_HPP

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// hid_apple fnmode values.
enum class FnMode {
    Disabled = 0,
    FKeys = 1,
    Media = 2,
};

const char* fn_mode_to_string(FnMode mode);
FnMode fn_mode_from_string(const std::string& value);

struct MacKeyboardConfig {
    FnMode fn_mode = FnMode::Media;
    bool swap_opt_cmd = false;
    bool swap_fn_leftctrl = false;
    bool iso_layout = false;

    std::map<std::string, int> to_modprobe_options() const;
    bool operator==(const MacKeyboardConfig& other) const;
};

struct XkbOptions {
    std::string caps_lock;  // e.g. "caps:escape"
    std::string alt_win;    // e.g. "altwin:swap_alt_win"
    std::string compose;    // e.g. "compose:ralt"
    std::string numpad;     // e.g. "numpad:mac"

    std::vector<std::string> to_xkb_options() const;
    bool empty() const;
};

using MetadataValue = std::variant<bool, std::string>;

// Storage keys are "<location>.<key>"; an empty accelerator list means the
// shortcut is explicitly disabled.
class Profile {
public:
    explicit Profile(std::string name = "");

    std::string name;
    std::string description;
    std::string author;
    std::string version = "1.0";
    std::string created;
    std::string modified;

    std::map<std::string, std::vector<std::string>> shortcuts;
    XkbOptions xkb_options;
    std::optional<MacKeyboardConfig> mac_keyboard;
    std::map<std::string, MetadataValue> metadata;

    static std::string storage_key(const std::string& location, const std::string& key);
    static std::optional<std::pair<std::string, std::string>> split_storage_key(const std::string& storage_key);

    void set_shortcut(const std::string& location, const std::string& key, std::vector<std::string> accelerators);
    std::optional<std::vector<std::string>> get_shortcut(const std::string& location, const std::string& key) const;

    bool is_preset() const;
    std::string metadata_string(const std::string& key) const;

    // Both throw StorageError.
    static Profile load_from_file(const std::string& path);
    void save_to_file(const std::string& path);
};

namespace keybind {
std::string now_iso8601();
std::string now_compact_timestamp();
}

#endif
