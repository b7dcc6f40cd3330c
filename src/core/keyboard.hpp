#ifndef CORE_KEYBOARD_HPP
#define CORE_KEYBOARD_HPP

#include "core/profile.hpp"

#include <string>
#include <vector>

enum class KeyboardType {
    Ansi104,
    Ansi87,
    Ansi60,
    Iso105,
    MacAnsi,
    MacIso,
};

const char* keyboard_type_id(KeyboardType type);
const char* keyboard_type_display_name(KeyboardType type);
bool keyboard_type_is_apple(KeyboardType type);
bool keyboard_type_is_iso(KeyboardType type);

struct DetectedKeyboard {
    std::string name;
    std::string path;
    int vendor_id = 0;
    int product_id = 0;

    bool is_mac = false;
    bool is_bluetooth = false;
    bool is_internal = false;
    bool has_numpad = false;

    std::string usb_id() const;
    KeyboardType suggested_layout() const;
};

// Read-only view of the input hardware; nothing in the core writes through it.
class KeyboardHardware {
public:
    virtual ~KeyboardHardware() = default;
    virtual std::vector<DetectedKeyboard> list_keyboards() const = 0;
};

// Sink for the mac_keyboard profile section (hid_apple parameters).
class MacKeyboardConfigurator {
public:
    virtual ~MacKeyboardConfigurator() = default;
    virtual bool apply_config(const MacKeyboardConfig& config) = 0;
};

KeyboardType default_keyboard_type(const KeyboardHardware& hardware);

#endif
