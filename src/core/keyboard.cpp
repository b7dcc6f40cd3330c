#include "core/keyboard.hpp"

#include <cstdio>

const char* keyboard_type_id(KeyboardType type) {
    switch (type) {
        case KeyboardType::Ansi104: return "ansi-104";
        case KeyboardType::Ansi87: return "ansi-87";
        case KeyboardType::Ansi60: return "ansi-60";
        case KeyboardType::Iso105: return "iso-105";
        case KeyboardType::MacAnsi: return "mac-ansi";
        case KeyboardType::MacIso: return "mac-iso";
    }
    return "ansi-104";
}

const char* keyboard_type_display_name(KeyboardType type) {
    switch (type) {
        case KeyboardType::Ansi104: return "Full-size (104-key)";
        case KeyboardType::Ansi87: return "TKL (87-key)";
        case KeyboardType::Ansi60: return "60% Compact";
        case KeyboardType::Iso105: return "ISO 105-key";
        case KeyboardType::MacAnsi: return "Apple Magic Keyboard";
        case KeyboardType::MacIso: return "Apple (ISO)";
    }
    return "Unknown";
}

bool keyboard_type_is_apple(KeyboardType type) {
    return type == KeyboardType::MacAnsi || type == KeyboardType::MacIso;
}

bool keyboard_type_is_iso(KeyboardType type) {
    return type == KeyboardType::Iso105 || type == KeyboardType::MacIso;
}

std::string DetectedKeyboard::usb_id() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04x:%04x", vendor_id & 0xffff, product_id & 0xffff);
    return buffer;
}

KeyboardType DetectedKeyboard::suggested_layout() const {
    if (is_mac) {
        return KeyboardType::MacAnsi;
    }
    if (has_numpad) {
        return KeyboardType::Ansi104;
    }
    return KeyboardType::Ansi87;
}

KeyboardType default_keyboard_type(const KeyboardHardware& hardware) {
    auto keyboards = hardware.list_keyboards();
    if (keyboards.empty()) {
        return KeyboardType::Ansi104;
    }

    // An external keyboard wins over the laptop's built-in one.
    for (const auto& keyboard : keyboards) {
        if (!keyboard.is_internal) {
            return keyboard.suggested_layout();
        }
    }
    return keyboards.front().suggested_layout();
}
