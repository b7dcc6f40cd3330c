#include "core/keyboard.hpp"

#include <cassert>
#include <string>
#include <vector>

namespace {
class FixedHardware : public KeyboardHardware {
public:
    explicit FixedHardware(std::vector<DetectedKeyboard> keyboards)
        : m_keyboards(std::move(keyboards)) {}

    std::vector<DetectedKeyboard> list_keyboards() const override { return m_keyboards; }

private:
    std::vector<DetectedKeyboard> m_keyboards;
};

DetectedKeyboard keyboard(const std::string& name, bool is_mac, bool has_numpad, bool is_internal) {
    DetectedKeyboard detected;
    detected.name = name;
    detected.is_mac = is_mac;
    detected.has_numpad = has_numpad;
    detected.is_internal = is_internal;
    return detected;
}
}

int main() {
    {
        DetectedKeyboard magic = keyboard("Apple Magic Keyboard", true, false, false);
        magic.vendor_id = 0x05ac;
        magic.product_id = 0x029c;
        assert(magic.usb_id() == "05ac:029c");
        assert(magic.suggested_layout() == KeyboardType::MacAnsi);

        assert(keyboard("Full", false, true, false).suggested_layout() == KeyboardType::Ansi104);
        assert(keyboard("TKL", false, false, false).suggested_layout() == KeyboardType::Ansi87);
    }

    {
        assert(std::string(keyboard_type_id(KeyboardType::Iso105)) == "iso-105");
        assert(std::string(keyboard_type_display_name(KeyboardType::Ansi60)) == "60% Compact");
        assert(keyboard_type_is_apple(KeyboardType::MacIso));
        assert(!keyboard_type_is_apple(KeyboardType::Ansi87));
        assert(keyboard_type_is_iso(KeyboardType::MacIso));
        assert(keyboard_type_is_iso(KeyboardType::Iso105));
        assert(!keyboard_type_is_iso(KeyboardType::MacAnsi));
    }

    {
        assert(default_keyboard_type(FixedHardware({})) == KeyboardType::Ansi104);

        FixedHardware laptop({keyboard("AT Translated Set 2 keyboard", false, false, true)});
        assert(default_keyboard_type(laptop) == KeyboardType::Ansi87);

        FixedHardware docked({
            keyboard("AT Translated Set 2 keyboard", false, false, true),
            keyboard("Apple Magic Keyboard", true, false, false),
        });
        assert(default_keyboard_type(docked) == KeyboardType::MacAnsi);
    }

    return 0;
}
