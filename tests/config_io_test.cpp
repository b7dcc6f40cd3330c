#include "config_io.hpp"

#include "core/errors.hpp"
#include "temp_dir.hpp"

#include <cassert>
#include <fstream>
#include <string>

int main() {
    const std::string content =
        "# managed by kglobalaccel\n"
        "[kwin]\n"
        "_k_friendly_name=KWin\n"
        "Window Close=Alt+F4,Alt+F4,Close Window\n"
        "; legacy entry\n"
        "Expose=Ctrl+F9,Ctrl+F9,Toggle Present Windows (Current desktop)\n"
        "\n"
        "[plasmashell]\n"
        "activate task manager entry 1=Meta+1,Meta+1,Activate Task Manager Entry 1\n";

    {
        IniDocument document = ConfigIO::parseIni(content);
        assert(document.preamble.size() == 1);
        assert(document.sections.size() == 2);

        const IniSection* kwin = document.find_section("kwin");
        assert(kwin);
        assert(kwin->entries().size() == 3);
        assert(kwin->get("Window Close") == std::string("Alt+F4,Alt+F4,Close Window"));
        assert(kwin->has("_k_friendly_name"));
        assert(!kwin->has("; legacy entry"));

        const IniSection* plasma = document.find_section("plasmashell");
        assert(plasma);
        assert(plasma->get("activate task manager entry 1") == std::string("Meta+1,Meta+1,Activate Task Manager Entry 1"));
        assert(!document.find_section("kmix"));

        assert(ConfigIO::serializeIni(document) == content);
    }

    {
        IniDocument document = ConfigIO::parseIni(content);
        IniSection* kwin = document.find_section("kwin");
        kwin->set("Window Close", "Meta+Q,Alt+F4,Close Window");
        kwin->set("Window Maximize", "Meta+Up,Meta+PgUp,Maximize Window");
        assert(kwin->remove("Expose"));
        assert(!kwin->remove("Expose"));

        const std::string expected =
            "# managed by kglobalaccel\n"
            "[kwin]\n"
            "_k_friendly_name=KWin\n"
            "Window Close=Meta+Q,Alt+F4,Close Window\n"
            "; legacy entry\n"
            "Window Maximize=Meta+Up,Meta+PgUp,Maximize Window\n"
            "\n"
            "[plasmashell]\n"
            "activate task manager entry 1=Meta+1,Meta+1,Activate Task Manager Entry 1\n";
        assert(ConfigIO::serializeIni(document) == expected);
    }

    {
        IniDocument document;
        IniSection& created = document.ensure_section("khotkeys");
        created.set("custom0", "Meta+T,none,Terminal");
        assert(&document.ensure_section("khotkeys") == &document.sections.front());
        IniSection& second = document.ensure_section("kmix");
        second.set("increase_volume", "Volume Up,Volume Up,Increase Volume");
        assert(ConfigIO::serializeIni(document) ==
               "[khotkeys]\ncustom0=Meta+T,none,Terminal\n\n[kmix]\nincrease_volume=Volume Up,Volume Up,Increase Volume\n");
    }

    {
        TempDir dir;
        assert(!ConfigIO::readIni(dir.file("missing.rc")));

        const std::string path = dir.file("kglobalshortcutsrc");
        ConfigIO::writeIni(path, ConfigIO::parseIni(content));
        auto reread = ConfigIO::readIni(path);
        assert(reread);
        assert(ConfigIO::serializeIni(*reread) == content);

        bool threw = false;
        try {
            ConfigIO::writeIni(dir.file("no-such-dir/kglobalshortcutsrc"), *reread);
        } catch (const StorageError& error) {
            threw = true;
            assert(error.path() == dir.file("no-such-dir/kglobalshortcutsrc"));
        }
        assert(threw);
    }

    {
        IniDocument document = ConfigIO::parseIni("[a]\r\nkey = value\r\n");
        assert(document.sections.size() == 1);
        assert(document.sections[0].get("key") == std::string(" value"));
    }

    return 0;
}
