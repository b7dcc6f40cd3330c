#ifndef CONFIG_IO_HPP
#define CONFIG_IO_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

// One physical line of a section. Comments and blank lines are kept verbatim
// so a rewrite only touches the entries that changed.
struct IniLine {
    bool is_entry = false;
    std::string key;
    std::string value;
    std::string raw;
};

struct IniSection {
    std::string name;
    std::vector<IniLine> lines;

    bool has(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);
    bool remove(const std::string& key);
    std::vector<std::pair<std::string, std::string>> entries() const;
};

struct IniDocument {
    std::vector<std::string> preamble;
    std::vector<IniSection> sections;

    IniSection* find_section(const std::string& name);
    const IniSection* find_section(const std::string& name) const;
    IniSection& ensure_section(const std::string& name);
};

class ConfigIO {
public:
    // nullopt when the file does not exist or cannot be opened.
    static std::optional<IniDocument> readIni(const std::string& filePath);
    static IniDocument parseIni(const std::string& content);

    // Rewrites the whole file; throws StorageError on failure.
    static void writeIni(const std::string& filePath, const IniDocument& document);
    static std::string serializeIni(const IniDocument& document);

private:
    static std::string trim(const std::string& text);
};

#endif // CONFIG_IO_HPP
