#include "config_io.hpp"

#include "core/errors.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

bool IniSection::has(const std::string& key) const {
    return get(key).has_value();
}

std::optional<std::string> IniSection::get(const std::string& key) const {
    for (const auto& line : lines) {
        if (line.is_entry && line.key == key) {
            return line.value;
        }
    }
    return std::nullopt;
}

void IniSection::set(const std::string& key, const std::string& value) {
    for (auto& line : lines) {
        if (line.is_entry && line.key == key) {
            line.value = value;
            return;
        }
    }

    IniLine line;
    line.is_entry = true;
    line.key = key;
    line.value = value;

    // Keep trailing blank lines after the last entry.
    auto insert_at = lines.end();
    while (insert_at != lines.begin() && !std::prev(insert_at)->is_entry && std::prev(insert_at)->raw.empty()) {
        --insert_at;
    }
    lines.insert(insert_at, std::move(line));
}

bool IniSection::remove(const std::string& key) {
    for (auto it = lines.begin(); it != lines.end(); ++it) {
        if (it->is_entry && it->key == key) {
            lines.erase(it);
            return true;
        }
    }
    return false;
}

std::vector<std::pair<std::string, std::string>> IniSection::entries() const {
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto& line : lines) {
        if (line.is_entry) {
            result.emplace_back(line.key, line.value);
        }
    }
    return result;
}

IniSection* IniDocument::find_section(const std::string& name) {
    for (auto& section : sections) {
        if (section.name == name) {
            return &section;
        }
    }
    return nullptr;
}

const IniSection* IniDocument::find_section(const std::string& name) const {
    for (const auto& section : sections) {
        if (section.name == name) {
            return &section;
        }
    }
    return nullptr;
}

IniSection& IniDocument::ensure_section(const std::string& name) {
    if (IniSection* existing = find_section(name)) {
        return *existing;
    }
    IniSection section;
    section.name = name;
    sections.push_back(std::move(section));
    return sections.back();
}

std::string ConfigIO::trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

std::optional<IniDocument> ConfigIO::readIni(const std::string& filePath) {
    std::ifstream inFile(filePath);
    if (!inFile.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << inFile.rdbuf();
    return parseIni(buffer.str());
}

IniDocument ConfigIO::parseIni(const std::string& content) {
    IniDocument document;
    IniSection* current = nullptr;

    std::istringstream input(content);
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string trimmed = trim(line);
        if (!trimmed.empty() && trimmed.front() == '[' && trimmed.back() == ']') {
            IniSection section;
            section.name = trimmed.substr(1, trimmed.size() - 2);
            document.sections.push_back(std::move(section));
            current = &document.sections.back();
            continue;
        }

        IniLine entry;
        entry.raw = line;
        size_t eq = line.find('=');
        if (!trimmed.empty() && trimmed.front() != '#' && trimmed.front() != ';' && eq != std::string::npos) {
            entry.is_entry = true;
            entry.key = trim(line.substr(0, eq));
            entry.value = line.substr(eq + 1);
        }

        if (current) {
            current->lines.push_back(std::move(entry));
        } else if (!entry.is_entry) {
            document.preamble.push_back(line);
        } else {
            std::cerr << "Ignoring entry outside of any section: " << line << '\n';
        }
    }

    return document;
}

std::string ConfigIO::serializeIni(const IniDocument& document) {
    std::ostringstream out;
    for (const auto& line : document.preamble) {
        out << line << '\n';
    }

    for (size_t i = 0; i < document.sections.size(); ++i) {
        const auto& section = document.sections[i];
        if (i > 0) {
            const auto& previous = document.sections[i - 1];
            if (!previous.lines.empty() && previous.lines.back().is_entry) {
                out << '\n';
            }
        }
        out << '[' << section.name << "]\n";
        for (const auto& line : section.lines) {
            if (line.is_entry) {
                out << line.key << '=' << line.value << '\n';
            } else {
                out << line.raw << '\n';
            }
        }
    }

    return out.str();
}

void ConfigIO::writeIni(const std::string& filePath, const IniDocument& document) {
    std::ofstream outFile(filePath, std::ios::trunc);
    if (!outFile.is_open()) {
        throw StorageError(filePath, "Could not open config file for writing");
    }

    outFile << serializeIni(document);
    outFile.flush();
    if (!outFile) {
        throw StorageError(filePath, "Failed to write config file");
    }
}
