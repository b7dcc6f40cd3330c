#ifndef TESTS_TEMP_DIR_HPP
#define TESTS_TEMP_DIR_HPP

#include <glib.h>

#include <filesystem>
#include <stdexcept>
#include <string>

// Scratch directory removed with everything in it when the object goes away.
class TempDir {
public:
    TempDir() {
        GError* error = nullptr;
        gchar* created = g_dir_make_tmp("keybind-settings-test-XXXXXX", &error);
        if (!created) {
            std::string detail = error ? error->message : "unknown error";
            if (error) {
                g_error_free(error);
            }
            throw std::runtime_error("Failed to create temporary directory: " + detail);
        }
        m_path = created;
        g_free(created);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return m_path; }
    std::string file(const std::string& name) const { return m_path + "/" + name; }

private:
    std::string m_path;
};

#endif
