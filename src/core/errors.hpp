#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

// Raised only for persistence failures a caller cannot silently recover from:
// profile documents and the kglobalshortcutsrc file.
class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& path, const std::string& message)
        : std::runtime_error(message + ": " + path), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

#endif
