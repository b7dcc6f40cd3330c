#ifndef PLATFORM_GIO_SETTINGS_STORE_HPP
#define PLATFORM_GIO_SETTINGS_STORE_HPP

#include "platform/settings_store.hpp"

#include <giomm.h>

#include <map>
#include <string>

// SettingsStore over the session's GSettings (dconf) backend.
class GioSettingsStore : public SettingsStore {
public:
    GioSettingsStore();

    bool has_schema(const std::string& schema_id) const override;
    std::vector<std::string> list_keys(const std::string& schema_id) const override;
    std::optional<SettingKeyInfo> key_info(const std::string& schema_id, const std::string& key) const override;

    std::optional<SettingValue> get_value(const std::string& schema_id, const std::string& path,
                                          const std::string& key) const override;
    bool set_value(const std::string& schema_id, const std::string& path, const std::string& key,
                   const SettingValue& value) override;
    bool reset(const std::string& schema_id, const std::string& path, const std::string& key) override;

    // Blocks until pending writes reach the backend.
    static void sync();

private:
    Glib::RefPtr<Gio::SettingsSchema> lookup_schema(const std::string& schema_id) const;
    Glib::RefPtr<Gio::Settings> settings_for(const std::string& schema_id, const std::string& path) const;

    Glib::RefPtr<Gio::SettingsSchemaSource> m_schema_source;
    mutable std::map<std::string, Glib::RefPtr<Gio::Settings>> m_settings_cache;
};

#endif
