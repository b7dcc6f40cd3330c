#include "platform/gio_settings_store.hpp"

#include <iostream>

namespace {
SettingValue from_variant(const Glib::VariantBase& variant) {
    SettingValue value;
    if (!variant.gobj()) {
        return value;
    }

    value.type = variant.get_type_string();
    if (value.type == "s") {
        auto text = Glib::VariantBase::cast_dynamic<Glib::Variant<Glib::ustring>>(variant);
        value.strings.push_back(text.get().raw());
    } else if (value.type == "as") {
        auto list = Glib::VariantBase::cast_dynamic<Glib::Variant<std::vector<Glib::ustring>>>(variant);
        for (const auto& item : list.get()) {
            value.strings.push_back(item.raw());
        }
    }
    return value;
}

std::optional<Glib::VariantBase> to_variant(const SettingValue& value) {
    if (value.type == "s") {
        return Glib::Variant<Glib::ustring>::create(value.strings.empty() ? "" : value.strings.front());
    }
    if (value.type == "as") {
        std::vector<Glib::ustring> items(value.strings.begin(), value.strings.end());
        return Glib::Variant<std::vector<Glib::ustring>>::create(items);
    }
    return std::nullopt;
}
}

GioSettingsStore::GioSettingsStore() {
    Gio::init();
    m_schema_source = Gio::SettingsSchemaSource::get_default();
    if (!m_schema_source) {
        std::cerr << "No GSettings schemas are installed" << std::endl;
    }
}

Glib::RefPtr<Gio::SettingsSchema> GioSettingsStore::lookup_schema(const std::string& schema_id) const {
    if (!m_schema_source) {
        return {};
    }
    return m_schema_source->lookup(schema_id, true);
}

Glib::RefPtr<Gio::Settings> GioSettingsStore::settings_for(const std::string& schema_id,
                                                           const std::string& path) const {
    const std::string cache_key = path.empty() ? schema_id : schema_id + ":" + path;
    auto cached = m_settings_cache.find(cache_key);
    if (cached != m_settings_cache.end()) {
        return cached->second;
    }

    auto schema = lookup_schema(schema_id);
    if (!schema) {
        return {};
    }

    Glib::RefPtr<Gio::Settings> settings;
    if (path.empty()) {
        // g_settings_new() aborts on a relocatable schema without a path.
        if (schema->get_path().empty()) {
            return {};
        }
        settings = Gio::Settings::create(schema_id);
    } else {
        settings = Gio::Settings::create(schema_id, path);
    }

    m_settings_cache[cache_key] = settings;
    return settings;
}

bool GioSettingsStore::has_schema(const std::string& schema_id) const {
    return static_cast<bool>(lookup_schema(schema_id));
}

std::vector<std::string> GioSettingsStore::list_keys(const std::string& schema_id) const {
    std::vector<std::string> keys;
    auto schema = lookup_schema(schema_id);
    if (!schema) {
        return keys;
    }

    for (const auto& key : schema->list_keys()) {
        keys.push_back(key.raw());
    }
    return keys;
}

std::optional<SettingKeyInfo> GioSettingsStore::key_info(const std::string& schema_id,
                                                         const std::string& key) const {
    auto schema = lookup_schema(schema_id);
    if (!schema || !schema->has_key(key)) {
        return std::nullopt;
    }

    auto schema_key = schema->get_key(key);
    if (!schema_key) {
        return std::nullopt;
    }

    SettingKeyInfo info;
    info.type = schema_key->get_value_type().get_string();
    info.default_value = from_variant(schema_key->get_default_value());
    info.description = schema_key->get_description().raw();
    return info;
}

std::optional<SettingValue> GioSettingsStore::get_value(const std::string& schema_id, const std::string& path,
                                                        const std::string& key) const {
    auto schema = lookup_schema(schema_id);
    if (!schema || !schema->has_key(key)) {
        return std::nullopt;
    }

    auto settings = settings_for(schema_id, path);
    if (!settings) {
        return std::nullopt;
    }

    Glib::VariantBase variant;
    settings->get_value(key, variant);
    return from_variant(variant);
}

bool GioSettingsStore::set_value(const std::string& schema_id, const std::string& path, const std::string& key,
                                 const SettingValue& value) {
    auto info = key_info(schema_id, key);
    if (!info || info->type != value.type) {
        return false;
    }

    auto settings = settings_for(schema_id, path);
    if (!settings) {
        return false;
    }

    auto variant = to_variant(value);
    if (!variant) {
        return false;
    }
    return settings->set_value(key, *variant);
}

bool GioSettingsStore::reset(const std::string& schema_id, const std::string& path, const std::string& key) {
    auto schema = lookup_schema(schema_id);
    if (!schema || !schema->has_key(key)) {
        return false;
    }

    auto settings = settings_for(schema_id, path);
    if (!settings) {
        return false;
    }

    settings->reset(key);
    return true;
}

void GioSettingsStore::sync() {
    g_settings_sync();
}
