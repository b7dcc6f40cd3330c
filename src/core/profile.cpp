#include "core/profile.hpp"

#include "core/errors.hpp"

#include <glibmm/datetime.h>
#include <json-glib/json-glib.h>

#include <filesystem>
#include <utility>

namespace {
std::string json_string_member(JsonObject* obj, const char* member, const std::string& fallback = "") {
    if (!obj || !json_object_has_member(obj, member)) {
        return fallback;
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) {
        return fallback;
    }

    return json_node_get_string(node);
}

bool json_bool_member(JsonObject* obj, const char* member, bool fallback = false) {
    if (!obj || !json_object_has_member(obj, member)) {
        return fallback;
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_BOOLEAN) {
        return fallback;
    }

    return json_node_get_boolean(node);
}

JsonObject* json_object_member(JsonObject* obj, const char* member) {
    if (!obj || !json_object_has_member(obj, member)) {
        return nullptr;
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) {
        return nullptr;
    }
    return json_node_get_object(node);
}

std::vector<std::string> member_names(JsonObject* obj) {
    std::vector<std::string> names;
    GList* members = json_object_get_members(obj);
    for (GList* it = members; it != nullptr; it = it->next) {
        names.emplace_back(static_cast<const char*>(it->data));
    }
    g_list_free(members);
    return names;
}

std::vector<std::string> accelerator_list(JsonNode* node) {
    std::vector<std::string> accelerators;
    if (!node) {
        return accelerators;
    }

    if (JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == G_TYPE_STRING) {
        accelerators.emplace_back(json_node_get_string(node));
        return accelerators;
    }

    if (!JSON_NODE_HOLDS_ARRAY(node)) {
        return accelerators;
    }

    JsonArray* array = json_node_get_array(node);
    guint length = json_array_get_length(array);
    for (guint i = 0; i < length; ++i) {
        JsonNode* element = json_array_get_element(array, i);
        if (element && JSON_NODE_HOLDS_VALUE(element) && json_node_get_value_type(element) == G_TYPE_STRING) {
            accelerators.emplace_back(json_node_get_string(element));
        }
    }
    return accelerators;
}

std::optional<MetadataValue> metadata_value(JsonNode* node) {
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) {
        return std::nullopt;
    }

    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_BOOLEAN) {
        return MetadataValue(static_cast<bool>(json_node_get_boolean(node)));
    }
    if (type == G_TYPE_STRING) {
        return MetadataValue(std::string(json_node_get_string(node)));
    }
    if (type == G_TYPE_INT64) {
        return MetadataValue(std::to_string(json_node_get_int(node)));
    }
    if (type == G_TYPE_DOUBLE) {
        return MetadataValue(std::to_string(json_node_get_double(node)));
    }
    return std::nullopt;
}

void add_string_member(JsonBuilder* builder, const char* name, const std::string& value) {
    json_builder_set_member_name(builder, name);
    json_builder_add_string_value(builder, value.c_str());
}

void add_bool_member(JsonBuilder* builder, const char* name, bool value) {
    json_builder_set_member_name(builder, name);
    json_builder_add_boolean_value(builder, value);
}
}

const char* fn_mode_to_string(FnMode mode) {
    switch (mode) {
        case FnMode::Disabled: return "disabled";
        case FnMode::FKeys: return "fkeys";
        case FnMode::Media: return "media";
    }
    return "media";
}

FnMode fn_mode_from_string(const std::string& value) {
    if (value == "disabled") return FnMode::Disabled;
    if (value == "fkeys") return FnMode::FKeys;
    return FnMode::Media;
}

std::map<std::string, int> MacKeyboardConfig::to_modprobe_options() const {
    return {
        {"fnmode", static_cast<int>(fn_mode)},
        {"swap_opt_cmd", swap_opt_cmd ? 1 : 0},
        {"swap_fn_leftctrl", swap_fn_leftctrl ? 1 : 0},
        {"iso_layout", iso_layout ? 1 : 0},
    };
}

bool MacKeyboardConfig::operator==(const MacKeyboardConfig& other) const {
    return fn_mode == other.fn_mode && swap_opt_cmd == other.swap_opt_cmd &&
           swap_fn_leftctrl == other.swap_fn_leftctrl && iso_layout == other.iso_layout;
}

std::vector<std::string> XkbOptions::to_xkb_options() const {
    std::vector<std::string> options;
    for (const auto* option : {&caps_lock, &alt_win, &compose, &numpad}) {
        if (!option->empty()) {
            options.push_back(*option);
        }
    }
    return options;
}

bool XkbOptions::empty() const {
    return caps_lock.empty() && alt_win.empty() && compose.empty() && numpad.empty();
}

Profile::Profile(std::string profile_name)
    : name(std::move(profile_name)) {
    created = keybind::now_iso8601();
    modified = created;
}

std::string Profile::storage_key(const std::string& location, const std::string& key) {
    return location + "." + key;
}

std::optional<std::pair<std::string, std::string>> Profile::split_storage_key(const std::string& storage_key) {
    size_t pos = storage_key.rfind('.');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(storage_key.substr(0, pos), storage_key.substr(pos + 1));
}

void Profile::set_shortcut(const std::string& location, const std::string& key,
                           std::vector<std::string> accelerators) {
    shortcuts[storage_key(location, key)] = std::move(accelerators);
}

std::optional<std::vector<std::string>> Profile::get_shortcut(const std::string& location,
                                                              const std::string& key) const {
    auto it = shortcuts.find(storage_key(location, key));
    if (it == shortcuts.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Profile::is_preset() const {
    auto it = metadata.find("preset");
    if (it == metadata.end()) {
        return false;
    }
    if (const bool* flag = std::get_if<bool>(&it->second)) {
        return *flag;
    }
    return std::get<std::string>(it->second) == "true";
}

std::string Profile::metadata_string(const std::string& key) const {
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return "";
    }
    if (const std::string* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    return std::get<bool>(it->second) ? "true" : "false";
}

Profile Profile::load_from_file(const std::string& path) {
    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    if (!json_parser_load_from_file(parser, path.c_str(), &error)) {
        std::string detail = error ? error->message : "unknown error";
        if (error) {
            g_error_free(error);
        }
        g_object_unref(parser);
        throw StorageError(path, "Failed to read profile (" + detail + ")");
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_object_unref(parser);
        throw StorageError(path, "Profile document is not an object");
    }
    JsonObject* root_obj = json_node_get_object(root);

    JsonObject* header = json_object_member(root_obj, "profile");
    Profile profile(json_string_member(header, "name", std::filesystem::path(path).stem().string()));
    profile.description = json_string_member(header, "description");
    profile.author = json_string_member(header, "author");
    profile.version = json_string_member(header, "version", "1.0");
    profile.created = json_string_member(header, "created", profile.created);
    profile.modified = json_string_member(header, "modified", profile.modified);

    if (JsonObject* shortcuts = json_object_member(root_obj, "shortcuts")) {
        for (const auto& storage_key : member_names(shortcuts)) {
            profile.shortcuts[storage_key] =
                accelerator_list(json_object_get_member(shortcuts, storage_key.c_str()));
        }
    }

    if (JsonObject* xkb = json_object_member(root_obj, "xkb")) {
        profile.xkb_options.caps_lock = json_string_member(xkb, "caps_lock");
        profile.xkb_options.alt_win = json_string_member(xkb, "alt_win");
        profile.xkb_options.compose = json_string_member(xkb, "compose");
        profile.xkb_options.numpad = json_string_member(xkb, "numpad");
    }

    if (JsonObject* mac = json_object_member(root_obj, "mac_keyboard")) {
        MacKeyboardConfig config;
        config.fn_mode = fn_mode_from_string(json_string_member(mac, "fn_mode", "media"));
        config.swap_opt_cmd = json_bool_member(mac, "swap_opt_cmd");
        config.swap_fn_leftctrl = json_bool_member(mac, "swap_fn_leftctrl");
        config.iso_layout = json_bool_member(mac, "iso_layout");
        profile.mac_keyboard = config;
    }

    if (JsonObject* metadata = json_object_member(root_obj, "metadata")) {
        for (const auto& key : member_names(metadata)) {
            auto value = metadata_value(json_object_get_member(metadata, key.c_str()));
            if (value) {
                profile.metadata[key] = std::move(*value);
            }
        }
    }

    g_object_unref(parser);
    return profile;
}

void Profile::save_to_file(const std::string& path) {
    modified = keybind::now_iso8601();
    if (created.empty()) {
        created = modified;
    }

    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "profile");
    json_builder_begin_object(builder);
    add_string_member(builder, "name", name);
    add_string_member(builder, "description", description);
    add_string_member(builder, "author", author);
    add_string_member(builder, "version", version);
    add_string_member(builder, "created", created);
    add_string_member(builder, "modified", modified);
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "shortcuts");
    json_builder_begin_object(builder);
    for (const auto& [storage_key, accelerators] : shortcuts) {
        json_builder_set_member_name(builder, storage_key.c_str());
        json_builder_begin_array(builder);
        for (const auto& accelerator : accelerators) {
            json_builder_add_string_value(builder, accelerator.c_str());
        }
        json_builder_end_array(builder);
    }
    json_builder_end_object(builder);

    if (!xkb_options.empty()) {
        json_builder_set_member_name(builder, "xkb");
        json_builder_begin_object(builder);
        if (!xkb_options.caps_lock.empty()) add_string_member(builder, "caps_lock", xkb_options.caps_lock);
        if (!xkb_options.alt_win.empty()) add_string_member(builder, "alt_win", xkb_options.alt_win);
        if (!xkb_options.compose.empty()) add_string_member(builder, "compose", xkb_options.compose);
        if (!xkb_options.numpad.empty()) add_string_member(builder, "numpad", xkb_options.numpad);
        json_builder_end_object(builder);
    }

    if (mac_keyboard) {
        json_builder_set_member_name(builder, "mac_keyboard");
        json_builder_begin_object(builder);
        add_string_member(builder, "fn_mode", fn_mode_to_string(mac_keyboard->fn_mode));
        add_bool_member(builder, "swap_opt_cmd", mac_keyboard->swap_opt_cmd);
        add_bool_member(builder, "swap_fn_leftctrl", mac_keyboard->swap_fn_leftctrl);
        add_bool_member(builder, "iso_layout", mac_keyboard->iso_layout);
        json_builder_end_object(builder);
    }

    if (!metadata.empty()) {
        json_builder_set_member_name(builder, "metadata");
        json_builder_begin_object(builder);
        for (const auto& [key, value] : metadata) {
            if (const bool* flag = std::get_if<bool>(&value)) {
                add_bool_member(builder, key.c_str(), *flag);
            } else {
                add_string_member(builder, key.c_str(), std::get<std::string>(value));
            }
        }
        json_builder_end_object(builder);
    }

    json_builder_end_object(builder);

    JsonNode* root = json_builder_get_root(builder);
    JsonGenerator* generator = json_generator_new();
    json_generator_set_pretty(generator, TRUE);
    json_generator_set_root(generator, root);

    GError* error = nullptr;
    bool written = json_generator_to_file(generator, path.c_str(), &error);
    std::string detail = error ? error->message : "unknown error";
    if (error) {
        g_error_free(error);
    }

    json_node_free(root);
    g_object_unref(generator);
    g_object_unref(builder);

    if (!written) {
        throw StorageError(path, "Failed to write profile (" + detail + ")");
    }
}

std::string keybind::now_iso8601() {
    return Glib::DateTime::create_now_local().format_iso8601().raw();
}

std::string keybind::now_compact_timestamp() {
    return Glib::DateTime::create_now_local().format("%Y%m%d-%H%M%S").raw();
}
