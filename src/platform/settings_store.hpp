#ifndef PLATFORM_SETTINGS_STORE_HPP
#define PLATFORM_SETTINGS_STORE_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

// A GVariant reduced to what shortcut keys carry: "s" holds one string,
// "as" any number. Other types keep only their type string.
struct SettingValue {
    std::string type;
    std::vector<std::string> strings;

    static SettingValue string(const std::string& value) { return {"s", {value}}; }
    static SettingValue string_list(std::vector<std::string> values) { return {"as", std::move(values)}; }
};

struct SettingKeyInfo {
    std::string type;
    SettingValue default_value;
    std::string description;
};

// Schema-described key-value store. An empty path addresses a schema's
// fixed location; relocatable schemas need an explicit path.
class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    virtual bool has_schema(const std::string& schema_id) const = 0;
    virtual std::vector<std::string> list_keys(const std::string& schema_id) const = 0;
    virtual std::optional<SettingKeyInfo> key_info(const std::string& schema_id, const std::string& key) const = 0;

    virtual std::optional<SettingValue> get_value(const std::string& schema_id, const std::string& path,
                                                  const std::string& key) const = 0;
    virtual bool set_value(const std::string& schema_id, const std::string& path, const std::string& key,
                           const SettingValue& value) = 0;
    virtual bool reset(const std::string& schema_id, const std::string& path, const std::string& key) = 0;
};

#endif
