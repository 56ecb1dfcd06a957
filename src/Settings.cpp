/**
 * @file Settings.cpp
 * @brief Layered settings loading (JSON via nlohmann::json, TOML via toml++)
 */

#include "statpatch/Settings.hpp"
#include "statpatch/Errors.hpp"
#include "statpatch/Merge.hpp"
#include "statpatch/Util.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace statpatch {

namespace {

struct EnvBinding {
    const char* variable;
    const char* key;
};

const EnvBinding kEnvBindings[] = {
    {"STATS_BUCKET_NAME", "bucket"},
    {"LOG_LEVEL", "log_level"},
    {"DRY_RUN", "dry_run"},
    {"STATS_STORE_DIR", "store_dir"},
    {"STATS_TYPE_CONFLICT", "on_type_conflict"},
    {"STATS_MAX_ARRAY_INDEX", "max_array_index"},
};

Value toml_to_json(const toml::node& n) {
    if (auto v = n.as_string()) {
        return Value(v->get());
    } else if (auto v = n.as_integer()) {
        return Value(v->get());
    } else if (auto v = n.as_floating_point()) {
        return Value(v->get());
    } else if (auto v = n.as_boolean()) {
        return Value(v->get());
    } else if (auto v = n.as_array()) {
        Value arr = Value::array();
        for (const auto& elem : *v) arr.push_back(toml_to_json(elem));
        return arr;
    } else if (auto v = n.as_table()) {
        Value obj = Value::object();
        for (const auto& [k, val] : *v) {
            obj[std::string(k.str())] = toml_to_json(val);
        }
        return obj;
    } else if (auto v = n.as_date()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    } else if (auto v = n.as_time()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    } else if (auto v = n.as_date_time()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    }
    return Value();
}

std::string ext_of(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

std::string require_string(const Value& tree, const char* key) {
    const Value& v = tree.at(key);
    if (!v.is_string()) {
        throw SettingsError(std::string("Setting '") + key + "' must be a string, got " + type_name(v));
    }
    return v.get<std::string>();
}

bool as_flag(const Value& v, const char* key) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) return is_truthy_flag(trim(v.get<std::string>()));
    if (v.is_number_integer()) return v.get<std::int64_t>() != 0;
    throw SettingsError(std::string("Setting '") + key + "' must be a boolean, got " + type_name(v));
}

std::size_t as_index_limit(const Value& v, const char* key) {
    if (v.is_number_unsigned()) {
        return v.get<std::size_t>();
    }
    if (v.is_number_integer() && v.get<std::int64_t>() >= 0) {
        return static_cast<std::size_t>(v.get<std::int64_t>());
    }
    if (v.is_string()) {
        const std::string s = trim(v.get<std::string>());
        if (!s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return c >= '0' && c <= '9'; })) {
            try {
                return static_cast<std::size_t>(std::stoull(s));
            } catch (const std::out_of_range&) {
                // reported below
            }
        }
    }
    throw SettingsError(std::string("Setting '") + key + "' must be a non-negative integer");
}

} // namespace

Value ServiceSettings::to_json() const {
    return {
        {"bucket", bucket},
        {"log_level", to_string(log_level)},
        {"dry_run", dry_run},
        {"store_dir", store_dir},
        {"on_type_conflict", on_type_conflict == TypeConflictPolicy::Fail ? "fail" : "replace"},
        {"max_array_index", max_array_index},
    };
}

Value default_settings_tree() {
    return ServiceSettings{}.to_json();
}

Value read_settings_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec) || !fs::is_regular_file(path, ec)) {
        throw SettingsError("Settings file not found: " + path);
    }

    const std::string ext = ext_of(path);
    Value tree;
    if (ext == ".json") {
        std::ifstream ifs(path);
        if (!ifs) throw SettingsError("Failed to open settings file: " + path);
        try {
            ifs >> tree;
        } catch (const nlohmann::json::parse_error& e) {
            throw SettingsError("Parse error in '" + path + "': " + e.what());
        }
    } else if (ext == ".toml") {
        try {
            toml::table tbl = toml::parse_file(path);
            tree = toml_to_json(tbl);
        } catch (const toml::parse_error& e) {
            std::ostringstream oss;
            oss << e.description() << " (" << e.source().begin << ")";
            throw SettingsError("Parse error in '" + path + "': " + oss.str());
        }
    } else {
        throw SettingsError("Unsupported settings file type: " + ext);
    }

    if (!tree.is_object()) {
        throw SettingsError("Settings file root must be a table: " + path);
    }
    return tree;
}

Value environment_layer(const EnvLookup& env) {
    Value layer = Value::object();
    for (const auto& binding : kEnvBindings) {
        std::optional<std::string> value = env ? env(binding.variable) : get_env_var(binding.variable);
        if (!value) continue;
        if (std::string(binding.key) == "dry_run") {
            layer[binding.key] = is_truthy_flag(*value);
        } else {
            layer[binding.key] = *value;
        }
    }
    return layer;
}

ServiceSettings settings_from_tree(const Value& tree) {
    if (!tree.is_object()) {
        throw SettingsError("Settings must be an object");
    }

    Value merged = deep_merge(default_settings_tree(), tree);
    ServiceSettings settings;

    settings.bucket = require_string(merged, "bucket");
    if (trim(settings.bucket).empty()) {
        throw SettingsError("Setting 'bucket' must not be empty");
    }

    settings.log_level = parse_log_level(require_string(merged, "log_level"));
    settings.dry_run = as_flag(merged.at("dry_run"), "dry_run");
    settings.store_dir = require_string(merged, "store_dir");

    const std::string policy = to_lower(trim(require_string(merged, "on_type_conflict")));
    if (policy == "replace") {
        settings.on_type_conflict = TypeConflictPolicy::Replace;
    } else if (policy == "fail") {
        settings.on_type_conflict = TypeConflictPolicy::Fail;
    } else {
        throw SettingsError("Setting 'on_type_conflict' must be 'replace' or 'fail', got '" + policy + "'");
    }

    settings.max_array_index = as_index_limit(merged.at("max_array_index"), "max_array_index");
    return settings;
}

ServiceSettings load_settings(const SettingsSources& sources) {
    Value merged = default_settings_tree();

    if (sources.file_path) {
        deep_merge_into(merged, read_settings_file(*sources.file_path));
    }

    deep_merge_into(merged, environment_layer(sources.env));

    for (const auto& [key, value] : sources.overrides) {
        merged[key] = value;
    }

    return settings_from_tree(merged);
}

} // namespace statpatch
