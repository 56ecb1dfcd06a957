/**
 * @file Settings.hpp
 * @brief Service settings from defaults, a config file, the environment
 *        and command-line overrides
 *
 * Layers are merged in precedence order (later wins):
 *   defaults → file (JSON or TOML) → environment → overrides
 *
 * | key               | environment            | default                  |
 * |-------------------|------------------------|--------------------------|
 * | bucket            | STATS_BUCKET_NAME      | "zoolanding-quick-stats" |
 * | log_level         | LOG_LEVEL              | "INFO"                   |
 * | dry_run           | DRY_RUN                | false                    |
 * | store_dir         | STATS_STORE_DIR        | "stats-store"            |
 * | on_type_conflict  | STATS_TYPE_CONFLICT    | "replace"                |
 * | max_array_index   | STATS_MAX_ARRAY_INDEX  | 100000                   |
 *
 * DRY_RUN is true for "1", "true", "TRUE", "yes" or "YES".
 */

#ifndef STATPATCH_SETTINGS_HPP
#define STATPATCH_SETTINGS_HPP

#include "statpatch/Value.hpp"
#include "statpatch/DotPath.hpp"
#include "statpatch/Logging.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace statpatch {

struct ServiceSettings {
    std::string bucket = "zoolanding-quick-stats";
    LogLevel log_level = LogLevel::Info;
    bool dry_run = false; ///< Forces every request into dry-run
    std::string store_dir = "stats-store";
    TypeConflictPolicy on_type_conflict = TypeConflictPolicy::Replace;
    std::size_t max_array_index = kDefaultMaxArrayIndex;

    ResolveOptions resolve_options() const {
        return ResolveOptions{on_type_conflict, max_array_index};
    }

    Value to_json() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

struct SettingsSources {
    std::optional<std::string> file_path;
    std::map<std::string, Value> overrides; // final precedence
    EnvLookup env;                          // empty: process environment
};

/**
 * @brief Settings tree with every key at its default
 */
Value default_settings_tree();

/**
 * @brief Read a JSON or TOML settings file (by extension)
 *
 * @throws SettingsError if the file cannot be read or parsed, the extension
 *         is unsupported, or the root is not a table/object
 */
Value read_settings_file(const std::string& path);

/**
 * @brief Settings keys present in the environment, as a tree
 */
Value environment_layer(const EnvLookup& env);

/**
 * @brief Validate a merged tree into typed settings
 * @throws SettingsError naming the offending key
 */
ServiceSettings settings_from_tree(const Value& tree);

/**
 * @brief Merge every layer and validate the result
 */
ServiceSettings load_settings(const SettingsSources& sources);

} // namespace statpatch

#endif // STATPATCH_SETTINGS_HPP
