/**
 * @file test_settings.cpp
 * @brief Tests for layered settings: defaults, files, environment, overrides
 */

#include <gtest/gtest.h>

#include "statpatch/Errors.hpp"
#include "statpatch/Settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;
using namespace statpatch;

namespace {

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    TempFile(const std::string& filename, const std::string& content)
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream f(path_);
        f << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

/**
 * @brief RAII wrapper for a process environment variable
 */
class EnvGuard {
public:
    EnvGuard(const std::string& name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name.c_str())) {
            old_value_ = old;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~EnvGuard() {
        if (old_value_) {
            setenv(name_.c_str(), old_value_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> old_value_;
};

EnvLookup env_from(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

SettingsSources no_env() {
    SettingsSources sources;
    sources.env = env_from({});
    return sources;
}

} // namespace

TEST(SettingsTest, Defaults) {
    ServiceSettings s = load_settings(no_env());
    EXPECT_EQ(s.bucket, "zoolanding-quick-stats");
    EXPECT_EQ(s.log_level, LogLevel::Info);
    EXPECT_FALSE(s.dry_run);
    EXPECT_EQ(s.store_dir, "stats-store");
    EXPECT_EQ(s.on_type_conflict, TypeConflictPolicy::Replace);
    EXPECT_EQ(s.max_array_index, kDefaultMaxArrayIndex);
}

TEST(SettingsTest, DefaultTreeRoundTrips) {
    ServiceSettings s = settings_from_tree(default_settings_tree());
    EXPECT_EQ(s.to_json(), default_settings_tree());
}

TEST(SettingsTest, ResolveOptionsFollowSettings) {
    ServiceSettings s;
    s.on_type_conflict = TypeConflictPolicy::Fail;
    s.max_array_index = 10;
    ResolveOptions opts = s.resolve_options();
    EXPECT_EQ(opts.on_conflict, TypeConflictPolicy::Fail);
    EXPECT_EQ(opts.max_index, 10u);
}

// ============================================================================
// Environment
// ============================================================================

TEST(SettingsEnvTest, ReadsBoundVariables) {
    SettingsSources sources;
    sources.env = env_from({
        {"STATS_BUCKET_NAME", "my-bucket"},
        {"LOG_LEVEL", "debug"},
        {"DRY_RUN", "yes"},
        {"STATS_STORE_DIR", "/var/stats"},
        {"STATS_TYPE_CONFLICT", "FAIL"},
        {"STATS_MAX_ARRAY_INDEX", "250"},
    });

    ServiceSettings s = load_settings(sources);
    EXPECT_EQ(s.bucket, "my-bucket");
    EXPECT_EQ(s.log_level, LogLevel::Debug);
    EXPECT_TRUE(s.dry_run);
    EXPECT_EQ(s.store_dir, "/var/stats");
    EXPECT_EQ(s.on_type_conflict, TypeConflictPolicy::Fail);
    EXPECT_EQ(s.max_array_index, 250u);
}

TEST(SettingsEnvTest, DryRunSpellings) {
    for (const char* on : {"1", "true", "TRUE", "yes", "YES"}) {
        EXPECT_EQ(environment_layer(env_from({{"DRY_RUN", on}}))["dry_run"], true) << on;
    }
    for (const char* off : {"0", "false", "no", "True", ""}) {
        EXPECT_EQ(environment_layer(env_from({{"DRY_RUN", off}}))["dry_run"], false) << off;
    }
}

TEST(SettingsEnvTest, UnsetVariablesAreAbsent) {
    EXPECT_EQ(environment_layer(env_from({})), Value::object());
}

TEST(SettingsEnvTest, ProcessEnvironmentByDefault) {
    EnvGuard guard("STATS_BUCKET_NAME", "from-process-env");
    Value layer = environment_layer(EnvLookup{});
    EXPECT_EQ(layer["bucket"], "from-process-env");
}

TEST(SettingsEnvTest, UnknownLogLevelFallsBackToInfo) {
    SettingsSources sources;
    sources.env = env_from({{"LOG_LEVEL", "chatty"}});
    EXPECT_EQ(load_settings(sources).log_level, LogLevel::Info);
}

// ============================================================================
// Files
// ============================================================================

TEST(SettingsFileTest, Json) {
    TempFile file("statpatch_settings_test.json",
                  R"({"bucket": "json-bucket", "dry_run": true, "max_array_index": 7})");
    SettingsSources sources = no_env();
    sources.file_path = file.path();

    ServiceSettings s = load_settings(sources);
    EXPECT_EQ(s.bucket, "json-bucket");
    EXPECT_TRUE(s.dry_run);
    EXPECT_EQ(s.max_array_index, 7u);
    EXPECT_EQ(s.store_dir, "stats-store");
}

TEST(SettingsFileTest, Toml) {
    TempFile file("statpatch_settings_test.toml", R"(
bucket = "toml-bucket"
log_level = "ERROR"
on_type_conflict = "fail"
max_array_index = 42
)");
    SettingsSources sources = no_env();
    sources.file_path = file.path();

    ServiceSettings s = load_settings(sources);
    EXPECT_EQ(s.bucket, "toml-bucket");
    EXPECT_EQ(s.log_level, LogLevel::Error);
    EXPECT_EQ(s.on_type_conflict, TypeConflictPolicy::Fail);
    EXPECT_EQ(s.max_array_index, 42u);
}

TEST(SettingsFileTest, MissingFile) {
    EXPECT_THROW(read_settings_file("/nonexistent/statpatch.json"), SettingsError);
}

TEST(SettingsFileTest, UnsupportedExtension) {
    TempFile file("statpatch_settings_test.yaml", "bucket: x\n");
    EXPECT_THROW(read_settings_file(file.path()), SettingsError);
}

TEST(SettingsFileTest, ParseErrors) {
    TempFile json("statpatch_settings_bad.json", "{\"bucket\": ");
    EXPECT_THROW(read_settings_file(json.path()), SettingsError);

    TempFile toml("statpatch_settings_bad.toml", "bucket = \n");
    EXPECT_THROW(read_settings_file(toml.path()), SettingsError);
}

TEST(SettingsFileTest, RootMustBeObject) {
    TempFile file("statpatch_settings_array.json", "[1, 2]");
    EXPECT_THROW(read_settings_file(file.path()), SettingsError);
}

// ============================================================================
// Precedence and validation
// ============================================================================

TEST(SettingsPrecedenceTest, LaterLayersWin) {
    TempFile file("statpatch_settings_precedence.json",
                  R"({"bucket": "file", "store_dir": "file-dir", "log_level": "DEBUG"})");
    SettingsSources sources;
    sources.file_path = file.path();
    sources.env = env_from({{"STATS_BUCKET_NAME", "env"}, {"STATS_STORE_DIR", "env-dir"}});
    sources.overrides["bucket"] = "cli";

    ServiceSettings s = load_settings(sources);
    EXPECT_EQ(s.bucket, "cli");
    EXPECT_EQ(s.store_dir, "env-dir");
    EXPECT_EQ(s.log_level, LogLevel::Debug);
}

TEST(SettingsValidationTest, RejectsBadValues) {
    EXPECT_THROW(settings_from_tree(Value::parse(R"({"bucket": ""})")), SettingsError);
    EXPECT_THROW(settings_from_tree(Value::parse(R"({"bucket": 3})")), SettingsError);
    EXPECT_THROW(settings_from_tree(Value::parse(R"({"on_type_conflict": "merge"})")), SettingsError);
    EXPECT_THROW(settings_from_tree(Value::parse(R"({"max_array_index": -1})")), SettingsError);
    EXPECT_THROW(settings_from_tree(Value::parse(R"({"max_array_index": "ten"})")), SettingsError);
    EXPECT_THROW(settings_from_tree(Value::parse(R"({"dry_run": [true]})")), SettingsError);
    EXPECT_THROW(settings_from_tree(Value::parse("[]")), SettingsError);
}

TEST(SettingsValidationTest, InvalidEnvironmentValue) {
    SettingsSources sources;
    sources.env = env_from({{"STATS_MAX_ARRAY_INDEX", "lots"}});
    EXPECT_THROW(load_settings(sources), SettingsError);
}

TEST(SettingsValidationTest, ErrorNamesKey) {
    try {
        settings_from_tree(Value::parse(R"({"on_type_conflict": "merge"})"));
        FAIL() << "expected SettingsError";
    } catch (const SettingsError& e) {
        EXPECT_NE(std::string(e.what()).find("on_type_conflict"), std::string::npos);
    }
}
