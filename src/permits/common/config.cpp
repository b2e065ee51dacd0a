#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <type_traits>
#include <pwd.h>
#include <sys/types.h>
#include <toml.hpp>
#include <unistd.h>
#include "permits/common/config.hpp"
#include "permits/common/log.hpp"

Config g_config{};

namespace {
std::filesystem::path default_config_path() {
    const char* override_path = getenv("PERMITS_CONFIG_PATH");
    if (override_path && override_path[0] != '\0') {
        return override_path;
    }

    std::filesystem::path config_dir;
    const char* config_home = getenv("XDG_CONFIG_HOME");
    if (config_home && config_home[0] != '\0') {
        config_dir = config_home;
    } else {
        const char* homedir = getenv("HOME");
        if (homedir == nullptr) {
            struct passwd* pw = getpwuid(getuid());
            if (pw == nullptr) {
                return {};
            }
            homedir = pw->pw_dir;
        }
        config_dir = std::filesystem::path(homedir) / ".config";
    }

    return config_dir / "permits" / "config.toml";
}
} // namespace

bool Config::initialize() {
    std::filesystem::path config_path = default_config_path();
    if (config_path.empty()) {
        return false;
    }

    std::error_code ec;
    std::filesystem::path config_dir = config_path.parent_path();
    if (!config_dir.empty()) {
        if (!std::filesystem::exists(config_dir, ec)) {
            if (!std::filesystem::create_directories(config_dir, ec)) {
                return false;
            }
        } else if (!std::filesystem::is_directory(config_dir, ec)) {
            return false;
        }
    }

    if (!std::filesystem::exists(config_path, ec)) {
        if (!save(config_path, g_config)) {
            return false;
        }
        LOG("Created configuration file: %s", config_path.c_str());
    }

    g_config = load(config_path);
    return true;
}

const char* Config::getDescription(const char* name) {
#define X(group, type, config_name, default_value, env_name, description, required)                                                                  \
    if (strcmp(name, #config_name) == 0) {                                                                                                           \
        return description;                                                                                                                          \
    }
#include "config.inc"
#undef X
    return nullptr;
}

template <typename Type>
bool loadFromToml(const toml::value& toml, const char* group, const char* name, Type& value) {
    if (toml.contains(group)) {
        const toml::value& group_toml = toml.at(group);
        if (group_toml.contains(name)) {
            const toml::value& value_toml = group_toml.at(name);
            if constexpr (std::is_same_v<Type, bool>) {
                if (!value_toml.is_boolean()) {
                    WARN("Configuration value %s.%s is not a boolean, ignoring it", group, name);
                    return false;
                }
                value = value_toml.as_boolean();
                return true;
            } else if constexpr (std::is_same_v<Type, u64>) {
                if (!value_toml.is_integer() || value_toml.as_integer() < 0) {
                    WARN("Configuration value %s.%s is not a non-negative integer, ignoring it", group, name);
                    return false;
                }
                value = value_toml.as_integer();
                return true;
            } else {
                static_assert(!sizeof(Type), "Unsupported configuration type");
            }
        }
    }
    return false;
}

void addToEnvironment(Config& config, const char* env_name, const char* env) {
    config.__environment += "\n";
    config.__environment += env_name;
    config.__environment += "=";
    config.__environment += env;
}

template <typename Type>
bool loadFromEnv(Config& config, Type& value, const char* env_name, const char* env) {
    addToEnvironment(config, env_name, env);

    if constexpr (std::is_same_v<Type, bool>) {
        value = is_truthy(env);
        return true;
    } else if constexpr (std::is_same_v<Type, u64>) {
        try {
            value = get_int(env);
        } catch (const std::exception&) {
            WARN("Environment variable %s=%s is not an integer, ignoring it", env_name, env);
            return false;
        }
        return true;
    }

    return false;
}

Config Config::load(const std::filesystem::path& path) {
    Config config = {};
    config.config_path = path;

    toml::value toml(toml::table{});
    auto attempt = toml::try_parse(path);
    if (attempt.is_ok()) {
        toml = attempt.unwrap();
    }

#define X(group, type, name, default_value, env_name, description, required)                                                                         \
    {                                                                                                                                                \
        bool loaded = false;                                                                                                                         \
        const char* env = getenv(#env_name);                                                                                                         \
        if (env) {                                                                                                                                   \
            loaded = loadFromEnv<type>(config, config.name, #env_name, env);                                                                         \
        } else {                                                                                                                                     \
            loaded = loadFromToml<type>(toml, #group, #name, config.name);                                                                           \
        }                                                                                                                                            \
        if (!loaded && required) {                                                                                                                   \
            ERROR("A value for %s is required but was not set. Please set it using the %s environment variable or in the configuration file %s in "  \
                  "group [\"%s\"]",                                                                                                                  \
                  #name, #env_name, path.c_str(), #group);                                                                                           \
        }                                                                                                                                            \
    }
#include "config.inc"
#undef X

    return config;
}

bool Config::save(const std::filesystem::path& path, const Config& config) {
    toml::ordered_value toml(toml::ordered_table{});

#define X(group, type, name, default_value, env_name, description, required)                                                                         \
    {                                                                                                                                                \
        if (!toml.contains(#group)) {                                                                                                                \
            toml[#group] = toml::ordered_table{};                                                                                                    \
        }                                                                                                                                            \
        auto& value = toml[#group][#name];                                                                                                           \
        value = config.name;                                                                                                                         \
        value.comments().push_back("# " #name " (" #type ")");                                                                                       \
        value.comments().push_back("# Description: " description);                                                                                   \
        value.comments().push_back("# Environment variable: " #env_name);                                                                            \
    }
#include "config.inc"
#undef X

    std::ofstream ofs(path);
    if (!ofs) {
        WARN("Failed to open %s for writing", path.c_str());
        return false;
    }

    ofs << "# Autogenerated TOML configuration file for permits\n";
    ofs << "# You may change any values here, or their respective environment variable\n";
    ofs << "# The environment variables override the values here\n";
    ofs << toml;
    return ofs.good();
}
