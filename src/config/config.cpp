#include "binpack/config.hpp"
#include "binpack/executable_probe.hpp"
#include "binpack/platform.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace binpack {

namespace {

// Helper to get an optional string; a present value of another type is an error
bool read_string(const nlohmann::json& j, const std::string& key,
                 std::optional<std::string>& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) {
        error = key + " must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool read_string_array(const nlohmann::json& j, const std::string& key,
                       std::optional<std::vector<std::string>>& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_array()) {
        error = key + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& elem : j[key]) {
        if (!elem.is_string()) {
            error = key + " must be an array of strings";
            return false;
        }
        values.push_back(elem.get<std::string>());
    }
    out = values;
    return true;
}

// First non-empty value wins
std::string first_of(std::initializer_list<std::optional<std::string>> values) {
    for (const auto& v : values) {
        if (v && !v->empty()) return *v;
    }
    return "";
}

std::optional<std::string> non_empty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

ResolveResult invalid(const std::string& message) {
    ResolveResult result;
    result.code = ErrorCode::InvalidConfiguration;
    result.error = message;
    return result;
}

} // namespace

ConfigFileParseResult parse_config_file(const std::string& json_str,
                                        const std::string& source_path) {
    ConfigFileParseResult result;
    result.config.source_path = source_path;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = "invalid JSON: " + std::string(e.what());
        return result;
    }

    if (!j.is_object()) {
        result.error = "configuration must be a JSON object";
        return result;
    }

    if (!read_string(j, "log_level", result.config.log_level, result.error)) {
        return result;
    }

    if (j.contains("rename")) {
        const auto& rename = j["rename"];
        if (!rename.is_object()) {
            result.error = "rename must be an object";
            return result;
        }

        std::optional<std::string> policy;
        if (!read_string(rename, "policy", policy, result.error)) {
            return result;
        }
        if (policy) {
            auto mode = parse_rename_mode(*policy);
            if (!mode) {
                result.error = "rename.policy must be first-separator or before-version, got " + *policy;
                return result;
            }
            result.config.rename_mode = *mode;
        }

        if (!read_string(rename, "separators", result.config.separators, result.error) ||
            !read_string_array(rename, "preserved_suffixes", result.config.preserved_suffixes, result.error)) {
            result.error = "rename." + result.error;
            return result;
        }

        if (rename.contains("names")) {
            if (!rename["names"].is_object()) {
                result.error = "rename.names must be an object";
                return result;
            }
            for (auto& [key, val] : rename["names"].items()) {
                if (!val.is_string() || val.get<std::string>().empty()) {
                    result.error = "rename.names." + key + " must be a non-empty string";
                    return result;
                }
                result.config.names[key] = val.get<std::string>();
            }
        }
    }

    result.ok = true;
    return result;
}

ConfigFileParseResult load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigFileParseResult result;
        result.error = "cannot read configuration file: " + path;
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto result = parse_config_file(buffer.str(), path);
    if (!result.ok) {
        result.error = path + ": " + result.error;
    }
    return result;
}

ResolveResult resolve_normalize_options(const OptionOverrides& overrides,
                                        bool require_prefix,
                                        bool require_rename_mode) {
    ConfigFile file;
    std::string config_path = first_of({non_empty(overrides.config_path), get_env(kEnvConfigFile)});
    if (!config_path.empty()) {
        auto loaded = load_config_file(config_path);
        if (!loaded.ok) {
            return invalid(loaded.error);
        }
        file = loaded.config;
    }

    ResolveResult result;
    auto& opts = result.options;

    opts.package.name = first_of({non_empty(overrides.name), get_env(kEnvPackageName)});
    opts.package.version = first_of({non_empty(overrides.version), get_env(kEnvPackageVersion)});
    opts.package.target_platform = first_of({non_empty(overrides.target_platform), get_env(kEnvTargetPlatform)});
    opts.prefix = first_of({non_empty(overrides.prefix), get_env(kEnvPrefix)});
    opts.work_dir = first_of({non_empty(overrides.work_dir)});
    if (opts.work_dir.empty()) {
        std::error_code ec;
        opts.work_dir = std::filesystem::current_path(ec).string();
        if (ec) {
            return invalid("cannot determine the current directory: " + ec.message());
        }
    }

    if (opts.package.name.empty()) {
        return invalid(std::string("package name missing (--name or ") + kEnvPackageName + ")");
    }
    if (opts.package.version.empty()) {
        return invalid(std::string("package version missing (--version or ") + kEnvPackageVersion + ")");
    }
    if (opts.package.target_platform.empty()) {
        return invalid(std::string("target platform missing (--platform or ") + kEnvTargetPlatform + ")");
    }
    if (require_prefix && opts.prefix.empty()) {
        return invalid(std::string("installation prefix missing (--prefix or ") + kEnvPrefix + ")");
    }

    // Rename policy
    std::string policy = first_of({non_empty(overrides.rename_policy), get_env(kEnvRenamePolicy)});
    if (!policy.empty()) {
        auto mode = parse_rename_mode(policy);
        if (!mode) {
            return invalid("unknown rename policy " + policy + " (first-separator or before-version)");
        }
        opts.rename.mode = *mode;
    } else if (file.rename_mode) {
        opts.rename.mode = *file.rename_mode;
    }
    if (require_rename_mode && opts.rename.mode == RenameMode::Unset) {
        return invalid(std::string("rename policy not configured (--rename-policy, ") + kEnvRenamePolicy +
                       " or rename.policy); choose first-separator or before-version");
    }

    if (file.separators) {
        if (file.separators->empty()) {
            return invalid("rename.separators must not be empty");
        }
        opts.rename.separators = *file.separators;
    }
    if (file.preserved_suffixes) {
        opts.rename.preserved_suffixes = *file.preserved_suffixes;
    } else if (is_windows_platform(opts.package.target_platform)) {
        opts.rename.preserved_suffixes = WindowsExecutableProbe().executable_suffixes();
    }
    opts.rename.names = file.names;

    if (file.log_level) {
        opts.log_level = *file.log_level;
    }

    result.ok = true;
    return result;
}

} // namespace binpack
