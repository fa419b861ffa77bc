#pragma once

#include "binpack/renamer.hpp"
#include "binpack/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace binpack {

// ============================================================================
// Configuration File
// ============================================================================
//
// {
//   "rename": {
//     "policy": "before-version",
//     "separators": "-_",
//     "preserved_suffixes": [".exe"],
//     "names": { "tool-linux-1.2.3": "tool" }
//   },
//   "log_level": "info"
// }

struct ConfigFile {
    std::optional<RenameMode> rename_mode;
    std::optional<std::string> separators;
    std::optional<std::vector<std::string>> preserved_suffixes;
    std::map<std::string, std::string> names;
    std::optional<std::string> log_level;
    std::string source_path;
};

struct ConfigFileParseResult {
    bool ok = false;
    std::string error;
    ConfigFile config;
};

// Unknown keys are ignored, keys with the wrong type are errors
ConfigFileParseResult parse_config_file(const std::string& json_str,
                                        const std::string& source_path = "");

ConfigFileParseResult load_config_file(const std::string& path);

// ============================================================================
// Option Resolution
// ============================================================================

// Environment variables read during resolution
constexpr const char* kEnvPackageName = "PKG_NAME";
constexpr const char* kEnvPackageVersion = "PKG_VERSION";
constexpr const char* kEnvTargetPlatform = "target_platform";
constexpr const char* kEnvPrefix = "PREFIX";
constexpr const char* kEnvRenamePolicy = "BINPACK_RENAME_POLICY";
constexpr const char* kEnvConfigFile = "BINPACK_CONFIG";

// Values given on the command line; empty means "not given"
struct OptionOverrides {
    std::string name;
    std::string version;
    std::string target_platform;
    std::string prefix;
    std::string work_dir;
    std::string rename_policy;
    std::string config_path;
};

struct NormalizeOptions {
    PackageDescriptor package;
    std::string work_dir;
    std::string prefix;
    RenamePolicy rename;
    std::string log_level = "info";
};

struct ResolveResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    NormalizeOptions options;
};

// Merge command line > environment > config file > defaults.
// The work directory defaults to the current directory. Package name,
// version, platform and prefix are required; a prefix is only required
// when require_prefix is set. The rename mode is required too, unless
// require_rename_mode is false (lookups that never rename).
ResolveResult resolve_normalize_options(const OptionOverrides& overrides,
                                        bool require_prefix = true,
                                        bool require_rename_mode = true);

} // namespace binpack
