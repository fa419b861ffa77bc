#include "binpack/renamer.hpp"
#include "binpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace binpack {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Position of the separator that introduces the version, or npos
size_t find_version_marker(const std::string& name, const std::string& version,
                           const std::string& separators) {
    size_t best = std::string::npos;
    for (char sep : separators) {
        size_t pos = name.find(std::string(1, sep) + version);
        if (pos < best) best = pos;
    }
    return best;
}

// The preserved suffix the name ends with (case-insensitive), or ""
std::string matching_suffix(const std::string& name, const std::vector<std::string>& suffixes) {
    std::string lower = to_lower(name);
    for (const auto& suffix : suffixes) {
        std::string s = to_lower(suffix);
        if (!s.empty() && lower.size() > s.size() &&
            lower.compare(lower.size() - s.size(), s.size(), s) == 0) {
            return name.substr(name.size() - s.size());
        }
    }
    return "";
}

RenameResult fail(RenameResult result, ErrorCode code, const std::string& message) {
    result.ok = false;
    result.code = code;
    result.error = message;
    spdlog::error("{}", message);
    return result;
}

} // namespace

std::optional<RenameMode> parse_rename_mode(const std::string& s) {
    std::string lower = to_lower(s);
    std::replace(lower.begin(), lower.end(), '_', '-');
    if (lower == "first-separator") return RenameMode::FirstSeparator;
    if (lower == "before-version") return RenameMode::BeforeVersion;
    return std::nullopt;
}

std::optional<std::string> stable_executable_name(const std::string& file_name,
                                                  const std::string& version,
                                                  const RenamePolicy& policy) {
    auto explicit_name = policy.names.find(file_name);
    if (explicit_name != policy.names.end()) {
        if (explicit_name->second == file_name) return std::nullopt;
        return explicit_name->second;
    }

    if (version.empty() || policy.separators.empty()) {
        return std::nullopt;
    }

    size_t marker = find_version_marker(file_name, version, policy.separators);
    if (marker == std::string::npos) {
        return std::nullopt;
    }

    size_t cut = marker;
    if (policy.mode == RenameMode::FirstSeparator) {
        cut = file_name.find_first_of(policy.separators);
    }

    std::string stem = file_name.substr(0, cut);
    if (stem.empty()) {
        return std::nullopt;
    }

    std::string suffix = matching_suffix(file_name, policy.preserved_suffixes);
    if (!suffix.empty() && matching_suffix(stem, {suffix}).empty()) {
        stem += suffix;
    }

    if (stem == file_name) return std::nullopt;
    return stem;
}

RenameResult rename_executables(const std::string& bin_dir,
                                const std::string& version,
                                const RenamePolicy& policy) {
    RenameResult result;

    if (policy.mode == RenameMode::Unset) {
        return fail(result, ErrorCode::InvalidConfiguration,
                    "no rename policy configured; choose first-separator or before-version");
    }
    if (!is_writable_directory(bin_dir)) {
        return fail(result, ErrorCode::PrefixAccessFailure, "cannot write to " + bin_dir);
    }

    auto present = list_directory(bin_dir);
    std::set<std::string> present_set(present.begin(), present.end());

    std::vector<RenamedFile> plan;
    std::set<std::string> targets;

    for (const auto& name : present) {
        const std::string path = join_path(bin_dir, name);
        if (is_directory(path)) continue;

        auto stable = stable_executable_name(name, version, policy);
        if (!stable) continue;

        if (!targets.insert(*stable).second) {
            return fail(result, ErrorCode::LayoutConflict,
                        "more than one executable would be renamed to " + *stable);
        }
        plan.push_back({name, *stable});
    }

    for (const auto& step : plan) {
        if (present_set.count(step.to)) {
            return fail(result, ErrorCode::LayoutConflict,
                        "cannot rename " + step.from + " to " + step.to + ": name already taken");
        }
    }

    for (const auto& step : plan) {
        auto moved = move_path(join_path(bin_dir, step.from), join_path(bin_dir, step.to));
        if (!moved.ok) {
            return fail(result, ErrorCode::PrefixAccessFailure, moved.error);
        }
        spdlog::info("renamed {} -> {}", step.from, step.to);
        result.renamed.push_back(step);
    }

    result.ok = true;
    return result;
}

} // namespace binpack
