#include "binpack/path_utils.hpp"
#include "binpack/platform.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace binpack {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool looks_absolute(const std::string& s) {
    if (s.empty()) return false;
    if (s[0] == '/' || s[0] == '\\') return true;
    // C:foo or C:\foo from archives built on Windows
    return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
}

std::vector<std::string> split_components(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(to_portable_path(s));
    while (std::getline(ss, current, '/')) {
        parts.push_back(current);
    }
    return parts;
}

} // namespace

PathResult resolve_under_root(const std::string& root, const std::string& entry_path) {
    PathResult result;

    if (contains_nul(root) || contains_nul(entry_path)) {
        result.error = PathError::ContainsNul;
        return result;
    }
    if (looks_absolute(entry_path)) {
        result.error = PathError::AbsoluteNotAllowed;
        return result;
    }

    std::vector<std::string> normalized;
    for (const auto& part : split_components(entry_path)) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                result.error = PathError::EscapesRoot;
                return result;
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    if (normalized.empty()) {
        result.error = PathError::Empty;
        return result;
    }

    std::filesystem::path out(root);
    std::string relative;
    for (const auto& part : normalized) {
        out /= part;
        if (!relative.empty()) relative += '/';
        relative += part;
    }

    result.ok = true;
    result.path = to_portable_path(out.lexically_normal().string());
    result.relative = relative;
    return result;
}

} // namespace binpack
