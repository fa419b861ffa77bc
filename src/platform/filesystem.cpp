#include "binpack/platform.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <system_error>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace binpack {

namespace fs = std::filesystem;

// ============================================================================
// Path Utilities
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    // symlink_status so that dangling links still count as present
    return fs::exists(fs::symlink_status(path, ec));
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(path, ec);
}

namespace {

fs::path absolute_normal(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) abs = fs::path(path);
    abs = abs.lexically_normal();
    // "dir/" and "dir" must compare equal
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

} // namespace

bool is_within(const std::string& root, const std::string& path) {
    fs::path lex_root = absolute_normal(root);
    fs::path lex_path = absolute_normal(path);

    auto root_it = lex_root.begin();
    auto path_it = lex_path.begin();
    for (; root_it != lex_root.end() && path_it != lex_path.end(); ++root_it, ++path_it) {
        if (*root_it != *path_it) {
            return false;
        }
    }
    return root_it == lex_root.end();
}

bool resolves_within(const std::string& root, const std::string& path) {
    std::error_code ec;
    fs::path real_root = fs::weakly_canonical(root, ec);
    if (ec) return false;

    // weakly_canonical stops at a dangling link and keeps the rest lexically,
    // so a trailing link is chased by hand, up to the usual SYMLOOP_MAX.
    fs::path current = fs::absolute(path, ec);
    if (ec) return false;
    for (int hops = 0; hops < 40; ++hops) {
        fs::path parent = fs::weakly_canonical(current.parent_path(), ec);
        if (ec) return false;
        fs::path candidate = parent / current.filename();

        auto st = fs::symlink_status(candidate, ec);
        if (ec || st.type() != fs::file_type::symlink) {
            ec.clear();
            fs::path real_path = fs::weakly_canonical(candidate, ec);
            if (ec) return false;
            return is_within(real_root.string(), real_path.string());
        }

        fs::path target = fs::read_symlink(candidate, ec);
        if (ec) return false;
        current = target.is_absolute() ? target : parent / target;
    }
    return false;
}

// ============================================================================
// Directory Operations
// ============================================================================

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    fs::directory_iterator it(path, ec);
    if (ec) return entries;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        entries.push_back(it->path().filename().string());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool remove_empty_directory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_empty(path, ec) || ec) {
        return false;
    }
    return fs::remove(path, ec) && !ec;
}

bool is_writable_directory(const std::string& path) {
    if (!is_directory(path)) return false;
#ifdef _WIN32
    return true;
#else
    return access(path.c_str(), W_OK | X_OK) == 0;
#endif
}

// ============================================================================
// File Operations
// ============================================================================

bool copy_file(const std::string& src, const std::string& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    return !ec;
}

MoveResult move_path(const std::string& src, const std::string& dst) {
    MoveResult result;

    if (path_exists(dst)) {
        result.error = "destination already exists: " + dst;
        return result;
    }

    std::error_code ec;
    fs::rename(src, dst, ec);
    if (ec) {
        result.error = "failed to move " + src + " to " + dst + ": " + ec.message();
        return result;
    }

    result.ok = true;
    return result;
}

bool set_executable(const std::string& path) {
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    return !ec;
}

bool has_execute_permission(const std::string& path) {
    std::error_code ec;
    auto perms = fs::status(path, ec).permissions();
    if (ec) return false;
    return (perms & fs::perms::owner_exec) != fs::perms::none ||
           (perms & fs::perms::group_exec) != fs::perms::none ||
           (perms & fs::perms::others_exec) != fs::perms::none;
}

std::vector<uint8_t> read_file_head(const std::string& path, size_t max_bytes) {
    return read_file_range(path, 0, max_bytes);
}

std::vector<uint8_t> read_file_range(const std::string& path, uint64_t offset, size_t max_bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return {};

    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file) return {};

    std::vector<uint8_t> data(max_bytes);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(max_bytes));
    data.resize(static_cast<size_t>(file.gcount()));
    return data;
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF),
                  static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace binpack
