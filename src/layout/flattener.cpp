#include "binpack/flattener.hpp"
#include "binpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace binpack {

namespace {

// Real directories only; a symlink to a directory is an ordinary entry here
bool is_real_directory(const std::string& path) {
    std::error_code ec;
    return fs::symlink_status(path, ec).type() == fs::file_type::directory;
}

FlattenResult fail(FlattenResult result, ErrorCode code, const std::string& message) {
    result.ok = false;
    result.code = code;
    result.error = message;
    spdlog::error("{}", message);
    return result;
}

} // namespace

std::vector<std::string> unreserved_top_level_directories(const std::string& prefix) {
    std::vector<std::string> dirs;
    for (const auto& name : list_directory(prefix)) {
        if (is_reserved_directory(name)) continue;
        if (is_real_directory(join_path(prefix, name))) {
            dirs.push_back(name);
        }
    }
    return dirs;
}

FlattenResult flatten_layout(const std::string& prefix) {
    FlattenResult result;

    if (!is_writable_directory(prefix)) {
        return fail(result, ErrorCode::PrefixAccessFailure, "cannot write to prefix: " + prefix);
    }

    while (true) {
        auto dirs = unreserved_top_level_directories(prefix);
        if (dirs.size() != 1) {
            spdlog::debug("{} unreserved top-level directories, layout is flat", dirs.size());
            break;
        }
        if (is_real_directory(join_path(prefix, kExecutablesDir))) {
            spdlog::info("found a top-level {} directory, keeping layout", kExecutablesDir);
            break;
        }

        const std::string wrapper = dirs.front();
        spdlog::info("flattening wrapper directory {}", wrapper);

        // Park the wrapper under a unique name so a child named like the
        // wrapper itself ("tool/tool") can take its place.
        const std::string staging = join_path(prefix, ".binpack-flatten-" + generate_uuid());
        auto parked = move_path(join_path(prefix, wrapper), staging);
        if (!parked.ok) {
            return fail(result, ErrorCode::PrefixAccessFailure, parked.error);
        }

        for (const auto& child : list_directory(staging)) {
            std::string destination = join_path(prefix, child);
            if (path_exists(destination)) {
                return fail(result, ErrorCode::LayoutConflict,
                            "cannot lift " + wrapper + "/" + child + ": " + child +
                            " already exists at the top level");
            }
            auto moved = move_path(join_path(staging, child), destination);
            if (!moved.ok) {
                return fail(result, ErrorCode::PrefixAccessFailure, moved.error);
            }
        }

        if (!remove_empty_directory(staging)) {
            return fail(result, ErrorCode::PrefixAccessFailure,
                        "wrapper directory " + wrapper + " is not empty after lifting its contents");
        }

        result.iterations++;
        result.removed.push_back(wrapper);
    }

    result.ok = true;
    return result;
}

} // namespace binpack
