#include "binpack/classifier.hpp"
#include "binpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace binpack {

namespace {

EntryKind entry_kind(const std::string& path) {
    std::error_code ec;
    // Follows symlinks: a link to a file is a file, a link to a directory a directory
    auto st = fs::status(path, ec);
    if (ec) return EntryKind::Other;
    if (st.type() == fs::file_type::regular) return EntryKind::File;
    if (st.type() == fs::file_type::directory) return EntryKind::Directory;
    return EntryKind::Other;
}

ClassifyResult fail(ClassifyResult result, ErrorCode code, const std::string& message) {
    result.ok = false;
    result.code = code;
    result.error = message;
    spdlog::error("{}", message);
    return result;
}

} // namespace

ClassifyResult classify_entries(const std::string& prefix, const ExecutableProbe& probe) {
    ClassifyResult result;

    const std::string bin_dir = join_path(prefix, kExecutablesDir);
    const std::string aux_dir = join_path(prefix, kAuxiliaryDir);

    for (const auto& dir : {bin_dir, aux_dir}) {
        if (is_symlink(dir) || (path_exists(dir) && !is_directory(dir))) {
            return fail(result, ErrorCode::LayoutConflict,
                        get_filename(dir) + " exists in " + prefix + " but is not a directory");
        }
    }
    if (!create_directories(bin_dir) || !create_directories(aux_dir)) {
        return fail(result, ErrorCode::PrefixAccessFailure,
                    "cannot create " + std::string(kExecutablesDir) + "/ and " +
                    kAuxiliaryDir + "/ in " + prefix);
    }

    spdlog::debug("classifying top-level entries with the {} probe", probe.name());

    for (const auto& name : list_directory(prefix)) {
        const std::string path = join_path(prefix, name);

        ClassifiedEntry entry;
        entry.name = name;
        // A link leaving the prefix is moved as-is, never probed or chmodded
        if (is_symlink(path) && !resolves_within(prefix, path)) {
            spdlog::warn("{} resolves outside {}, moving it to {}/ untouched", name, prefix, kAuxiliaryDir);
            entry.kind = EntryKind::Other;
        } else {
            entry.kind = entry_kind(path);
        }

        // A symlink named like a reserved directory is not structural
        if (entry.kind == EntryKind::Directory && !is_symlink(path) && is_reserved_directory(name)) {
            entry.destination = EntryDestination::Reserved;
            result.entries.push_back(entry);
            continue;
        }

        std::string target_dir = aux_dir;
        if (entry.kind == EntryKind::File && probe.is_executable(path)) {
            if (!set_executable(path)) {
                return fail(result, ErrorCode::PrefixAccessFailure,
                            "cannot set execute permission on " + name);
            }
            entry.destination = EntryDestination::Executables;
            target_dir = bin_dir;
        } else {
            entry.destination = EntryDestination::Auxiliary;
        }

        std::string destination = join_path(target_dir, name);
        if (path_exists(destination)) {
            return fail(result, ErrorCode::LayoutConflict,
                        name + " already exists in " + entry_destination_to_string(entry.destination) + "/");
        }

        auto moved = move_path(path, destination);
        if (!moved.ok) {
            return fail(result, ErrorCode::PrefixAccessFailure, moved.error);
        }

        spdlog::debug("  {} {} -> {}/", entry_kind_to_string(entry.kind), name,
                      entry_destination_to_string(entry.destination));
        result.entries.push_back(entry);
    }

    result.ok = true;
    return result;
}

} // namespace binpack
