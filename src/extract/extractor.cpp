#include "binpack/extractor.hpp"
#include "binpack/path_utils.hpp"
#include "binpack/platform.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace binpack {

namespace {

constexpr size_t READ_BLOCK_SIZE = 10240;

// ============================================================================
// libarchive Handles
// ============================================================================

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using DiskWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

// Enable exactly the compression filter a format implies
void support_filter_for(struct archive* a, ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::TarGzip:
        case ArchiveFormat::Gzip:
            archive_read_support_filter_gzip(a);
            break;
        case ArchiveFormat::TarXz:
        case ArchiveFormat::Xz:
            archive_read_support_filter_xz(a);
            break;
        case ArchiveFormat::TarZstd:
        case ArchiveFormat::Zstd:
            archive_read_support_filter_zstd(a);
            break;
        default:
            break;
    }
}

int expected_filter_code(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Gzip: return ARCHIVE_FILTER_GZIP;
        case ArchiveFormat::Xz: return ARCHIVE_FILTER_XZ;
        case ArchiveFormat::Zstd: return ARCHIVE_FILTER_ZSTD;
        default: return ARCHIVE_FILTER_NONE;
    }
}

ExtractResult fail(ErrorCode code, const std::string& message) {
    ExtractResult result;
    result.code = code;
    result.error = message;
    spdlog::error("{}", message);
    return result;
}

// ============================================================================
// Directory Listing
// ============================================================================

std::string permission_string(const fs::file_status& st) {
    std::string out;
    switch (st.type()) {
        case fs::file_type::directory: out += 'd'; break;
        case fs::file_type::symlink: out += 'l'; break;
        case fs::file_type::block: out += 'b'; break;
        case fs::file_type::character: out += 'c'; break;
        case fs::file_type::fifo: out += 'p'; break;
        case fs::file_type::socket: out += 's'; break;
        default: out += '-'; break;
    }

    auto p = st.permissions();
    auto bit = [&p](fs::perms mask, char c) {
        return (p & mask) != fs::perms::none ? c : '-';
    };
    out += bit(fs::perms::owner_read, 'r');
    out += bit(fs::perms::owner_write, 'w');
    out += bit(fs::perms::owner_exec, 'x');
    out += bit(fs::perms::group_read, 'r');
    out += bit(fs::perms::group_write, 'w');
    out += bit(fs::perms::group_exec, 'x');
    out += bit(fs::perms::others_read, 'r');
    out += bit(fs::perms::others_write, 'w');
    out += bit(fs::perms::others_exec, 'x');
    return out;
}

char type_indicator(const fs::file_status& st) {
    switch (st.type()) {
        case fs::file_type::directory: return '/';
        case fs::file_type::symlink: return '@';
        case fs::file_type::fifo: return '|';
        case fs::file_type::socket: return '=';
        default: break;
    }
    auto exec = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (st.permissions() & exec) != fs::perms::none ? '*' : '\0';
}

// ============================================================================
// Multi-entry Archives
// ============================================================================

// Make sure the extracting user can still traverse and rewrite what it unpacks
void sanitize_entry_mode(struct archive_entry* entry) {
    auto perm = archive_entry_perm(entry);
    if (archive_entry_filetype(entry) == AE_IFDIR) {
        perm |= 0700;
    } else {
        perm |= 0600;
    }
    // setuid/setgid bits never survive extraction
    perm &= 01777;
    archive_entry_set_perm(entry, perm);
}

ExtractResult extract_multi_entry(const InputArtifact& artifact, const std::string& prefix_path) {
    // Member names are validated here and written to absolute paths; the
    // root itself must be free of symlinks for the secure-symlink check.
    std::error_code ec;
    const std::string prefix = fs::canonical(prefix_path, ec).string();
    if (ec) {
        return fail(ErrorCode::PrefixAccessFailure, "cannot resolve prefix " + prefix_path + ": " + ec.message());
    }

    ArchiveReader reader(archive_read_new());
    DiskWriter writer(archive_write_disk_new());
    if (!reader || !writer) {
        return fail(ErrorCode::ExtractionFailed, "failed to allocate libarchive handles");
    }

    if (artifact.format == ArchiveFormat::Zip) {
        archive_read_support_format_zip(reader.get());
    } else {
        archive_read_support_format_tar(reader.get());
        archive_read_support_format_gnutar(reader.get());
        support_filter_for(reader.get(), artifact.format);
    }

    archive_write_disk_set_options(writer.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    if (archive_read_open_filename(reader.get(), artifact.path.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        return fail(ErrorCode::ExtractionFailed,
                    "cannot open " + artifact.file_name + ": " + archive_message(reader.get()));
    }

    ExtractResult result;
    std::vector<std::string> symlinks;
    struct archive_entry* entry = nullptr;

    while (true) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            spdlog::warn("{}: {}", artifact.file_name, archive_message(reader.get()));
        } else if (r != ARCHIVE_OK) {
            return fail(ErrorCode::ExtractionFailed,
                        "failed to read " + artifact.file_name + ": " + archive_message(reader.get()));
        }

        const char* raw_name = archive_entry_pathname(entry);
        std::string member = raw_name ? raw_name : "";

        auto resolved = resolve_under_root(prefix, member);
        if (!resolved.ok) {
            if (resolved.error == PathError::Empty) {
                // "./" style root entries carry nothing to materialize
                archive_read_data_skip(reader.get());
                continue;
            }
            return fail(ErrorCode::ExtractionFailed,
                        std::string(path_error_to_string(resolved.error)) + ": " + member);
        }

        auto type = archive_entry_filetype(entry);
        const char* hardlink = archive_entry_hardlink(entry);

        if (hardlink) {
            auto link_target = resolve_under_root(prefix, hardlink);
            if (!link_target.ok) {
                return fail(ErrorCode::ExtractionFailed,
                            "hardlink " + member + " points outside the archive: " + hardlink);
            }
            // link(2) follows symlinks in the source's directory part
            if (!resolves_within(prefix, get_parent_directory(link_target.path))) {
                return fail(ErrorCode::ExtractionFailed,
                            "hardlink " + member + " resolves outside the prefix: " + hardlink);
            }
            archive_entry_set_hardlink(entry, link_target.path.c_str());
        } else if (type == AE_IFLNK) {
            const char* target = archive_entry_symlink(entry);
            std::string link_text = target ? target : "";
            std::string parent = get_parent_directory(resolved.relative);
            std::string joined = parent.empty() ? link_text : parent + "/" + link_text;
            auto link_target = resolve_under_root(prefix, joined);
            if (!link_target.ok && link_target.error != PathError::Empty) {
                return fail(ErrorCode::ExtractionFailed,
                            "symlink " + member + " points outside the archive: " + link_text);
            }
        } else if (type != AE_IFREG && type != AE_IFDIR) {
            return fail(ErrorCode::ExtractionFailed, "unsupported entry type: " + member);
        }

        archive_entry_set_pathname(entry, resolved.path.c_str());
        sanitize_entry_mode(entry);

        r = archive_write_header(writer.get(), entry);
        if (r < ARCHIVE_WARN) {
            return fail(ErrorCode::ExtractionFailed,
                        "failed to create " + resolved.relative + ": " + archive_message(writer.get()));
        }

        if (archive_entry_size(entry) > 0 && type == AE_IFREG) {
            const void* buff = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            while (true) {
                r = archive_read_data_block(reader.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_WARN) {
                    return fail(ErrorCode::ExtractionFailed,
                                "failed to read " + member + ": " + archive_message(reader.get()));
                }
                if (archive_write_data_block(writer.get(), buff, size, offset) < ARCHIVE_WARN) {
                    return fail(ErrorCode::ExtractionFailed,
                                "failed to write " + resolved.relative + ": " + archive_message(writer.get()));
                }
            }
        }

        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
            return fail(ErrorCode::ExtractionFailed,
                        "failed to finish " + resolved.relative + ": " + archive_message(writer.get()));
        }

        if (type == AE_IFLNK && !hardlink) {
            symlinks.push_back(resolved.path);
        }

        spdlog::debug("  extracted {}", resolved.relative);
        result.entries.push_back(resolved.relative);
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return fail(ErrorCode::ExtractionFailed,
                    "failed to finalize extraction: " + archive_message(writer.get()));
    }
    archive_read_close(reader.get());

    // The lexical check above cannot see links created by earlier or later
    // members, so every link is resolved again against the finished tree.
    for (const auto& link : symlinks) {
        if (!resolves_within(prefix, link)) {
            std::error_code remove_ec;
            fs::remove(link, remove_ec);
            return fail(ErrorCode::ExtractionFailed,
                        "symlink " + link + " resolves outside the prefix");
        }
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Single-file Payloads
// ============================================================================

bool set_payload_mode(const std::string& path) {
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    return !ec;
}

ExtractResult decompress_single_file(const InputArtifact& artifact, const std::string& destination) {
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        return fail(ErrorCode::ExtractionFailed, "failed to allocate libarchive handle");
    }

    support_filter_for(reader.get(), artifact.format);
    archive_read_support_format_raw(reader.get());

    if (archive_read_open_filename(reader.get(), artifact.path.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        return fail(ErrorCode::ExtractionFailed,
                    "cannot open " + artifact.file_name + ": " + archive_message(reader.get()));
    }

    struct archive_entry* entry = nullptr;
    if (archive_read_next_header(reader.get(), &entry) != ARCHIVE_OK) {
        return fail(ErrorCode::ExtractionFailed,
                    "failed to read " + artifact.file_name + ": " + archive_message(reader.get()));
    }

    // The raw format accepts anything; insist the advertised compression was found.
    if (archive_filter_count(reader.get()) < 2 ||
        archive_filter_code(reader.get(), 0) != expected_filter_code(artifact.format)) {
        return fail(ErrorCode::ExtractionFailed,
                    artifact.file_name + " is not a " + archive_format_to_string(artifact.format) + " stream");
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(ErrorCode::ExtractionFailed, "failed to create " + destination);
    }

    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    while (true) {
        int r = archive_read_data_block(reader.get(), &buff, &size, &offset);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            out.close();
            std::error_code ec;
            fs::remove(destination, ec);
            return fail(ErrorCode::ExtractionFailed,
                        "failed to decompress " + artifact.file_name + ": " + archive_message(reader.get()));
        }
        out.seekp(static_cast<std::streamoff>(offset));
        out.write(static_cast<const char*>(buff), static_cast<std::streamsize>(size));
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(destination, ec);
            return fail(ErrorCode::ExtractionFailed, "failed to write " + destination);
        }
    }
    out.close();
    if (!out) {
        std::error_code ec;
        fs::remove(destination, ec);
        return fail(ErrorCode::ExtractionFailed, "failed to flush " + destination);
    }
    archive_read_close(reader.get());

    ExtractResult result;
    result.ok = true;
    return result;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

std::string list_work_directory(const std::string& work_dir) {
    std::ostringstream out;
    auto names = list_directory(work_dir);
    if (names.empty()) {
        out << "  (empty)\n";
        return out.str();
    }

    for (const auto& name : names) {
        fs::path p = fs::path(work_dir) / name;
        std::error_code ec;
        auto st = fs::symlink_status(p, ec);
        uintmax_t size = 0;
        if (!ec && st.type() == fs::file_type::regular) {
            size = fs::file_size(p, ec);
            if (ec) size = 0;
        }

        char size_buf[32];
        std::snprintf(size_buf, sizeof(size_buf), "%10llu", static_cast<unsigned long long>(size));

        out << "  " << permission_string(st) << " " << size_buf << " " << name;
        char indicator = type_indicator(st);
        if (indicator != '\0') out << indicator;
        out << "\n";
    }
    return out.str();
}

LocateResult locate_input_artifact(const std::string& work_dir, const PackageDescriptor& pkg) {
    LocateResult result;
    const std::string stem = pkg.archive_stem();

    for (ArchiveFormat format : archive_format_lookup_order()) {
        std::string file_name = stem + archive_format_suffix(format);
        result.candidates.push_back(file_name);

        std::string candidate = join_path(work_dir, file_name);
        if (is_regular_file(candidate)) {
            spdlog::debug("input artifact {} ({})", file_name, archive_format_to_string(format));
            result.artifact.path = candidate;
            result.artifact.file_name = file_name;
            result.artifact.format = format;
            result.ok = true;
            return result;
        }
    }

    std::ostringstream msg;
    msg << stem << " not found, expected one of:";
    for (const auto& c : result.candidates) {
        msg << " " << c;
    }
    msg << "\nWork directory " << work_dir << " contents:\n" << list_work_directory(work_dir);

    result.code = ErrorCode::MissingInputArtifact;
    result.error = msg.str();
    return result;
}

ExtractResult extract_input_artifact(const InputArtifact& artifact,
                                     const std::string& prefix,
                                     const PackageDescriptor& pkg) {
    if (!is_writable_directory(prefix)) {
        return fail(ErrorCode::PrefixAccessFailure, "cannot write to prefix: " + prefix);
    }

    spdlog::info("extracting {} ({}) into {}",
                 artifact.file_name, archive_format_to_string(artifact.format), prefix);

    if (is_multi_entry_format(artifact.format)) {
        return extract_multi_entry(artifact, prefix);
    }

    // Single-file payloads are named after the package
    std::string destination = join_path(prefix, pkg.name);
    if (path_exists(destination)) {
        return fail(ErrorCode::LayoutConflict, "prefix already contains " + pkg.name);
    }

    ExtractResult result;
    if (artifact.format == ArchiveFormat::Bare) {
        if (!copy_file(artifact.path, destination)) {
            std::error_code ec;
            fs::remove(destination, ec);
            return fail(ErrorCode::ExtractionFailed,
                        "failed to copy " + artifact.file_name + " to " + destination);
        }
        result.ok = true;
    } else {
        result = decompress_single_file(artifact, destination);
        if (!result.ok) return result;
    }

    if (!set_payload_mode(destination)) {
        return fail(ErrorCode::ExtractionFailed, "failed to set mode 0755 on " + destination);
    }

    result.entries.push_back(pkg.name);
    return result;
}

} // namespace binpack
