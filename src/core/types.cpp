#include "binpack/types.hpp"

#include <algorithm>

namespace binpack {

bool is_reserved_directory(const std::string& name) {
    return std::any_of(kReservedDirectories.begin(), kReservedDirectories.end(),
                       [&name](const char* reserved) { return name == reserved; });
}

const char* archive_format_suffix(ArchiveFormat f) {
    switch (f) {
        case ArchiveFormat::Zip: return ".zip";
        case ArchiveFormat::TarGzip: return ".tar.gz";
        case ArchiveFormat::TarXz: return ".tar.xz";
        case ArchiveFormat::TarZstd: return ".tar.zst";
        case ArchiveFormat::Gzip: return ".gz";
        case ArchiveFormat::Xz: return ".xz";
        case ArchiveFormat::Zstd: return ".zst";
        case ArchiveFormat::Bare:
        default:
            return "";
    }
}

const std::array<ArchiveFormat, 8>& archive_format_lookup_order() {
    // Archives before single-file payloads, the bare stem last.
    static const std::array<ArchiveFormat, 8> order = {
        ArchiveFormat::Zip,
        ArchiveFormat::TarGzip,
        ArchiveFormat::TarXz,
        ArchiveFormat::TarZstd,
        ArchiveFormat::Gzip,
        ArchiveFormat::Xz,
        ArchiveFormat::Zstd,
        ArchiveFormat::Bare,
    };
    return order;
}

} // namespace binpack
