#include "binpack/executable_probe.hpp"
#include "binpack/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace binpack {

namespace {

// ============================================================================
// Format Constants
// ============================================================================

constexpr size_t HEAD_SIZE = 4096;

constexpr uint8_t ELF_MAGIC[4] = {0x7f, 'E', 'L', 'F'};
constexpr uint8_t ELFCLASS32 = 1;
constexpr uint8_t ELFCLASS64 = 2;
constexpr uint8_t ELFDATA2MSB = 2;
constexpr uint16_t ET_EXEC = 2;
constexpr uint16_t ET_DYN = 3;
constexpr uint32_t PT_DYNAMIC = 2;
constexpr uint32_t PT_INTERP = 3;
constexpr uint64_t DT_NULL = 0;
constexpr uint64_t DT_FLAGS_1 = 0x6ffffffb;
constexpr uint64_t DF_1_PIE = 0x08000000;
constexpr uint64_t ELF_MAX_DYNAMIC_SIZE = 1 << 20;
constexpr uint16_t ELF_MAX_PHNUM = 4096;

constexpr uint32_t MH_MAGIC = 0xfeedface;
constexpr uint32_t MH_CIGAM = 0xcefaedfe;
constexpr uint32_t MH_MAGIC_64 = 0xfeedfacf;
constexpr uint32_t MH_CIGAM_64 = 0xcffaedfe;
constexpr uint32_t MH_EXECUTE = 0x2;
constexpr uint32_t FAT_MAGIC = 0xcafebabe;
constexpr uint32_t FAT_MAGIC_64 = 0xcafebabf;
// Java class files share FAT_MAGIC; their "arch count" is a class file
// version number well above this bound.
constexpr uint32_t FAT_MAX_ARCHS = 20;

constexpr uint16_t IMAGE_FILE_EXECUTABLE_IMAGE = 0x0002;
constexpr uint16_t IMAGE_FILE_DLL = 0x2000;

// ============================================================================
// Byte Readers
// ============================================================================

bool has_bytes(const std::vector<uint8_t>& d, uint64_t off, uint64_t n) {
    return off <= d.size() && n <= d.size() - off;
}

uint16_t read_u16(const std::vector<uint8_t>& d, size_t off, bool big_endian) {
    if (big_endian) {
        return static_cast<uint16_t>((d[off] << 8) | d[off + 1]);
    }
    return static_cast<uint16_t>(d[off] | (d[off + 1] << 8));
}

uint32_t read_u32(const std::vector<uint8_t>& d, size_t off, bool big_endian) {
    uint32_t v = 0;
    for (size_t i = 0; i < 4; ++i) {
        size_t idx = big_endian ? off + i : off + 3 - i;
        v = (v << 8) | d[idx];
    }
    return v;
}

uint64_t read_u64(const std::vector<uint8_t>& d, size_t off, bool big_endian) {
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) {
        size_t idx = big_endian ? off + i : off + 7 - i;
        v = (v << 8) | d[idx];
    }
    return v;
}

// ============================================================================
// ELF
// ============================================================================

// Bytes [off, off + size) of the file, served from head when it covers them
std::vector<uint8_t> read_region(const std::string& path, const std::vector<uint8_t>& head,
                                 uint64_t off, size_t size) {
    if (has_bytes(head, off, size)) {
        return std::vector<uint8_t>(head.begin() + static_cast<std::ptrdiff_t>(off),
                                    head.begin() + static_cast<std::ptrdiff_t>(off + size));
    }
    return read_file_range(path, off, size);
}

// Static PIE binaries have no interpreter but mark DF_1_PIE in DT_FLAGS_1
bool elf_dynamic_marks_pie(const std::string& path, uint64_t offset, uint64_t size,
                           bool is64, bool big_endian) {
    const size_t entry_size = is64 ? 16 : 8;
    if (size < entry_size || size > ELF_MAX_DYNAMIC_SIZE) return false;

    std::vector<uint8_t> dynamic = read_file_range(path, offset, static_cast<size_t>(size));
    for (size_t off = 0; off + entry_size <= dynamic.size(); off += entry_size) {
        uint64_t tag = is64 ? read_u64(dynamic, off, big_endian) : read_u32(dynamic, off, big_endian);
        uint64_t val = is64 ? read_u64(dynamic, off + 8, big_endian) : read_u32(dynamic, off + 4, big_endian);
        if (tag == DT_NULL) break;
        if (tag == DT_FLAGS_1) return (val & DF_1_PIE) != 0;
    }
    return false;
}

// ET_DYN covers both shared objects and position independent executables
bool elf_dyn_is_executable(const std::string& path, const std::vector<uint8_t>& head,
                           bool is64, bool big_endian) {
    uint64_t phoff;
    uint16_t phentsize;
    uint16_t phnum;

    if (is64) {
        if (!has_bytes(head, 0, 64)) return false;
        phoff = read_u64(head, 32, big_endian);
        phentsize = read_u16(head, 54, big_endian);
        phnum = read_u16(head, 56, big_endian);
    } else {
        if (!has_bytes(head, 0, 52)) return false;
        phoff = read_u32(head, 28, big_endian);
        phentsize = read_u16(head, 42, big_endian);
        phnum = read_u16(head, 44, big_endian);
    }

    const size_t min_entry = is64 ? 40 : 20;
    if (phoff == 0 || phnum == 0 || phentsize < min_entry || phnum > ELF_MAX_PHNUM) {
        return false;
    }

    size_t table_size = static_cast<size_t>(phentsize) * phnum;
    std::vector<uint8_t> table = read_region(path, head, phoff, table_size);
    if (table.size() != table_size) return false;

    bool has_dynamic = false;
    uint64_t dynamic_offset = 0;
    uint64_t dynamic_size = 0;
    for (uint16_t i = 0; i < phnum; ++i) {
        size_t entry = static_cast<size_t>(i) * phentsize;
        uint32_t p_type = read_u32(table, entry, big_endian);
        if (p_type == PT_INTERP) {
            return true;
        }
        if (p_type == PT_DYNAMIC && !has_dynamic) {
            has_dynamic = true;
            if (is64) {
                dynamic_offset = read_u64(table, entry + 8, big_endian);
                dynamic_size = read_u64(table, entry + 32, big_endian);
            } else {
                dynamic_offset = read_u32(table, entry + 4, big_endian);
                dynamic_size = read_u32(table, entry + 16, big_endian);
            }
        }
    }

    return has_dynamic && elf_dynamic_marks_pie(path, dynamic_offset, dynamic_size, is64, big_endian);
}

BinaryKind classify_elf(const std::string& path, const std::vector<uint8_t>& head) {
    if (!has_bytes(head, 0, 20)) return BinaryKind::ElfOther;

    uint8_t elf_class = head[4];
    if (elf_class != ELFCLASS32 && elf_class != ELFCLASS64) {
        return BinaryKind::ElfOther;
    }
    bool big_endian = head[5] == ELFDATA2MSB;
    uint16_t type = read_u16(head, 16, big_endian);

    if (type == ET_EXEC) {
        return BinaryKind::ElfExecutable;
    }
    if (type == ET_DYN) {
        return elf_dyn_is_executable(path, head, elf_class == ELFCLASS64, big_endian)
            ? BinaryKind::ElfExecutable
            : BinaryKind::ElfSharedObject;
    }
    return BinaryKind::ElfOther;
}

// ============================================================================
// Mach-O
// ============================================================================

BinaryKind classify_thin_macho(const std::vector<uint8_t>& header) {
    if (!has_bytes(header, 0, 16)) return BinaryKind::Unknown;

    uint32_t magic = read_u32(header, 0, true);
    bool big_endian;
    if (magic == MH_MAGIC || magic == MH_MAGIC_64) {
        big_endian = true;
    } else if (magic == MH_CIGAM || magic == MH_CIGAM_64) {
        big_endian = false;
    } else {
        return BinaryKind::Unknown;
    }

    uint32_t filetype = read_u32(header, 12, big_endian);
    return filetype == MH_EXECUTE ? BinaryKind::MachOExecutable : BinaryKind::MachOOther;
}

BinaryKind classify_fat_macho(const std::string& path, const std::vector<uint8_t>& head) {
    if (!has_bytes(head, 0, 8)) return BinaryKind::Unknown;

    bool fat64 = read_u32(head, 0, true) == FAT_MAGIC_64;
    uint32_t nfat_arch = read_u32(head, 4, true);
    if (nfat_arch == 0 || nfat_arch >= FAT_MAX_ARCHS) {
        return BinaryKind::Unknown;
    }

    // fat_arch: cputype, cpusubtype, then the slice offset (32 or 64 bit)
    uint64_t slice_offset;
    if (fat64) {
        if (!has_bytes(head, 16, 8)) return BinaryKind::Unknown;
        slice_offset = read_u64(head, 16, true);
    } else {
        if (!has_bytes(head, 16, 4)) return BinaryKind::Unknown;
        slice_offset = read_u32(head, 16, true);
    }

    std::vector<uint8_t> slice = read_file_range(path, slice_offset, 16);
    return classify_thin_macho(slice);
}

// ============================================================================
// PE
// ============================================================================

BinaryKind classify_pe(const std::string& path, const std::vector<uint8_t>& head) {
    if (!has_bytes(head, 0x3c, 4)) return BinaryKind::Unknown;

    uint32_t pe_offset = read_u32(head, 0x3c, false);
    std::vector<uint8_t> coff;
    if (has_bytes(head, pe_offset, 24)) {
        coff.assign(head.begin() + pe_offset, head.begin() + pe_offset + 24);
    } else {
        coff = read_file_range(path, pe_offset, 24);
    }
    if (coff.size() < 24 || std::memcmp(coff.data(), "PE\0\0", 4) != 0) {
        return BinaryKind::Unknown;
    }

    uint16_t characteristics = read_u16(coff, 22, false);
    if (characteristics & IMAGE_FILE_DLL) {
        return BinaryKind::PeDll;
    }
    if (characteristics & IMAGE_FILE_EXECUTABLE_IMAGE) {
        return BinaryKind::PeExecutable;
    }
    return BinaryKind::Unknown;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const char* binary_kind_to_string(BinaryKind kind) {
    switch (kind) {
        case BinaryKind::ElfExecutable: return "elf-executable";
        case BinaryKind::ElfSharedObject: return "elf-shared-object";
        case BinaryKind::ElfOther: return "elf-other";
        case BinaryKind::MachOExecutable: return "macho-executable";
        case BinaryKind::MachOOther: return "macho-other";
        case BinaryKind::Script: return "script";
        case BinaryKind::PeExecutable: return "pe-executable";
        case BinaryKind::PeDll: return "pe-dll";
        case BinaryKind::Unknown:
        default:
            return "unknown";
    }
}

BinaryKind detect_binary_kind(const std::string& path) {
    std::vector<uint8_t> head = read_file_head(path, HEAD_SIZE);
    if (head.size() < 4) {
        if (head.size() >= 2 && head[0] == '#' && head[1] == '!') {
            return BinaryKind::Script;
        }
        return BinaryKind::Unknown;
    }

    if (std::memcmp(head.data(), ELF_MAGIC, 4) == 0) {
        return classify_elf(path, head);
    }

    uint32_t magic = read_u32(head, 0, true);
    if (magic == MH_MAGIC || magic == MH_CIGAM || magic == MH_MAGIC_64 || magic == MH_CIGAM_64) {
        return classify_thin_macho(head);
    }
    if (magic == FAT_MAGIC || magic == FAT_MAGIC_64) {
        return classify_fat_macho(path, head);
    }

    if (head[0] == '#' && head[1] == '!') {
        return BinaryKind::Script;
    }
    if (head[0] == 'M' && head[1] == 'Z') {
        return classify_pe(path, head);
    }

    return BinaryKind::Unknown;
}

// ============================================================================
// Probes
// ============================================================================

bool UnixExecutableProbe::is_executable(const std::string& path) const {
    switch (detect_binary_kind(path)) {
        case BinaryKind::ElfExecutable:
        case BinaryKind::MachOExecutable:
        case BinaryKind::Script:
            return true;
        default:
            break;
    }
    return has_execute_permission(path);
}

std::vector<std::string> WindowsExecutableProbe::executable_suffixes() const {
    return {".exe", ".bat", ".com"};
}

bool WindowsExecutableProbe::is_executable(const std::string& path) const {
    std::string name = to_lower(get_filename(path));
    for (const auto& suffix : executable_suffixes()) {
        if (ends_with(name, suffix)) {
            return true;
        }
    }
    return detect_binary_kind(path) == BinaryKind::PeExecutable;
}

bool is_windows_platform(const std::string& target_platform) {
    return to_lower(target_platform).rfind("win", 0) == 0;
}

std::unique_ptr<ExecutableProbe> make_executable_probe(const std::string& target_platform) {
    if (is_windows_platform(target_platform)) {
        return std::make_unique<WindowsExecutableProbe>();
    }
    return std::make_unique<UnixExecutableProbe>();
}

} // namespace binpack
