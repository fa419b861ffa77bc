#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace binpack {

// ============================================================================
// Binary Signature Detection
// ============================================================================

enum class BinaryKind {
    Unknown,
    ElfExecutable,      // ET_EXEC, or ET_DYN with an interpreter (PIE)
    ElfSharedObject,    // ET_DYN without an interpreter
    ElfOther,           // relocatable objects, core dumps
    MachOExecutable,    // MH_EXECUTE, thin or first slice of a fat binary
    MachOOther,         // dylibs, bundles, object files
    Script,             // starts with "#!"
    PeExecutable,
    PeDll,
};

const char* binary_kind_to_string(BinaryKind kind);

// Inspect the leading bytes of a file. Reads further ranges (ELF program
// headers, fat Mach-O slices) only when the header points there.
BinaryKind detect_binary_kind(const std::string& path);

// ============================================================================
// Executable Probe
// ============================================================================
//
// Decides whether a top-level file of an unpacked release belongs in bin/.
// One implementation per target platform family; callers only see this
// interface.

class ExecutableProbe {
public:
    virtual ~ExecutableProbe() = default;

    virtual bool is_executable(const std::string& path) const = 0;

    // Short name for logs and reports ("unix", "windows")
    virtual const char* name() const = 0;

    // File name suffixes that by themselves mark an executable (".exe").
    // Empty where permission bits carry that information.
    virtual std::vector<std::string> executable_suffixes() const { return {}; }
};

// Linux, macOS and other POSIX targets: content signature or an execute
// permission bit already present in the archive.
class UnixExecutableProbe : public ExecutableProbe {
public:
    bool is_executable(const std::string& path) const override;
    const char* name() const override { return "unix"; }
};

// Windows targets: permission bits carry no meaning, so an allow-listed
// suffix or a non-DLL PE image decides.
class WindowsExecutableProbe : public ExecutableProbe {
public:
    bool is_executable(const std::string& path) const override;
    const char* name() const override { return "windows"; }
    std::vector<std::string> executable_suffixes() const override;
};

// True for conda-style Windows platform identifiers (win-64, win-arm64, ...)
bool is_windows_platform(const std::string& target_platform);

// Select the probe for a target platform identifier
std::unique_ptr<ExecutableProbe> make_executable_probe(const std::string& target_platform);

} // namespace binpack
