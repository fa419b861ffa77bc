#pragma once

#include "binpack/executable_probe.hpp"
#include "binpack/types.hpp"

#include <string>
#include <vector>

namespace binpack {

// ============================================================================
// Entry Classification
// ============================================================================

enum class EntryKind {
    File,
    Directory,
    Other,      // dangling symlinks, FIFOs, sockets
};

enum class EntryDestination {
    Executables,    // bin/
    Auxiliary,      // extras/
    Reserved,       // left in place
};

inline const char* entry_kind_to_string(EntryKind k) {
    switch (k) {
        case EntryKind::File: return "file";
        case EntryKind::Directory: return "directory";
        case EntryKind::Other: return "other";
        default: return "other";
    }
}

inline const char* entry_destination_to_string(EntryDestination d) {
    switch (d) {
        case EntryDestination::Executables: return "bin";
        case EntryDestination::Auxiliary: return "extras";
        case EntryDestination::Reserved: return "reserved";
        default: return "reserved";
    }
}

struct ClassifiedEntry {
    std::string name;
    EntryKind kind = EntryKind::Other;
    EntryDestination destination = EntryDestination::Auxiliary;
};

struct ClassifyResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    std::vector<ClassifiedEntry> entries;   // in top-level name order
};

// Partition every top-level entry of prefix.
// bin/ and extras/ are created first. Files the probe reports as executable
// get execute permission and move to bin/, other files move to extras/.
// Reserved directories stay in place, every other directory moves to
// extras/ as a whole. Afterwards only reserved directories remain.
ClassifyResult classify_entries(const std::string& prefix, const ExecutableProbe& probe);

} // namespace binpack
