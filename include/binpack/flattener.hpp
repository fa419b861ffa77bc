#pragma once

#include "binpack/types.hpp"

#include <string>
#include <vector>

namespace binpack {

// ============================================================================
// Layout Flattening
// ============================================================================
//
// Release archives often wrap their payload in one arbitrarily named
// directory ("tool-1.2.3-x86_64/"), sometimes several levels deep. Flattening
// lifts the contents of such a lone wrapper into the prefix until the shape
// is one of:
//   - a top-level bin/ directory exists
//   - zero non-reserved top-level directories
//   - two or more non-reserved top-level directories

struct FlattenResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    size_t iterations = 0;                  // wrapper levels removed
    std::vector<std::string> removed;       // wrapper directory names, outermost first
};

// Top-level directories of prefix that are not reserved, sorted
std::vector<std::string> unreserved_top_level_directories(const std::string& prefix);

// Flatten prefix in place.
// A wrapper is only removed once it is empty. A lifted entry that collides
// with an existing top-level entry fails with LayoutConflict; reserved
// directories are never merged into.
FlattenResult flatten_layout(const std::string& prefix);

} // namespace binpack
