#pragma once

#include <filesystem>
#include <ostream>

namespace ci::scan::model {

// One ignored file or directory found by the scan, consumed once by the copy stage.
// relativePath is relative to the search root and selects backupRoot/relativePath.
struct Entry {
    std::filesystem::path absolutePath;
    std::filesystem::path relativePath;
    std::filesystem::path repositoryRoot;

    bool operator==(const Entry&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Entry& e) {
    return os << e.relativePath.generic_string();
}

}
