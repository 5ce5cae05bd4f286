#ifndef MESHWORK_MESH_MESH_ENTRY_H_
#define MESHWORK_MESH_MESH_ENTRY_H_

#include <cstdint>
#include <string>
#include <vector>

#include "common/types.h"

namespace Meshwork {

// Value and version as observed by a reader. Version 0 means "absent".
struct VersionedValue {
    std::string value;
    uint64_t version = 0;

    bool operator==(const VersionedValue& other) const {
        return version == other.version && value == other.value;
    }
};

struct MeshEntry {
    std::string key;
    std::string value;
    uint64_t version = 0;
    UnitId last_written_by = kExternalWriter;
    WallTime written_at;
    // Tombstone: the key reads as absent but keeps its version.
    bool deleted = false;
};

// One compare-and-set inside a batch.
struct WriteIntent {
    std::string key;
    uint64_t expected_version = 0;
    std::string value;
    // Delete the key instead of writing value.
    bool remove = false;
};

// A multi-key mutation that commits as one unit or not at all.
struct WriteBatch {
    UnitId writer = kExternalWriter;
    std::vector<WriteIntent> writes;
};

// Pattern helpers. A pattern ending in '*' selects every key with that prefix.
inline bool IsPrefixPattern(const std::string& pattern) {
    return !pattern.empty() && pattern.back() == '*';
}

inline bool MatchesPattern(const std::string& pattern, const std::string& key) {
    if (IsPrefixPattern(pattern)) {
        return key.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0;
    }
    return pattern == key;
}

} // namespace Meshwork

#endif // MESHWORK_MESH_MESH_ENTRY_H_
