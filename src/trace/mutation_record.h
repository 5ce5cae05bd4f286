#ifndef MESHWORK_TRACE_MUTATION_RECORD_H_
#define MESHWORK_TRACE_MUTATION_RECORD_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

#include "common/mesh_error.h"
#include "common/types.h"

namespace Meshwork {

enum class RecordKind {
    kExecution,   // a unit's action ran (or was refused admission)
    kEvaluation,  // trigger evaluated, nothing executed
    kSecurity,    // access outside the unit's namespaces
};

enum class Outcome {
    kSuccess,
    kFailed,
    kSuppressed,
    kQuarantined,
    kDeferred,
    kNoOp,
};

const char* RecordKindName(RecordKind kind);
const char* OutcomeName(Outcome outcome);

struct MutationRecord {
    uint64_t sequence = 0;  // assigned by the recorder
    RecordKind kind = RecordKind::kExecution;
    UnitId unit_id = 0;
    std::string unit_name;
    SnapshotId snapshot_id = 0;
    CycleId cycle_id = 0;
    std::vector<std::string> keys_changed;
    absl::btree_map<std::string, std::string> before;
    absl::btree_map<std::string, std::string> after;
    WallTime started_at;
    WallTime finished_at;
    Outcome outcome = Outcome::kNoOp;
    MeshError error = MeshError::kOk;
    std::string detail;
};

// One JSON object, no trailing newline.
std::string ToJsonLine(const MutationRecord& record);

} // namespace Meshwork

#endif // MESHWORK_TRACE_MUTATION_RECORD_H_
