#ifndef MESHWORK_COMMON_MESH_ERROR_H_
#define MESHWORK_COMMON_MESH_ERROR_H_

namespace Meshwork {

/**
 * Error taxonomy shared by every component.
 * Local errors (conflict, access, timeout) never escalate beyond the unit
 * that caused them. kStoreCorruption is the only error that halts the reactor.
 */
enum class MeshError {
    kOk = 0,
    kVersionConflict,
    kAccessDenied,
    kTimeout,
    kTraceSinkUnavailable,
    kPressureExceeded,
    kNotFound,
    kInvalidArgument,
    kStoreCorruption,
    kCancelled,
    // Unit code threw; the exception is contained to that unit.
    kUnitFault,
};

inline const char* MeshErrorName(MeshError err) {
    switch (err) {
        case MeshError::kOk: return "Ok";
        case MeshError::kVersionConflict: return "VersionConflict";
        case MeshError::kAccessDenied: return "AccessDenied";
        case MeshError::kTimeout: return "Timeout";
        case MeshError::kTraceSinkUnavailable: return "TraceSinkUnavailable";
        case MeshError::kPressureExceeded: return "PressureExceeded";
        case MeshError::kNotFound: return "NotFound";
        case MeshError::kInvalidArgument: return "InvalidArgument";
        case MeshError::kStoreCorruption: return "StoreCorruption";
        case MeshError::kCancelled: return "Cancelled";
        case MeshError::kUnitFault: return "UnitFault";
    }
    return "Unknown";
}

} // namespace Meshwork

#endif // MESHWORK_COMMON_MESH_ERROR_H_
