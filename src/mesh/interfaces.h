#pragma once

#include <vector>
#include "mesh_entry.h"

namespace Meshwork {

/**
 * Interface for the durable (or ephemeral) store behind the mesh.
 * The version store stays authoritative; the backend only seeds it at
 * startup and receives every committed batch afterwards.
 */
class IMeshBackend {
public:
    virtual ~IMeshBackend() = default;

    virtual bool Load(std::vector<MeshEntry>& entries) = 0;
    virtual bool Persist(const std::vector<MeshEntry>& committed) = 0;
};

// Receives every committed batch after the store released its locks.
class IChangeListener {
public:
    virtual ~IChangeListener() = default;

    virtual void OnCommitted(const std::vector<MeshEntry>& committed) = 0;
};

} // namespace Meshwork
