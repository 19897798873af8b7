#pragma once

#include <cstdint>
#include <vector>

#include "BakeStatus.hpp"
#include "CoordinateTransform.hpp"
#include "GroupPartitioner.hpp"
#include "Snapshot.hpp"

namespace vat
{

class Mesh;

// Two RGBA grids, one column per active vertex and one row per frame.
struct FrameTextures
{
    uint32_t width { 0u };
    uint32_t height { 0u };

    std::vector<float> offsets;  // transform(delta) * scale, alpha 1
    std::vector<float> normals;  // (transform(n) + 1) / 2, alpha 1
};

class TexturePacker
{
public:
    static const char* GetAddressUVLayerName() { return "vertex_anim"; }

    // Row of the grid a snapshot lands in: the last snapshot takes row 0.
    static uint32_t GetRow(uint32_t snapshotIndex, uint32_t snapshotCount) { return snapshotCount - 1u - snapshotIndex; }

    static BakeStatus PackFrames(const std::vector<Snapshot>& snapshots, uint32_t scaleFactor, const GroupPartition& partition,
                                 const CoordinateTransform& transform, FrameTextures& outTextures);

    // Every object must either already own the address layer or have a free UV slot.
    static BakeStatus ValidateAddressUVs(const std::vector<const Mesh*>& objects);

    // Writes the texel column of each vertex into the address layer of its
    // object. Objects are addressed in merged order.
    static BakeStatus WriteAddressUVs(const std::vector<Mesh*>& objects, const GroupPartition& partition);
};

} // namespace vat
