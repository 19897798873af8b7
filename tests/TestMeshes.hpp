#pragma once

#include <memory>
#include <string>
#include <vector>

#include <simd/simd.h>

#include "Mesh.hpp"
#include "Snapshot.hpp"

namespace vat
{
namespace test
{

// One loop per vertex plus a second loop on vertex 0, like a shared corner.
inline std::unique_ptr<Mesh> MakeMesh(const std::string& name, uint32_t vertexCount)
{
    auto mesh = std::make_unique<Mesh>(name);
    mesh->SetVertexCount(vertexCount);
    std::vector<uint32_t> loops;
    for (uint32_t v = 0; v < vertexCount; ++v)
    {
        loops.push_back(v);
    }
    if (vertexCount > 0u)
        loops.push_back(0u);
    mesh->SetLoopVertexIndices(std::move(loops));
    return mesh;
}

inline std::vector<simd::float3> MakeLine(uint32_t vertexCount)
{
    std::vector<simd::float3> positions(vertexCount);
    for (uint32_t v = 0; v < vertexCount; ++v)
    {
        positions[v] = simd_make_float3((float)v, 0.0f, 0.0f);
    }
    return positions;
}

inline Snapshot MakeOffsetSnapshot(const std::vector<simd::float3>& basePositions, simd::float3 offset)
{
    std::vector<simd::float3> positions = basePositions;
    for (simd::float3& position : positions)
    {
        position += offset;
    }
    return MakeSnapshot(positions, std::vector<simd::float3>(positions.size(), simd_make_float3(0.0f, 0.0f, 1.0f)));
}

} // namespace test
} // namespace vat
