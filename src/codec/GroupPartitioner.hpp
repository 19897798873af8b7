#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <simd/simd.h>

namespace vat
{

class Mesh;

// Active/inactive split of the merged vertex range of one bake pass.
struct GroupPartition
{
    static constexpr uint32_t kInactive = UINT32_MAX;

    bool restricted { false };  // false: every vertex is active
    uint32_t totalActive { 0u };
    std::vector<uint32_t> activeOrdinals;  // per merged vertex, kInactive when outside the group

    uint32_t GetVertexCount() const { return (uint32_t)activeOrdinals.size(); }
    bool IsActive(uint32_t mergedVertex) const { return activeOrdinals[mergedVertex] != kInactive; }
};

class GroupPartitioner
{
public:
    // texel row center used by every vertex
    static constexpr float kAddressV = 128.0f / 255.0f;
    // reserved coordinate for vertices outside the group
    static constexpr float kInactiveU = 0.0f;

    // An empty name, or a name none of the objects carries, keeps all
    // vertices active. Otherwise only members of the group on the objects
    // that carry it are active, numbered in merged order.
    static GroupPartition Partition(const std::vector<const Mesh*>& objects, const std::string& groupName);

    // Active vertices sit on texel centers (ordinal + 0.5) / totalActive.
    static simd::float2 GetAddressUV(const GroupPartition& partition, uint32_t mergedVertex);
};

} // namespace vat
