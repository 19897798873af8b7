#include "GroupPartitioner.hpp"

#include "Logging.hpp"
#include "Mesh.hpp"

namespace vat
{

GroupPartition GroupPartitioner::Partition(const std::vector<const Mesh*>& objects, const std::string& groupName)
{
    uint32_t vertexCount = 0u;
    for (const Mesh* object : objects)
    {
        vertexCount += object->GetVertexCount();
    }

    GroupPartition partition;
    partition.activeOrdinals.assign(vertexCount, GroupPartition::kInactive);

    bool resolved = false;
    if (!groupName.empty())
    {
        for (const Mesh* object : objects)
        {
            if (object->FindVertexGroup(groupName) != nullptr)
            {
                resolved = true;
                break;
            }
        }
        if (!resolved)
            LOG_WARNING("Vertex group %s not found on any object, using all vertices", groupName.c_str());
    }

    if (!resolved)
    {
        for (uint32_t v = 0; v < vertexCount; ++v)
        {
            partition.activeOrdinals[v] = v;
        }
        partition.totalActive = vertexCount;
        return partition;
    }

    partition.restricted = true;
    std::vector<bool> membership(vertexCount, false);
    uint32_t offset = 0u;
    for (const Mesh* object : objects)
    {
        const std::vector<uint32_t>* members = object->FindVertexGroup(groupName);
        if (members != nullptr)
        {
            for (uint32_t localIndex : *members)
            {
                if (localIndex >= object->GetVertexCount())
                {
                    LOG_WARNING("Vertex group %s on %s references vertex %u out of %u, ignored",
                                groupName.c_str(), object->GetName().c_str(), localIndex, object->GetVertexCount());
                    continue;
                }
                membership[offset + localIndex] = true;
            }
        }
        offset += object->GetVertexCount();
    }

    uint32_t ordinal = 0u;
    for (uint32_t v = 0; v < vertexCount; ++v)
    {
        if (membership[v])
            partition.activeOrdinals[v] = ordinal++;
    }
    partition.totalActive = ordinal;

    LOG_INFO("Vertex group %s: %u of %u vertices active", groupName.c_str(), partition.totalActive, vertexCount);
    return partition;
}

simd::float2 GroupPartitioner::GetAddressUV(const GroupPartition& partition, uint32_t mergedVertex)
{
    const uint32_t ordinal = partition.activeOrdinals[mergedVertex];
    if (ordinal == GroupPartition::kInactive)
        return simd_make_float2(kInactiveU, kAddressV);

    return simd_make_float2((ordinal + 0.5f) / (float)partition.totalActive, kAddressV);
}

} // namespace vat
