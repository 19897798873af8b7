#include "TexturePacker.hpp"

#include <cassert>
#include <string>
#include <utility>

#include "DeviationAnalyzer.hpp"
#include "Logging.hpp"
#include "Mesh.hpp"

namespace
{
    void WriteTexel(std::vector<float>& pixels, size_t texelIndex, simd::float4 value)
    {
        float* texel = &pixels[texelIndex * 4u];
        texel[0] = value.x;
        texel[1] = value.y;
        texel[2] = value.z;
        texel[3] = value.w;
    }
}

namespace vat
{

BakeStatus TexturePacker::PackFrames(const std::vector<Snapshot>& snapshots, uint32_t scaleFactor, const GroupPartition& partition,
                                     const CoordinateTransform& transform, FrameTextures& outTextures)
{
    BakeStatus status = DeviationAnalyzer::ValidateSnapshots(snapshots);
    if (!status)
        return status;

    const Snapshot& base = snapshots[0];
    if (partition.GetVertexCount() != base.GetVertexCount())
    {
        std::string message = "Vertex partition covers " + FormatCount(partition.GetVertexCount()) + " vertices, snapshots have "
            + FormatCount(base.GetVertexCount()) + "!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
    }
    if (scaleFactor == 0u)
    {
        LOG_ERROR("Scale factor must be at least 1!");
        return BakeStatus::Error(BakeErrorKind::PreconditionError, "Scale factor must be at least 1!");
    }

    FrameTextures textures;
    textures.width = partition.totalActive;
    textures.height = (uint32_t)snapshots.size();
    const size_t texelCount = (size_t)textures.width * textures.height;
    textures.offsets.assign(texelCount * 4u, 0.0f);
    textures.normals.assign(texelCount * 4u, 0.0f);

    const float scale = (float)scaleFactor;
    const uint32_t snapshotCount = (uint32_t)snapshots.size();
    // the last frame is processed first and written to row 0; the decoder
    // addresses time as row = frames from the end
    for (uint32_t processed = 0; processed < snapshotCount; ++processed)
    {
        const uint32_t snapshotIndex = snapshotCount - 1u - processed;
        const uint32_t row = GetRow(snapshotIndex, snapshotCount);
        assert(row == processed);

        for (const VertexSample& sample : snapshots[snapshotIndex].samples)
        {
            const uint32_t column = partition.activeOrdinals[sample.index.GetValue()];
            if (column == GroupPartition::kInactive)
                continue;

            const simd::float3 offset = transform.Apply(DeviationAnalyzer::GetDelta(base, sample)) * scale;
            const size_t texelIndex = (size_t)row * textures.width + column;
            WriteTexel(textures.offsets, texelIndex, simd_make_float4(offset, 1.0f));
            WriteTexel(textures.normals, texelIndex, transform.EncodeNormal(sample.normal));
        }
    }

    outTextures = std::move(textures);
    return BakeStatus::Ok();
}

BakeStatus TexturePacker::ValidateAddressUVs(const std::vector<const Mesh*>& objects)
{
    for (const Mesh* object : objects)
    {
        if (object->FindUVLayer(GetAddressUVLayerName()) == nullptr && object->GetUVLayerCount() >= kMaxUVLayers)
        {
            std::string message = "Object " + object->GetName() + " already uses " + std::to_string(object->GetUVLayerCount())
                + " UV layers, limit is " + std::to_string(kMaxUVLayers) + "!";
            LOG_ERROR("%s", message.c_str());
            return BakeStatus::Error(BakeErrorKind::CapacityError, message);
        }
        BakeStatus status = object->ValidateLoops();
        if (!status)
            return status;
    }
    return BakeStatus::Ok();
}

BakeStatus TexturePacker::WriteAddressUVs(const std::vector<Mesh*>& objects, const GroupPartition& partition)
{
    BakeStatus status = ValidateAddressUVs(std::vector<const Mesh*>(objects.begin(), objects.end()));
    if (!status)
        return status;

    uint32_t vertexCount = 0u;
    for (const Mesh* object : objects)
    {
        vertexCount += object->GetVertexCount();
    }
    if (vertexCount != partition.GetVertexCount())
    {
        std::string message = "Vertex partition covers " + FormatCount(partition.GetVertexCount()) + " vertices, objects have "
            + FormatCount(vertexCount) + "!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
    }

    uint32_t offset = 0u;
    for (Mesh* object : objects)
    {
        UVLayer* layer = object->FindUVLayer(GetAddressUVLayerName());
        if (layer == nullptr)
            layer = object->AddUVLayer(GetAddressUVLayerName());
        assert(layer != nullptr);

        const std::vector<uint32_t>& loops = object->GetLoopVertexIndices();
        layer->uvs.resize(loops.size());
        for (uint32_t loop = 0, sz = (uint32_t)loops.size(); loop < sz; ++loop)
        {
            layer->uvs[loop] = GroupPartitioner::GetAddressUV(partition, offset + loops[loop]);
        }
        offset += object->GetVertexCount();
    }
    return BakeStatus::Ok();
}

} // namespace vat
