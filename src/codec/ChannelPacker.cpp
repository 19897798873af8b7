#include "ChannelPacker.hpp"

#include <cassert>
#include <cstdio>

#include "CoordinateTransform.hpp"
#include "Logging.hpp"
#include "Mesh.hpp"

namespace
{
    const char kAxisNames[3] = { 'X', 'Y', 'Z' };

    vat::ChannelAssignment MakeAssignment(uint32_t channel, uint32_t uvLayer, uint32_t layerPosition, vat::UVComponent component)
    {
        vat::ChannelAssignment assignment;
        assignment.shapeKeyOrdinal = channel / vat::ChannelPacker::kChannelsPerShapeKey + 1u;
        assignment.axis = channel % vat::ChannelPacker::kChannelsPerShapeKey;
        assignment.uvLayer = uvLayer;
        assignment.component = component;
        assignment.sign = vat::ChannelPacker::GetComponentSign(layerPosition, component);
        return assignment;
    }

    std::string GetChannelLabel(const vat::ChannelAssignment& assignment)
    {
        return std::to_string(assignment.shapeKeyOrdinal) + kAxisNames[assignment.axis];
    }

    std::string GetPaddingLayerName(uint32_t index)
    {
        if (index == 0)
            return "UVMap";
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "UVMap.%03u", index);
        return buffer;
    }
}

namespace vat
{

uint32_t ChannelPacker::GetLayersNeeded(uint32_t numShapeKeys)
{
    return (numShapeKeys * kChannelsPerShapeKey + 1u) / 2u;
}

float ChannelPacker::GetComponentSign(uint32_t layerPosition, UVComponent component)
{
    uint32_t channel = layerPosition * 2u + (component == UVComponent::V ? 1u : 0u);
    return (channel / 3u) % 2u == 0u ? 1.0f : -1.0f;
}

BakeStatus ChannelPacker::ValidateLayout(int32_t numShapeKeys, int32_t startLayer)
{
    if (numShapeKeys < 1 || numShapeKeys > (int32_t)kMaxShapeKeys)
    {
        std::string message = "Shape key count of " + std::to_string(numShapeKeys) + " is outside of 1 to "
            + std::to_string(kMaxShapeKeys) + "!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::CapacityError, message);
    }
    if (startLayer < 0 || startLayer >= (int32_t)kMaxUVLayers)
    {
        std::string message = "Start UV index of " + std::to_string(startLayer) + " is outside of 0 to "
            + std::to_string(kMaxUVLayers - 1) + "!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::CapacityError, message);
    }

    const uint32_t requiredLayers = (uint32_t)startLayer + GetLayersNeeded((uint32_t)numShapeKeys);
    if (requiredLayers > kMaxUVLayers)
    {
        std::string message = "Not enough UV layers to store the specified number of shape keys: "
            + std::to_string(requiredLayers) + " required, limit is " + std::to_string(kMaxUVLayers) + "!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::CapacityError, message);
    }
    return BakeStatus::Ok();
}

BakeStatus ChannelPacker::BuildLayout(int32_t numShapeKeys, int32_t startLayer, std::vector<PackedUVLayer>& outLayers)
{
    BakeStatus status = ValidateLayout(numShapeKeys, startLayer);
    if (!status)
        return status;

    const uint32_t channelCount = (uint32_t)numShapeKeys * kChannelsPerShapeKey;
    const uint32_t layersNeeded = GetLayersNeeded((uint32_t)numShapeKeys);

    std::vector<PackedUVLayer> layers(layersNeeded);
    for (uint32_t p = 0; p < layersNeeded; ++p)
    {
        PackedUVLayer& layer = layers[p];
        layer.uvLayer = (uint32_t)startLayer + p;

        const uint32_t uChannel = p * 2u;
        const uint32_t vChannel = p * 2u + 1u;
        layer.u = MakeAssignment(uChannel, layer.uvLayer, p, UVComponent::U);
        layer.hasV = vChannel < channelCount;
        if (layer.hasV)
        {
            layer.v = MakeAssignment(vChannel, layer.uvLayer, p, UVComponent::V);
            layer.name = "Morph " + GetChannelLabel(layer.u) + " " + GetChannelLabel(layer.v);
        }
        else
        {
            layer.name = "Morph " + GetChannelLabel(layer.u);
        }
    }

    outLayers = std::move(layers);
    return BakeStatus::Ok();
}

BakeStatus ChannelPacker::PackOffsets(Mesh& mesh, const std::vector<std::vector<simd::float3>>& keyDeltas, int32_t startLayer)
{
    std::vector<PackedUVLayer> layout;
    BakeStatus status = BuildLayout((int32_t)keyDeltas.size(), startLayer, layout);
    if (!status)
        return status;

    status = mesh.ValidateLoops();
    if (!status)
        return status;

    for (uint32_t k = 0, cnt = (uint32_t)keyDeltas.size(); k < cnt; ++k)
    {
        if (keyDeltas[k].size() != mesh.GetVertexCount())
        {
            std::string message = "Shape key " + std::to_string(k + 1) + " has " + FormatCount(keyDeltas[k].size())
                + " offsets, mesh " + mesh.GetName() + " has " + FormatCount(mesh.GetVertexCount()) + " vertices!";
            LOG_ERROR("%s", message.c_str());
            return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
        }
    }

    // layers below the packed range only have to exist
    const uint32_t firstPacked = (uint32_t)startLayer;
    for (uint32_t index = mesh.GetUVLayerCount(); index < firstPacked; ++index)
    {
        UVLayer* padding = mesh.AddUVLayer(GetPaddingLayerName(index));
        assert(padding != nullptr);
        (void)padding;
    }

    const std::vector<uint32_t>& loops = mesh.GetLoopVertexIndices();
    for (const PackedUVLayer& packed : layout)
    {
        UVLayer* layer = mesh.GetUVLayer(packed.uvLayer);
        if (layer == nullptr)
            layer = mesh.AddUVLayer(packed.name);
        assert(layer != nullptr);

        layer->name = packed.name;
        layer->uvs.resize(loops.size());
        for (uint32_t loop = 0, sz = (uint32_t)loops.size(); loop < sz; ++loop)
        {
            const uint32_t vertexIndex = loops[loop];
            const ChannelAssignment& u = packed.u;
            float uValue = keyDeltas[u.shapeKeyOrdinal - 1][vertexIndex][u.axis] * u.sign;
            float vValue = 0.0f;
            if (packed.hasV)
            {
                const ChannelAssignment& v = packed.v;
                vValue = keyDeltas[v.shapeKeyOrdinal - 1][vertexIndex][v.axis] * v.sign;
            }
            layer->uvs[loop] = simd_make_float2(uValue, kVBias + vValue);
        }
        LOG_DEBUG("packed UV layer %u: %s", packed.uvLayer, packed.name.c_str());
    }

    return BakeStatus::Ok();
}

BakeStatus ChannelPacker::PackNormals(Mesh& mesh, const std::vector<simd::float3>& normals)
{
    if (normals.size() != mesh.GetVertexCount())
    {
        std::string message = "Got " + FormatCount(normals.size()) + " normals for mesh " + mesh.GetName() + " with "
            + FormatCount(mesh.GetVertexCount()) + " vertices!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
    }

    BakeStatus status = mesh.ValidateLoops();
    if (!status)
        return status;

    ColorAttribute* attribute = mesh.GetColorAttribute(0);
    if (attribute == nullptr)
        attribute = mesh.AddColorAttribute(GetNormalAttributeName());
    attribute->name = GetNormalAttributeName();

    // Y flip of the source convention, no axis swap
    const CoordinateTransform transform = CoordinateTransform::SourceNative();
    const std::vector<uint32_t>& loops = mesh.GetLoopVertexIndices();
    attribute->colors.resize(loops.size());
    for (uint32_t loop = 0, sz = (uint32_t)loops.size(); loop < sz; ++loop)
    {
        attribute->colors[loop] = transform.EncodeNormal(normals[loops[loop]]);
    }

    return BakeStatus::Ok();
}

} // namespace vat
