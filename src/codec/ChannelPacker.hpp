#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <simd/simd.h>

#include "BakeStatus.hpp"

namespace vat
{

class Mesh;

enum class UVComponent : uint8_t
{
    U,
    V,
    Count
};

// Where one scalar of one shape key delta ends up.
struct ChannelAssignment
{
    uint32_t shapeKeyOrdinal { 0u };  // 1-based
    uint32_t axis { 0u };             // 0: X, 1: Y, 2: Z
    uint32_t uvLayer { 0u };          // absolute UV layer index
    UVComponent component { UVComponent::Count };
    float sign { 1.0f };
};

struct PackedUVLayer
{
    uint32_t uvLayer { 0u };
    std::string name;
    ChannelAssignment u;
    ChannelAssignment v;
    bool hasV { true };  // false on the trailing layer of an odd channel count
};

// Shape key offsets packed two channels per UV layer. The layer names, the
// V bias of 1 and the sign pattern are read back by a fixed shader decoder.
class ChannelPacker
{
public:
    static constexpr uint32_t kMaxShapeKeys = 4u;
    static constexpr uint32_t kChannelsPerShapeKey = 3u;
    static constexpr float kVBias = 1.0f;

    static uint32_t GetLayersNeeded(uint32_t numShapeKeys);

    // Sign of one component of the layer at position layerPosition inside the
    // packed range: -1 when (2p + component) div 3 is odd.
    static float GetComponentSign(uint32_t layerPosition, UVComponent component);

    // Key count in [1, kMaxShapeKeys], start in [0, kMaxUVLayers) and the
    // packed range ending at or before kMaxUVLayers.
    static BakeStatus ValidateLayout(int32_t numShapeKeys, int32_t startLayer);

    static BakeStatus BuildLayout(int32_t numShapeKeys, int32_t startLayer, std::vector<PackedUVLayer>& outLayers);

    // keyDeltas[k][v] is the already transformed offset of shape key k + 1 at vertex v.
    // Nothing is written on failure.
    static BakeStatus PackOffsets(Mesh& mesh, const std::vector<std::vector<simd::float3>>& keyDeltas, int32_t startLayer);

    // Writes per-vertex normals into the "normals" colour attribute.
    static BakeStatus PackNormals(Mesh& mesh, const std::vector<simd::float3>& normals);

    static const char* GetNormalAttributeName() { return "normals"; }
};

} // namespace vat
