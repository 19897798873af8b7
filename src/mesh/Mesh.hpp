#pragma once

#include <cstdint>
#include <vector>
#include <memory>
#include <string>
#include <unordered_map>

#include <simd/simd.h>

#include "BakeStatus.hpp"
#include "ShapeKeyData.hpp"

namespace vat
{

// Texcoord0..Texcoord7 of the vertex layout
constexpr uint32_t kMaxUVLayers = 8u;

// per loop (face corner) data
struct UVLayer
{
    std::string name;
    std::vector<simd::float2> uvs;
};

struct ColorAttribute
{
    std::string name;
    std::vector<simd::float4> colors;
};

// Host mesh as seen by the codec: topology is reduced to the loop -> vertex
// mapping, everything else is per-vertex or per-loop channel data.
class Mesh
{
public:
    explicit Mesh(const std::string& name) : m_Name(name) {}
    ~Mesh() = default;

    const std::string& GetName() const { return m_Name; }

    void SetVertexCount(uint32_t vertexCount) { m_VertexCount = vertexCount; }
    uint32_t GetVertexCount() const { return m_VertexCount; }

    void SetLoopVertexIndices(std::vector<uint32_t>&& loopVertexIndices);
    void SetLoopVertexIndices(const std::vector<uint32_t>& loopVertexIndices);
    const std::vector<uint32_t>& GetLoopVertexIndices() const { return m_LoopVertexIndices; }
    uint32_t GetLoopCount() const { return (uint32_t)m_LoopVertexIndices.size(); }
    // every loop must reference one of the mesh's vertices
    BakeStatus ValidateLoops() const;

    void SetModifiers(std::vector<std::string>&& modifiers) { m_Modifiers = std::move(modifiers); }
    void SetModifiers(const std::vector<std::string>& modifiers) { m_Modifiers = modifiers; }
    const std::vector<std::string>& GetModifiers() const { return m_Modifiers; }

    void SetVertexGroup(const std::string& name, std::vector<uint32_t>&& members);
    // nullptr when the mesh has no group of that name
    const std::vector<uint32_t>* FindVertexGroup(const std::string& name) const;

    void SetShapeKeyData(std::unique_ptr<ShapeKeyData>&& shapeKeyData) { m_ShapeKeyData = std::move(shapeKeyData); }
    const ShapeKeyData* GetShapeKeyData() const { return m_ShapeKeyData.get(); }
    uint32_t GetShapeKeyCount() const { return m_ShapeKeyData ? (uint32_t)m_ShapeKeyData->keys.size() : 0u; }

    uint32_t GetUVLayerCount() const { return (uint32_t)m_UVLayers.size(); }
    UVLayer* GetUVLayer(uint32_t index);
    const UVLayer* GetUVLayer(uint32_t index) const;
    UVLayer* FindUVLayer(const std::string& name);
    const UVLayer* FindUVLayer(const std::string& name) const;
    // returns nullptr once all kMaxUVLayers slots are taken
    UVLayer* AddUVLayer(const std::string& name);

    uint32_t GetColorAttributeCount() const { return (uint32_t)m_ColorAttributes.size(); }
    ColorAttribute* GetColorAttribute(uint32_t index);
    const ColorAttribute* GetColorAttribute(uint32_t index) const;
    const ColorAttribute* FindColorAttribute(const std::string& name) const;
    ColorAttribute* AddColorAttribute(const std::string& name);

private:
    std::string m_Name;
    uint32_t m_VertexCount { 0u };

    std::vector<uint32_t> m_LoopVertexIndices;
    std::vector<std::string> m_Modifiers;  // modifier type tags, e.g. "ARMATURE"
    std::unordered_map<std::string, std::vector<uint32_t>> m_VertexGroups;

    std::unique_ptr<ShapeKeyData> m_ShapeKeyData;

    std::vector<UVLayer> m_UVLayers;
    std::vector<ColorAttribute> m_ColorAttributes;
};

}
