#include "Mesh.hpp"

#include "Logging.hpp"

namespace vat
{

void Mesh::SetLoopVertexIndices(std::vector<uint32_t>&& loopVertexIndices)
{
    m_LoopVertexIndices = std::move(loopVertexIndices);
}

void Mesh::SetLoopVertexIndices(const std::vector<uint32_t>& loopVertexIndices)
{
    m_LoopVertexIndices = loopVertexIndices;
}

BakeStatus Mesh::ValidateLoops() const
{
    for (uint32_t vertexIndex : m_LoopVertexIndices)
    {
        if (vertexIndex >= m_VertexCount)
        {
            std::string message = "Mesh " + m_Name + " has a loop on vertex " + std::to_string(vertexIndex)
                + " but only " + FormatCount(m_VertexCount) + " vertices!";
            LOG_ERROR("%s", message.c_str());
            return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
        }
    }
    return BakeStatus::Ok();
}

void Mesh::SetVertexGroup(const std::string& name, std::vector<uint32_t>&& members)
{
    m_VertexGroups[name] = std::move(members);
}

const std::vector<uint32_t>* Mesh::FindVertexGroup(const std::string& name) const
{
    auto it = m_VertexGroups.find(name);
    return it != m_VertexGroups.end() ? &it->second : nullptr;
}

UVLayer* Mesh::GetUVLayer(uint32_t index)
{
    return index < m_UVLayers.size() ? &m_UVLayers[index] : nullptr;
}

const UVLayer* Mesh::GetUVLayer(uint32_t index) const
{
    return index < m_UVLayers.size() ? &m_UVLayers[index] : nullptr;
}

UVLayer* Mesh::FindUVLayer(const std::string& name)
{
    for (auto& layer : m_UVLayers)
    {
        if (layer.name == name)
            return &layer;
    }
    return nullptr;
}

const UVLayer* Mesh::FindUVLayer(const std::string& name) const
{
    for (const auto& layer : m_UVLayers)
    {
        if (layer.name == name)
            return &layer;
    }
    return nullptr;
}

UVLayer* Mesh::AddUVLayer(const std::string& name)
{
    if (m_UVLayers.size() >= kMaxUVLayers)
    {
        LOG_ERROR("Mesh %s already has %u UV layers, can't add %s", m_Name.c_str(), kMaxUVLayers, name.c_str());
        return nullptr;
    }

    UVLayer layer;
    layer.name = name;
    layer.uvs.resize(m_LoopVertexIndices.size(), simd_make_float2(0.0f, 0.0f));
    m_UVLayers.push_back(std::move(layer));
    return &m_UVLayers.back();
}

ColorAttribute* Mesh::GetColorAttribute(uint32_t index)
{
    return index < m_ColorAttributes.size() ? &m_ColorAttributes[index] : nullptr;
}

const ColorAttribute* Mesh::GetColorAttribute(uint32_t index) const
{
    return index < m_ColorAttributes.size() ? &m_ColorAttributes[index] : nullptr;
}

const ColorAttribute* Mesh::FindColorAttribute(const std::string& name) const
{
    for (const auto& attribute : m_ColorAttributes)
    {
        if (attribute.name == name)
            return &attribute;
    }
    return nullptr;
}

ColorAttribute* Mesh::AddColorAttribute(const std::string& name)
{
    ColorAttribute attribute;
    attribute.name = name;
    attribute.colors.resize(m_LoopVertexIndices.size(), simd_make_float4(1.0f, 1.0f, 1.0f, 1.0f));
    m_ColorAttributes.push_back(std::move(attribute));
    return &m_ColorAttributes.back();
}

} // namespace vat
